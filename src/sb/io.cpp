#include "sb/io.h"

#include <stdio.h>

namespace sb {

#ifdef STRIPBANG_TESTING
// Lazily constructed so that no global constructor runs before main().
static println_handler_t& get_println_handler() {
    static println_handler_t handler;
    return handler;
}
#endif

void println(const char* str) {
    if (!str) return;

#ifdef STRIPBANG_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif

    fputs(str, stdout);
    fputc('\n', stdout);
    fflush(stdout);
}

#ifdef STRIPBANG_TESTING

void inject_println_handler(const println_handler_t& handler) {
    get_println_handler() = handler;
}

void clear_io_handlers() {
    get_println_handler() = println_handler_t();
}

#endif // STRIPBANG_TESTING

} // namespace sb
