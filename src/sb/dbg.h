#pragma once

#include <sstream>

#include "sb/int.h"

// Forward declaration so that logging does not drag in sb/io.h everywhere.
#ifndef SB_DBG_PRINTLN_DECLARED
#define SB_DBG_PRINTLN_DECLARED
namespace sb {
    void println(const char* str);
}
#endif

namespace sb {
// ".build/src/sb/dbg.h" -> "src/sb/dbg.h"
// "blah/blah/blah.h" -> "blah.h"
inline const char *file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p;
        }
        if (*p == '/') {
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace sb

#if !defined(NDEBUG) || defined(STRIPBANG_TESTING)
#define STRIPBANG_FORCE_DBG 1
#endif

#ifndef STRIPBANG_FORCE_DBG
#define STRIPBANG_HAS_DBG 0
#define _STRIPBANG_DBG(X) do { if (false) { sb::println(""); } } while(0)
#else
#define STRIPBANG_HAS_DBG 1
#define _STRIPBANG_DBG(X)                                                      \
    do {                                                                       \
        std::ostringstream _sb_dbg_ss;                                         \
        _sb_dbg_ss << sb::file_offset(__FILE__) << "(" << int(__LINE__)        \
                   << "): " << X;                                              \
        sb::println(_sb_dbg_ss.str().c_str());                                 \
    } while (0)
#endif

#define SB_DBG(X) _STRIPBANG_DBG(X)

#ifndef SB_DBG_IF
#define SB_DBG_IF(COND, MSG)                                                   \
    do { if (COND) SB_DBG(MSG); } while (0)
#endif

// Swallows a stream expression without evaluating it.
#define SB_DBG_NO_OP(X) do { if (false) { std::ostringstream _sb_nop; _sb_nop << X; } } while (0)
