#pragma once

/// @file sb/io.h
/// Low-level text output used by the logging macros.

#ifdef STRIPBANG_TESTING
#include <functional>
#endif

namespace sb {

// Print a string with newline
#ifndef SB_DBG_PRINTLN_DECLARED
void println(const char* str);
#endif

#ifdef STRIPBANG_TESTING

using println_handler_t = std::function<void(const char*)>;

// Inject a println handler for testing
void inject_println_handler(const println_handler_t& handler);

// Clear the injected handler (restores default behavior)
void clear_io_handlers();

#endif // STRIPBANG_TESTING

} // namespace sb
