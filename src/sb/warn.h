#pragma once

#include "sb/dbg.h"

#ifndef SB_WARN
#define SB_WARN(X)                                                             \
    do {                                                                       \
        std::ostringstream _sb_warn_ss;                                        \
        _sb_warn_ss << "WARN: " << sb::file_offset(__FILE__) << "("            \
                    << int(__LINE__) << "): " << X;                            \
        sb::println(_sb_warn_ss.str().c_str());                                \
    } while (0)
#define SB_WARN_IF(COND, MSG) do { if (COND) SB_WARN(MSG); } while (0)
#endif

#ifndef SB_ERROR
#define SB_ERROR(X)                                                            \
    do {                                                                       \
        std::ostringstream _sb_err_ss;                                         \
        _sb_err_ss << "ERROR: " << X;                                          \
        sb::println(_sb_err_ss.str().c_str());                                 \
    } while (0)
#define SB_ERROR_IF(COND, MSG) do { if (COND) SB_ERROR(MSG); } while (0)
#endif
