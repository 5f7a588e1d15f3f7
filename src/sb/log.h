#pragma once

/// @file sb/log.h
/// @brief Logging categories for StripBang subsystems
///
/// Each category is compiled out unless STRIPBANG_LOG_<CATEGORY>_ENABLED is
/// defined before this header is included (see sb/config.h).
///
/// Example:
///   #define STRIPBANG_LOG_GPIO_ENABLED
///   #include "sb/log.h"
///
///   SB_LOG_GPIO("writing " << count << " levels");

#include "sb/config.h"
#include "sb/dbg.h"
#include "sb/warn.h"

/// @brief GPIO sink logging
/// Logs payload dumps and level counts for every transmission
#ifdef STRIPBANG_LOG_GPIO_ENABLED
    #define SB_LOG_GPIO(X) SB_WARN(X)
#else
    #define SB_LOG_GPIO(X) SB_DBG_NO_OP(X)
#endif

/// @brief LED model logging
/// Logs change notifications coming from individual LEDs
#ifdef STRIPBANG_LOG_LED_ENABLED
    #define SB_LOG_LED(X) SB_WARN(X)
#else
    #define SB_LOG_LED(X) SB_DBG_NO_OP(X)
#endif
