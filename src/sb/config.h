#ifndef __INC_STRIPBANG_CONFIG_H
#define __INC_STRIPBANG_CONFIG_H

/// @file sb/config.h
/// Definitions that can be used to configure StripBang at compile time.
/// Each option may be overridden on the compiler command line.

// Brightness (0-31) given to every LED of a newly constructed string when the
// caller does not pick one.
#ifndef STRIPBANG_DEFAULT_BRIGHTNESS
#define STRIPBANG_DEFAULT_BRIGHTNESS 31
#endif

// Set to 1 to make new strings reject out-of-range channel values instead of
// masking them down to the channel width.
#ifndef STRIPBANG_STRICT_CHANNELS
#define STRIPBANG_STRICT_CHANNELS 0
#endif

// Log every GPIO transmission (payload dump, level count) through SB_LOG_GPIO.
// #define STRIPBANG_LOG_GPIO_ENABLED

// Log LED change notifications through SB_LOG_LED.
// #define STRIPBANG_LOG_LED_ENABLED

#endif
