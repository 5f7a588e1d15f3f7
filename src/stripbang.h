#ifndef __INC_STRIPBANG_H
#define __INC_STRIPBANG_H

/// @file stripbang.h
/// StripBang header to include in user code: APA102C / SK9822 strips driven
/// by bit-banging a clock and a data line on any digital output port.

#define STRIPBANG_VERSION 10000
#define STRIPBANG_VERSION_MAJOR 1
#define STRIPBANG_VERSION_MINOR 0
#define STRIPBANG_VERSION_PATCH 0

#include "sb/config.h"
#include "sb/result.h"
#include "sb/rgb.h"
#include "sb/frame.h"
#include "sb/led_frame.h"
#include "sb/gpio_types.h"
#include "sb/gpio_sink.h"
#include "sb/bitbang.h"
#include "sb/led_string.h"
#include "sb/hex.h"
#include "sb/log.h"

#include "platforms/shared/gpio_sink_stream.h"

#endif
