#pragma once

/// @file sb/int.h
/// Fixed-width integer aliases used throughout StripBang.

#include <stddef.h>
#include <stdint.h>

namespace sb {

typedef uint8_t u8;
typedef uint32_t u32;

} // namespace sb
