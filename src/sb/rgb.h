#pragma once

/// @file sb/rgb.h
/// Plain 8-bit red, green, blue triple as carried by one LED frame.

#include <string>

#include "sb/int.h"

namespace sb {

/// Representation of an 8-bit RGB pixel (Red, Green, Blue)
struct Rgb {
    u8 r;  ///< Red channel value
    u8 g;  ///< Green channel value
    u8 b;  ///< Blue channel value

    Rgb() : r(0), g(0), b(0) {}
    Rgb(u8 ir, u8 ig, u8 ib) : r(ir), g(ig), b(ib) {}

    /// "(r,g,b)" in decimal, used by diagnostics and test output
    std::string toString() const;
};

inline bool operator==(const Rgb& lhs, const Rgb& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

inline bool operator!=(const Rgb& lhs, const Rgb& rhs) {
    return !(lhs == rhs);
}

} // namespace sb
