#pragma once

/// @file sb/gpio_types.h
/// Shared vocabulary between the bit-bang encoder and GPIO sinks.

#include <vector>

#include "sb/int.h"

namespace sb {

/// Output state of a whole digital port; bit n drives GPIO line n.
typedef u32 GpioLevel;
typedef std::vector<GpioLevel> GpioLevels;

/// Number of addressable lines in a GpioLevel.
constexpr int kGpioLineCount = 32;

/// Clock and data line numbers of a two-wire bus (-1 = not set).
struct GpioLines {
    int clock;
    int data;

    GpioLines() : clock(-1), data(-1) {}
    GpioLines(int clock_line, int data_line) : clock(clock_line), data(data_line) {}

    /// Both lines assigned.
    bool isSet() const { return clock >= 0 && data >= 0; }

    /// Both lines assigned, distinct, and addressable in a GpioLevel.
    bool isValid() const {
        return isSet() && clock < kGpioLineCount && data < kGpioLineCount &&
               clock != data;
    }

    GpioLevel clockMask() const { return GpioLevel(1) << clock; }
    GpioLevel dataMask() const { return GpioLevel(1) << data; }
};

inline bool operator==(const GpioLines& lhs, const GpioLines& rhs) {
    return lhs.clock == rhs.clock && lhs.data == rhs.data;
}

} // namespace sb
