#pragma once

/// @file sb/bitbang.h
/// Software two-wire (clock + data) serialization, aka bit-banging.
///
/// Each bit of the input becomes two GPIO levels, most significant bit first:
///   1. data line = bit value, clock line low
///   2. same data line, clock line high (rising edge latches the bit)
/// The falling edge is provided by the first level of the following bit, so
/// the levels must reach the port back to back, in order, with nothing else
/// written in between.

#include <vector>

#include "sb/gpio_types.h"
#include "sb/int.h"
#include "sb/result.h"

namespace sb {

/// Number of levels produced for @p byteCount bytes.
inline size_t bitBangLevelCount(size_t byteCount) { return byteCount * 16; }

/// Append the sixteen levels encoding @p b to @p out.
void appendBitBangByte(u8 b, GpioLevel clockMask, GpioLevel dataMask,
                       GpioLevels* out);

/// Expand @p size bytes into the level sequence for @p lines.
/// Fails with INVALID_ARGUMENT if the lines are unset, equal, or outside the
/// range a GpioLevel can address.
Result<GpioLevels> encodeBitBang(const u8* data, size_t size,
                                 const GpioLines& lines);
Result<GpioLevels> encodeBitBang(const std::vector<u8>& bytes,
                                 const GpioLines& lines);

} // namespace sb
