#pragma once

/// @file sb/hex.h
/// Hex formatting for payload and level dumps.

#include <string>
#include <vector>

#include "sb/int.h"

namespace sb {

/// "00 ff 1a" style dump, two lowercase digits per byte, space separated.
std::string toHex(const u8* data, size_t size);
std::string toHex(const std::vector<u8>& bytes);

/// "0x5" style rendering of a single GPIO level.
std::string toHexLevel(u32 level);

} // namespace sb
