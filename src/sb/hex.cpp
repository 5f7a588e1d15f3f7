#include "sb/hex.h"

namespace sb {

namespace {
const char kDigits[] = "0123456789abcdef";
} // namespace

std::string toHex(const u8* data, size_t size) {
    std::string out;
    if (size == 0) {
        return out;
    }
    out.reserve(size * 3 - 1);
    for (size_t i = 0; i < size; ++i) {
        if (i) {
            out += ' ';
        }
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

std::string toHex(const std::vector<u8>& bytes) {
    return toHex(bytes.data(), bytes.size());
}

std::string toHexLevel(u32 level) {
    char buf[11];
    int pos = sizeof(buf) - 1;
    buf[pos] = '\0';
    do {
        buf[--pos] = kDigits[level & 0x0F];
        level >>= 4;
    } while (level);
    return std::string("0x") + &buf[pos];
}

} // namespace sb
