#include "sb/frame.h"

#include <string.h>

namespace sb {

constexpr size_t Frame::kLength;

Frame::Frame() {
    memset(mBytes, 0, sizeof(mBytes));
}

std::vector<u8> Frame::payload() const {
    return std::vector<u8>(mBytes, mBytes + kLength);
}

void Frame::appendTo(std::vector<u8>* out) const {
    out->insert(out->end(), mBytes, mBytes + kLength);
}

} // namespace sb
