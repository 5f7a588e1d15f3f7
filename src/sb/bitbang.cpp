#include "sb/bitbang.h"

#include <sstream>

#include "sb/log.h"

namespace sb {

namespace {

template <int BIT>
inline void writeBit(u8 b, GpioLevel clockMask, GpioLevel dataMask,
                     GpioLevels* out) {
    const GpioLevel clockLow = (b & (1 << BIT)) ? dataMask : 0;
    out->push_back(clockLow);
    out->push_back(clockLow | clockMask);
}

} // namespace

void appendBitBangByte(u8 b, GpioLevel clockMask, GpioLevel dataMask,
                       GpioLevels* out) {
    writeBit<7>(b, clockMask, dataMask, out);
    writeBit<6>(b, clockMask, dataMask, out);
    writeBit<5>(b, clockMask, dataMask, out);
    writeBit<4>(b, clockMask, dataMask, out);
    writeBit<3>(b, clockMask, dataMask, out);
    writeBit<2>(b, clockMask, dataMask, out);
    writeBit<1>(b, clockMask, dataMask, out);
    writeBit<0>(b, clockMask, dataMask, out);
}

Result<GpioLevels> encodeBitBang(const u8* data, size_t size,
                                 const GpioLines& lines) {
    if (!lines.isValid()) {
        std::ostringstream msg;
        msg << "unusable gpio lines: clock=" << lines.clock
            << " data=" << lines.data;
        SB_WARN(msg.str());
        return Result<GpioLevels>::failure(ResultError::INVALID_ARGUMENT,
                                           msg.str());
    }

    const GpioLevel clockMask = lines.clockMask();
    const GpioLevel dataMask = lines.dataMask();

    GpioLevels levels;
    levels.reserve(bitBangLevelCount(size));
    for (size_t i = 0; i < size; ++i) {
        appendBitBangByte(data[i], clockMask, dataMask, &levels);
    }
    return Result<GpioLevels>::success(std::move(levels));
}

Result<GpioLevels> encodeBitBang(const std::vector<u8>& bytes,
                                 const GpioLines& lines) {
    return encodeBitBang(bytes.data(), bytes.size(), lines);
}

} // namespace sb
