/// @file gpio_sink_stub.cpp
/// @brief Capturing GpioSink implementation for testing

#ifdef STRIPBANG_TESTING

#include "platforms/stub/gpio_sink_stub.h"

namespace sb {

GpioSinkStub::GpioSinkStub(const char* name)
    : mName(name), mAttempts(0), mFailArmed(false), mFailIndex(0) {}

Status GpioSinkStub::write(GpioLevel level) {
    const size_t attempt = mAttempts++;
    if (mFailArmed && attempt == mFailIndex) {
        return Status::failure(ResultError::IO_ERROR, "injected write failure");
    }
    mLevels.push_back(level);
    return Status::success();
}

std::vector<u8> GpioSinkStub::decodeBytes(const GpioLines& lines) const {
    std::vector<u8> out;
    if (!lines.isValid()) {
        return out;
    }
    const GpioLevel clockMask = lines.clockMask();
    const GpioLevel dataMask = lines.dataMask();

    bool clockHigh = false;
    u8 current = 0;
    int bits = 0;
    for (size_t i = 0; i < mLevels.size(); ++i) {
        const bool high = (mLevels[i] & clockMask) != 0;
        if (high && !clockHigh) {
            current = static_cast<u8>((current << 1) | ((mLevels[i] & dataMask) ? 1 : 0));
            if (++bits == 8) {
                out.push_back(current);
                current = 0;
                bits = 0;
            }
        }
        clockHigh = high;
    }
    return out;
}

void GpioSinkStub::failAtWrite(size_t index) {
    mFailArmed = true;
    mFailIndex = index;
}

void GpioSinkStub::reset() {
    mLevels.clear();
    mAttempts = 0;
    mFailArmed = false;
    mFailIndex = 0;
}

} // namespace sb

#endif // STRIPBANG_TESTING
