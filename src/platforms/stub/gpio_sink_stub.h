/// @file gpio_sink_stub.h
/// @brief Capturing GpioSink for testing
///
/// Records every level it is given so tests can inspect the exact sequence,
/// and can be armed to fail a chosen write to exercise error paths.

#pragma once

#include "sb/gpio_sink.h"
#include "sb/int.h"

#ifdef STRIPBANG_TESTING

namespace sb {

class GpioSinkStub : public GpioSink {
public:
    explicit GpioSinkStub(const char* name = "MockGPIO");
    ~GpioSinkStub() override = default;

    Status write(GpioLevel level) override;
    const char* getName() const override { return mName; }

    // Test inspection methods
    const GpioLevels& getLevels() const { return mLevels; }
    size_t getWriteCount() const { return mLevels.size(); }

    /// Sample the data line on every clock rising edge and pack the bits,
    /// MSB first, back into bytes. Trailing bits short of a byte are dropped.
    std::vector<u8> decodeBytes(const GpioLines& lines) const;

    /// Make the write with zero-based index @p index (counted over the
    /// stub's whole life, see getAttemptCount()) fail with IO_ERROR.
    void failAtWrite(size_t index);
    size_t getAttemptCount() const { return mAttempts; }

    /// Forget captured levels; keeps the failure arming.
    void clear() { mLevels.clear(); }
    void reset();

private:
    const char* mName;
    GpioLevels mLevels;
    size_t mAttempts;
    bool mFailArmed;
    size_t mFailIndex;
};

} // namespace sb

#endif // STRIPBANG_TESTING
