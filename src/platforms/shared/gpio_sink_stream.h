#pragma once

/// @file platforms/shared/gpio_sink_stream.h
/// @brief GpioSink that renders levels as text
///
/// Every level becomes a "0x.." token, separated by ", ". Handy for feeding a
/// port driven by another process, or for eyeballing a transmission next to
/// a logic analyzer capture.

#include <ostream>

#include "sb/gpio_sink.h"

namespace sb {

class StreamGpioSink : public GpioSink {
public:
    explicit StreamGpioSink(std::ostream& out, const char* name = "stream");
    ~StreamGpioSink() override = default;

    Status write(GpioLevel level) override;
    const char* getName() const override { return mName; }

    /// Terminate the current line of tokens; the next write starts a new one.
    Status endLine();

    size_t getWriteCount() const { return mWriteCount; }

private:
    std::ostream& mOut;
    const char* mName;
    size_t mWriteCount;
    bool mLineOpen;
};

} // namespace sb
