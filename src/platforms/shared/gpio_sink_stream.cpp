#include "platforms/shared/gpio_sink_stream.h"

#include "sb/hex.h"

namespace sb {

StreamGpioSink::StreamGpioSink(std::ostream& out, const char* name)
    : mOut(out), mName(name), mWriteCount(0), mLineOpen(false) {}

Status StreamGpioSink::write(GpioLevel level) {
    if (mLineOpen) {
        mOut << ", ";
    }
    mOut << toHexLevel(level);
    if (!mOut) {
        return Status::failure(ResultError::IO_ERROR, "output stream failed");
    }
    mLineOpen = true;
    ++mWriteCount;
    return Status::success();
}

Status StreamGpioSink::endLine() {
    if (!mLineOpen) {
        return Status::success();
    }
    mOut << '\n';
    mOut.flush();
    mLineOpen = false;
    if (!mOut) {
        return Status::failure(ResultError::IO_ERROR, "output stream failed");
    }
    return Status::success();
}

} // namespace sb
