#include "sb/led_frame.h"

#include <sstream>

#include "sb/log.h"

namespace sb {

constexpr u8 LEDFrame::kBrightnessMarker;
constexpr u8 LEDFrame::kBrightnessBits;
constexpr int LEDFrame::kMaxBrightness;
constexpr int LEDFrame::kMaxChannel;

const char* toString(ChannelPolicy policy) {
    switch (policy) {
        case ChannelPolicy::kTruncate:
            return "truncate";
        case ChannelPolicy::kStrict:
            return "strict";
    }
    return "unknown";
}

LEDFrame::LEDFrame(int brightness, int red, int green, int blue,
                   ChannelPolicy policy)
    : mPolicy(policy), mObserver(nullptr) {
    mBytes[kBrightnessIndex] = encodeBrightness(brightness);
    mBytes[kRedIndex] = maskChannel(red);
    mBytes[kGreenIndex] = maskChannel(green);
    mBytes[kBlueIndex] = maskChannel(blue);
}

LEDFrame::LEDFrame(const LEDFrame& other)
    : Frame(other), mPolicy(other.mPolicy), mObserver(nullptr) {}

Status LEDFrame::checkChannel(int value, const char* what) const {
    if (mPolicy == ChannelPolicy::kStrict && !channelInRange(value)) {
        std::ostringstream msg;
        msg << what << " " << value << " outside 0-" << kMaxChannel;
        SB_WARN(msg.str());
        return Status::failure(ResultError::OUT_OF_RANGE, msg.str());
    }
    return Status::success();
}

Status LEDFrame::checkBrightness(int value) const {
    if (mPolicy == ChannelPolicy::kStrict && !brightnessInRange(value)) {
        std::ostringstream msg;
        msg << "brightness " << value << " outside 0-" << kMaxBrightness;
        SB_WARN(msg.str());
        return Status::failure(ResultError::OUT_OF_RANGE, msg.str());
    }
    return Status::success();
}

Status LEDFrame::notify() {
    if (!mObserver) {
        return Status::success();
    }
    return mObserver->onLedUpdated(*this);
}

Status LEDFrame::setChannel(ByteIndex index, int value, const char* what) {
    Status status = checkChannel(value, what);
    if (!status.ok()) {
        return status;
    }
    mBytes[index] = maskChannel(value);
    return notify();
}

Status LEDFrame::setBrightness(int value) {
    Status status = checkBrightness(value);
    if (!status.ok()) {
        return status;
    }
    mBytes[kBrightnessIndex] = encodeBrightness(value);
    return notify();
}

Status LEDFrame::setRed(int value) {
    return setChannel(kRedIndex, value, "red");
}

Status LEDFrame::setGreen(int value) {
    return setChannel(kGreenIndex, value, "green");
}

Status LEDFrame::setBlue(int value) {
    return setChannel(kBlueIndex, value, "blue");
}

Status LEDFrame::setRgb(int red, int green, int blue) {
    Status status = checkChannel(red, "red");
    if (status.ok()) status = checkChannel(green, "green");
    if (status.ok()) status = checkChannel(blue, "blue");
    if (!status.ok()) {
        return status;
    }

    // Silence the per-channel notifications; one goes out at the end.
    LedObserver* owner = mObserver;
    mObserver = nullptr;
    Status stored = setRed(red);
    if (stored.ok()) stored = setGreen(green);
    if (stored.ok()) stored = setBlue(blue);
    mObserver = owner;
    if (!stored.ok()) {
        return stored;
    }
    return notify();
}

Status LEDFrame::setRgb(const Rgb& color) {
    return setRgb(color.r, color.g, color.b);
}

Status LEDFrame::setAll(int value) {
    return setRgb(value, value, value);
}

} // namespace sb
