#include "sb/led_string.h"

#include <sstream>

#include "sb/bitbang.h"
#include "sb/hex.h"
#include "sb/log.h"

namespace sb {

/// Holds auto-update off for the lifetime of the scope and restores the
/// previous mode afterwards.
class LedString::ManualModeScope {
public:
    explicit ManualModeScope(LedString* strip)
        : mStrip(strip), mWasAuto(strip->mAutoUpdate) {
        mStrip->mAutoUpdate = false;
    }
    ~ManualModeScope() { mStrip->mAutoUpdate = mWasAuto; }

    bool wasAuto() const { return mWasAuto; }

private:
    LedString* mStrip;
    bool mWasAuto;
};

Status LedStringConfig::validate() const {
    if (policy != ChannelPolicy::kStrict) {
        return Status::success();
    }
    if (!LEDFrame::brightnessInRange(brightness)) {
        std::ostringstream msg;
        msg << "initial brightness " << brightness << " outside 0-"
            << LEDFrame::kMaxBrightness;
        return Status::failure(ResultError::OUT_OF_RANGE, msg.str());
    }
    const int channels[] = {red, green, blue};
    const char* names[] = {"red", "green", "blue"};
    for (int i = 0; i < 3; ++i) {
        if (!LEDFrame::channelInRange(channels[i])) {
            std::ostringstream msg;
            msg << "initial " << names[i] << " " << channels[i]
                << " outside 0-" << LEDFrame::kMaxChannel;
            return Status::failure(ResultError::OUT_OF_RANGE, msg.str());
        }
    }
    return Status::success();
}

LedString::LedString(const LedStringConfig& config, GpioSink* sink)
    : mLines(config.lines),
      mPolicy(config.policy),
      mSink(sink),
      mAutoUpdate(config.lines.isSet()),
      mTransmissions(0),
      mLink(this) {
    Status valid = config.validate();
    SB_WARN_IF(!valid.ok(), "initial values masked into range: " << valid.message());
    SB_WARN_IF(mLines.isSet() && !mLines.isValid(),
               "unusable gpio lines: clock=" << mLines.clock << " data="
               << mLines.data << "; every push will fail");

    mLeds.reserve(config.num_leds);
    for (size_t i = 0; i < config.num_leds; ++i) {
        mLeds.emplace_back(i, config.brightness, config.red, config.green,
                           config.blue, config.policy);
    }
    for (size_t i = 0; i < mLeds.size(); ++i) {
        mLeds[i].attach(&mLink);
    }
}

LedString::~LedString() {
    for (size_t i = 0; i < mLeds.size(); ++i) {
        mLeds[i].detach();
    }
}

std::vector<u8> LedString::payload() const {
    std::vector<u8> out;
    out.reserve(Frame::kLength * (mLeds.size() + 2));
    mStart.appendTo(&out);
    for (size_t i = 0; i < mLeds.size(); ++i) {
        mLeds[i].appendTo(&out);
    }
    mEnd.appendTo(&out);
    return out;
}

Status LedString::Link::onLedUpdated(const LEDFrame& led) {
    const Led* own = mStrip->findLed(led);
    if (!own) {
        SB_WARN("ignoring update from a frame outside the string");
        return Status::success();
    }
    return mStrip->onLedUpdated(*own);
}

const Led* LedString::findLed(const LEDFrame& frame) const {
    for (size_t i = 0; i < mLeds.size(); ++i) {
        if (static_cast<const LEDFrame*>(&mLeds[i]) == &frame) {
            return &mLeds[i];
        }
    }
    return nullptr;
}

Status LedString::onLedUpdated(const Led& led) {
    SB_LOG_LED("led " << led.id() << " now " << led.rgb().toString()
                      << " brightness " << int(led.brightness()));
    if (!mAutoUpdate) {
        return Status::success();
    }
    return update();
}

Status LedString::pushIfAuto(bool wasAuto) {
    if (!wasAuto) {
        return Status::success();
    }
    return update();
}

Status LedString::setAll(int intensity) {
    if (mPolicy == ChannelPolicy::kStrict && !LEDFrame::channelInRange(intensity)) {
        std::ostringstream msg;
        msg << "intensity " << intensity << " outside 0-" << LEDFrame::kMaxChannel;
        SB_WARN(msg.str());
        return Status::failure(ResultError::OUT_OF_RANGE, msg.str());
    }

    bool wasAuto;
    {
        ManualModeScope manual(this);
        wasAuto = manual.wasAuto();
        for (size_t i = 0; i < mLeds.size(); ++i) {
            Status status = mLeds[i].setAll(intensity);
            if (!status.ok()) {
                return status;
            }
        }
    }
    return pushIfAuto(wasAuto);
}

Status LedString::setAllBrightness(int value) {
    if (mPolicy == ChannelPolicy::kStrict && !LEDFrame::brightnessInRange(value)) {
        std::ostringstream msg;
        msg << "brightness " << value << " outside 0-" << LEDFrame::kMaxBrightness;
        SB_WARN(msg.str());
        return Status::failure(ResultError::OUT_OF_RANGE, msg.str());
    }

    bool wasAuto;
    {
        ManualModeScope manual(this);
        wasAuto = manual.wasAuto();
        for (size_t i = 0; i < mLeds.size(); ++i) {
            Status status = mLeds[i].setBrightness(value);
            if (!status.ok()) {
                return status;
            }
        }
    }
    return pushIfAuto(wasAuto);
}

Status LedString::shiftRight(const Rgb& color) {
    // Snapshot first: every LED is overwritten before it would be read.
    std::vector<Rgb> desired;
    desired.reserve(mLeds.size() + 1);
    desired.push_back(color);
    for (size_t i = 0; i < mLeds.size(); ++i) {
        desired.push_back(mLeds[i].rgb());
    }

    bool wasAuto;
    {
        ManualModeScope manual(this);
        wasAuto = manual.wasAuto();
        for (size_t i = 0; i < mLeds.size(); ++i) {
            Status status = mLeds[i].setRgb(desired[i]);
            if (!status.ok()) {
                return status;
            }
        }
    }
    return pushIfAuto(wasAuto);
}

Status LedString::shiftLeft(const Rgb& color) {
    bool wasAuto;
    {
        ManualModeScope manual(this);
        wasAuto = manual.wasAuto();
        for (size_t i = 1; i < mLeds.size(); ++i) {
            Status status = mLeds[i - 1].setRgb(mLeds[i].rgb());
            if (!status.ok()) {
                return status;
            }
        }
        if (!mLeds.empty()) {
            Status status = mLeds.back().setRgb(color);
            if (!status.ok()) {
                return status;
            }
        }
    }
    return pushIfAuto(wasAuto);
}

Status LedString::update() {
    return update(mLines.clock, mLines.data);
}

Status LedString::update(int clockLine, int dataLine) {
    const GpioLines lines(clockLine, dataLine);
    if (!lines.isSet()) {
        return Status::success();
    }
    if (!mSink) {
        SB_WARN("update requested on lines " << clockLine << "/" << dataLine
                << " but no gpio sink is attached");
        return Status::failure(ResultError::NOT_INITIALIZED,
                               "no gpio sink attached");
    }

    const std::vector<u8> bytes = payload();
    Result<GpioLevels> encoded = encodeBitBang(bytes, lines);
    if (!encoded.ok()) {
        return Status::failure(encoded);
    }
    const GpioLevels& levels = encoded.value();

    SB_LOG_GPIO("payload " << toHex(bytes));
    SB_LOG_GPIO(levels.size() << " levels to " << mSink->getName());

    for (size_t i = 0; i < levels.size(); ++i) {
        Status written = mSink->write(levels[i]);
        if (!written.ok()) {
            std::ostringstream msg;
            msg << "gpio write " << i << "/" << levels.size() << " to "
                << mSink->getName() << " failed: " << written.message();
            SB_WARN(msg.str());
            return Status::failure(ResultError::IO_ERROR, msg.str());
        }
    }
    ++mTransmissions;
    return Status::success();
}

} // namespace sb
