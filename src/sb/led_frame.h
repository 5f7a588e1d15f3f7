#pragma once

/// @file sb/led_frame.h
/// Per-LED frame of an APA102C / SK9822 strip.
///
/// Wire layout of one LED frame:
///   [111BBBBB][blue][green][red]
/// The top three bits of the first byte are a fixed marker; the low five bits
/// carry the global brightness (0-31).

#include "sb/config.h"
#include "sb/frame.h"
#include "sb/int.h"
#include "sb/result.h"
#include "sb/rgb.h"

namespace sb {

class LEDFrame;

/// How channel setters treat values that do not fit the channel.
enum class ChannelPolicy : u8 {
    kTruncate,  ///< Mask the value down to the channel width; never fails
    kStrict     ///< Reject with OUT_OF_RANGE and leave the frame untouched
};

/// Policy used when none is given, see STRIPBANG_STRICT_CHANNELS.
inline ChannelPolicy defaultChannelPolicy() {
    return STRIPBANG_STRICT_CHANNELS ? ChannelPolicy::kStrict
                                     : ChannelPolicy::kTruncate;
}

const char* toString(ChannelPolicy policy);

/// Receives change notifications from LED frames. Implemented by the
/// aggregate owning the frames; the frames never own their observer.
class LedObserver {
public:
    virtual ~LedObserver() = default;

    /// Called once after every logical change to @p led.
    virtual Status onLedUpdated(const LEDFrame& led) = 0;
};

class LEDFrame : public Frame {
public:
    /// Byte positions inside the frame, in wire order.
    enum ByteIndex {
        kBrightnessIndex = 0,
        kBlueIndex = 1,
        kGreenIndex = 2,
        kRedIndex = 3
    };

    static constexpr u8 kBrightnessMarker = 0xE0;
    static constexpr u8 kBrightnessBits = 0x1F;
    static constexpr int kMaxBrightness = 31;
    static constexpr int kMaxChannel = 255;

    /// Initial values are always masked into range, whatever the policy.
    LEDFrame(int brightness = STRIPBANG_DEFAULT_BRIGHTNESS, int red = 0,
             int green = 0, int blue = 0,
             ChannelPolicy policy = defaultChannelPolicy());

    /// Copies carry the bytes and policy but start detached from any observer.
    LEDFrame(const LEDFrame& other);
    LEDFrame& operator=(const LEDFrame&) = delete;

    u8 brightness() const { return mBytes[kBrightnessIndex] & kBrightnessBits; }
    u8 red() const { return mBytes[kRedIndex]; }
    u8 green() const { return mBytes[kGreenIndex]; }
    u8 blue() const { return mBytes[kBlueIndex]; }
    Rgb rgb() const { return Rgb(red(), green(), blue()); }

    /// Raw first byte, marker bits included.
    u8 brightnessByte() const { return mBytes[kBrightnessIndex]; }

    Status setBrightness(int value);
    Status setRed(int value);
    Status setGreen(int value);
    Status setBlue(int value);

    /// Writes all three channels as one change: the observer hears about it
    /// once, after the last channel is stored.
    Status setRgb(int red, int green, int blue);
    Status setRgb(const Rgb& color);

    /// Same value on red, green and blue, as one change.
    Status setAll(int value);

    ChannelPolicy policy() const { return mPolicy; }
    void setPolicy(ChannelPolicy policy) { mPolicy = policy; }

    void attach(LedObserver* observer) { mObserver = observer; }
    void detach() { mObserver = nullptr; }
    LedObserver* observer() const { return mObserver; }

    /// Brightness byte for @p value: low five bits of the value under the
    /// 111 marker. Bits above the fifth never reach the marker field.
    static u8 encodeBrightness(int value) {
        return static_cast<u8>(kBrightnessMarker | (value & kBrightnessBits));
    }
    static u8 maskChannel(int value) { return static_cast<u8>(value & 0xFF); }

    static bool brightnessInRange(int value) {
        return value >= 0 && value <= kMaxBrightness;
    }
    static bool channelInRange(int value) {
        return value >= 0 && value <= kMaxChannel;
    }

protected:
    /// Check @p value against the policy; @p what names the channel in the
    /// error message.
    Status checkChannel(int value, const char* what) const;
    Status checkBrightness(int value) const;

    Status notify();

private:
    Status setChannel(ByteIndex index, int value, const char* what);

    ChannelPolicy mPolicy;
    LedObserver* mObserver;
};

/// An LED frame that knows its position in the string. The id is only used
/// for diagnostics; on the wire LEDs are addressed purely by order.
class Led : public LEDFrame {
public:
    Led(size_t id, int brightness = STRIPBANG_DEFAULT_BRIGHTNESS, int red = 0,
        int green = 0, int blue = 0,
        ChannelPolicy policy = defaultChannelPolicy())
        : LEDFrame(brightness, red, green, blue, policy), mId(id) {}

    size_t id() const { return mId; }

private:
    size_t mId;
};

} // namespace sb
