#pragma once

/// @file sb/led_string.h
/// A chain of APA102C / SK9822 LEDs driven over two bit-banged GPIO lines.
///
/// Transmission layout, 4*(N+2) bytes for N LEDs:
///   [start frame][LED 0]...[LED N-1][end frame]
///
/// Two modes:
///   - manual: mutations only change the model; call update() to push it.
///   - auto:   every mutation pushes the whole string right away.
/// Auto mode is on when both GPIO lines are configured. Bulk operations
/// (setAll, shifts) hold auto mode off while they run and push once at the
/// end.
///
/// Example:
/// @code
/// MyPortSink port;                     // some GpioSink implementation
/// LedStringConfig config(8);
/// config.lines = GpioLines(2, 0);      // clock on line 2, data on line 0
/// LedString strip(config, &port);
/// strip.setAllBrightness(20);          // one transmission
/// strip.led(0).setRgb(0xAA, 0x10, 0x05);   // one transmission
/// strip.shiftLeft(Rgb(0x0F, 0, 0));    // one transmission
/// @endcode

#include <vector>

#include "sb/config.h"
#include "sb/frame.h"
#include "sb/gpio_sink.h"
#include "sb/gpio_types.h"
#include "sb/led_frame.h"
#include "sb/result.h"
#include "sb/rgb.h"

namespace sb {

/// Construction parameters of an LedString.
struct LedStringConfig {
    LedStringConfig() = default;
    explicit LedStringConfig(size_t led_count) : num_leds(led_count) {}

    /// Every value in range for the chosen policy (always true for truncate).
    Status validate() const;

    size_t num_leds = 0;                            ///< Fixed for the string's lifetime
    int brightness = STRIPBANG_DEFAULT_BRIGHTNESS;  ///< Initial brightness, 0-31
    int red = 0;                                    ///< Initial red, 0-255
    int green = 0;                                  ///< Initial green, 0-255
    int blue = 0;                                   ///< Initial blue, 0-255
    GpioLines lines;                                ///< Both set = auto-update
    ChannelPolicy policy = defaultChannelPolicy();
};

class LedString {
public:
    /// @param sink port the string is pushed to; not owned, must outlive the
    ///        string. May be null for a model-only string.
    explicit LedString(const LedStringConfig& config, GpioSink* sink = nullptr);
    ~LedString();

    size_t size() const { return mLeds.size(); }

    /// The LED count is fixed; individual LEDs are reached through led(i).
    const std::vector<Led>& leds() const { return mLeds; }

    Led& led(size_t index) { return mLeds[index]; }
    const Led& led(size_t index) const { return mLeds[index]; }
    Led& operator[](size_t index) { return mLeds[index]; }
    const Led& operator[](size_t index) const { return mLeds[index]; }

    const StartFrame& startFrame() const { return mStart; }
    const EndFrame& endFrame() const { return mEnd; }

    /// Start frame, each LED frame in index order, end frame.
    std::vector<u8> payload() const;

    /// Same value on all three color channels of every LED.
    Status setAll(int intensity);

    /// Same brightness on every LED.
    Status setAllBrightness(int value);

    /// Insert @p color at the head (LED 0); every LED takes the color of its
    /// predecessor and the tail color falls off.
    Status shiftRight(const Rgb& color);

    /// Insert @p color at the tail; every LED takes the color of its
    /// successor and the head color falls off.
    Status shiftLeft(const Rgb& color);

    Status operator>>(const Rgb& color) { return shiftRight(color); }
    Status operator<<(const Rgb& color) { return shiftLeft(color); }

    /// Push the current payload through the configured lines.
    Status update();

    /// Push the current payload using @p clockLine and @p dataLine for this
    /// call only. A negative line makes this a no-op.
    Status update(int clockLine, int dataLine);

    bool autoUpdate() const { return mAutoUpdate; }
    void setAutoUpdate(bool enabled) { mAutoUpdate = enabled; }

    const GpioLines& lines() const { return mLines; }
    ChannelPolicy policy() const { return mPolicy; }
    GpioSink* sink() const { return mSink; }

    /// Number of payloads fully written to the sink so far.
    size_t transmissionCount() const { return mTransmissions; }

private:
    class ManualModeScope;

    // Receives change notifications from this string's own LEDs only.
    class Link : public LedObserver {
    public:
        explicit Link(LedString* strip) : mStrip(strip) {}
        Status onLedUpdated(const LEDFrame& led) override;

    private:
        LedString* mStrip;
    };

    /// Null when @p frame is not one of this string's LEDs.
    const Led* findLed(const LEDFrame& frame) const;
    Status onLedUpdated(const Led& led);
    Status pushIfAuto(bool wasAuto);

    StartFrame mStart;
    std::vector<Led> mLeds;
    EndFrame mEnd;
    GpioLines mLines;
    ChannelPolicy mPolicy;
    GpioSink* mSink;
    bool mAutoUpdate;
    size_t mTransmissions;
    Link mLink;

    // Frames hold a pointer back to this string.
    LedString(const LedString&) = delete;
    LedString& operator=(const LedString&) = delete;
};

} // namespace sb
