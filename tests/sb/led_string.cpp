#include "test.h"

#include <type_traits>
#include <utility>

#include "platforms/stub/gpio_sink_stub.h"
#include "sb/led_string.h"

namespace {

const GpioLines kLines(2, 0);

// Number of levels one full transmission of an N-LED string takes.
size_t levelsPerPush(size_t numLeds) {
    return 16 * 4 * (numLeds + 2);
}

std::vector<Rgb> colors(const LedString &strip) {
    std::vector<Rgb> out;
    for (const Led &led : strip.leds()) {
        out.push_back(led.rgb());
    }
    return out;
}

void paint(LedString &strip, const std::vector<Rgb> &values) {
    REQUIRE_EQ(strip.size(), values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        REQUIRE(strip[i].setRgb(values[i]).ok());
    }
}

} // namespace

TEST_CASE("LedString payload layout") {
    SUBCASE("three full-brightness black LEDs") {
        LedString strip(LedStringConfig(3));
        const std::vector<u8> want = {
            0x00, 0x00, 0x00, 0x00,  // start
            0xFF, 0x00, 0x00, 0x00,  // LED 0
            0xFF, 0x00, 0x00, 0x00,  // LED 1
            0xFF, 0x00, 0x00, 0x00,  // LED 2
            0x00, 0x00, 0x00, 0x00,  // end
        };
        CHECK_EQ(strip.payload(), want);
    }

    SUBCASE("colors go out blue, green, red") {
        LedString strip(LedStringConfig(1));
        REQUIRE(strip[0].setRgb(0xAA, 0x10, 0x05).ok());
        REQUIRE(strip[0].setBrightness(20).ok());
        const std::vector<u8> payload = strip.payload();
        CHECK_EQ(payload[4], 0xE0 | 20);
        CHECK_EQ(payload[5], 0x05);
        CHECK_EQ(payload[6], 0x10);
        CHECK_EQ(payload[7], 0xAA);
    }

    SUBCASE("length is 4*(N+2) for every N") {
        for (size_t n = 0; n < 40; ++n) {
            const LedStringConfig config(n);
            LedString strip(config);
            CHECK_EQ(strip.size(), n);
            CHECK_EQ(strip.payload().size(), 4 * (n + 2));
        }
    }
}

TEST_CASE("LedString construction") {
    LedStringConfig config(4);
    config.brightness = 12;
    config.red = 1;
    config.green = 2;
    config.blue = 3;
    LedString strip(config);

    CHECK_FALSE(strip.autoUpdate());
    CHECK_FALSE(strip.lines().isSet());
    for (size_t i = 0; i < strip.size(); ++i) {
        CHECK_EQ(strip[i].id(), i);
        CHECK_EQ(strip[i].brightness(), 12);
        CHECK_EQ(strip[i].rgb(), Rgb(1, 2, 3));
        REQUIRE(strip[i].observer() != nullptr);
        CHECK_EQ(strip[i].observer(), strip[0].observer());
    }

    SUBCASE("both lines turn auto-update on") {
        GpioSinkStub sink;
        LedStringConfig wired(2);
        wired.lines = kLines;
        LedString auto_strip(wired, &sink);
        CHECK(auto_strip.autoUpdate());
        CHECK_EQ(sink.getWriteCount(), 0u);
    }

    SUBCASE("unusable lines are reported up front") {
        GpioSinkStub sink;
        LedStringConfig wired(2);
        wired.lines = GpioLines(40, 0);
        CapturedLog log;
        LedString bad(wired, &sink);
        CHECK(bad.autoUpdate());
        CHECK(log.contains("unusable gpio lines: clock=40 data=0"));
        CHECK_EQ(bad[0].setRed(1).error(), ResultError::INVALID_ARGUMENT);
    }

    SUBCASE("one line is not enough") {
        LedStringConfig half(2);
        half.lines = GpioLines(2, -1);
        LedString manual(half);
        CHECK_FALSE(manual.autoUpdate());
    }
}

TEST_CASE("LED count is fixed at construction") {
    // Only a read-only view of the container is handed out.
    typedef decltype(std::declval<LedString &>().leds()) LedsRef;
    static_assert(std::is_const<std::remove_reference<LedsRef>::type>::value,
                  "leds() must not allow adding or removing LEDs");

    LedString strip(LedStringConfig(3));
    CHECK_EQ(strip.leds().size(), 3u);
    REQUIRE(strip.setAll(7).ok());
    REQUIRE(strip.shiftRight(Rgb(1, 2, 3)).ok());
    CHECK_EQ(strip.size(), 3u);
    CHECK_EQ(strip.payload().size(), 20u);
}

TEST_CASE("Frames outside the string cannot trigger a push") {
    GpioSinkStub sink;
    LedStringConfig config(2);
    config.lines = kLines;
    LedString strip(config, &sink);
    CapturedLog log;

    LEDFrame stray;
    stray.attach(strip[0].observer());
    CHECK(stray.setRed(1).ok());
    CHECK_EQ(sink.getWriteCount(), 0u);
    CHECK_EQ(strip.transmissionCount(), 0u);
    CHECK(log.contains("outside the string"));

    // The string's own LEDs still push.
    REQUIRE(strip[1].setRed(1).ok());
    CHECK_EQ(strip.transmissionCount(), 1u);
}

TEST_CASE("Strict config validation") {
    LedStringConfig config(2);
    config.policy = ChannelPolicy::kStrict;
    CHECK(config.validate().ok());

    config.brightness = 40;
    CHECK_EQ(config.validate().error(), ResultError::OUT_OF_RANGE);

    config.brightness = 31;
    config.blue = 300;
    Status s = config.validate();
    CHECK_EQ(s.error(), ResultError::OUT_OF_RANGE);
    CHECK(std::string(s.message()).find("blue") != std::string::npos);

    CapturedLog log;
    LedString strip(config);
    CHECK(log.contains("masked into range"));
    CHECK_EQ(strip[0].blue(), 300 & 0xFF);
}

TEST_CASE("Manual mode only pushes on update()") {
    GpioSinkStub sink;
    LedStringConfig config(3);
    config.lines = kLines;
    LedString strip(config, &sink);
    strip.setAutoUpdate(false);

    REQUIRE(strip[0].setRgb(1, 2, 3).ok());
    REQUIRE(strip.setAll(9).ok());
    CHECK_EQ(sink.getWriteCount(), 0u);

    REQUIRE(strip.update().ok());
    CHECK_EQ(sink.getWriteCount(), levelsPerPush(3));
    CHECK_EQ(strip.transmissionCount(), 1u);
    CHECK_EQ(sink.decodeBytes(kLines), strip.payload());
}

TEST_CASE("Auto mode pushes once per logical change") {
    GpioSinkStub sink;
    LedStringConfig config(3);
    config.lines = kLines;
    LedString strip(config, &sink);

    SUBCASE("single channel") {
        REQUIRE(strip[1].setGreen(0x40).ok());
        CHECK_EQ(sink.getWriteCount(), levelsPerPush(3));
    }

    SUBCASE("rgb is one resend, not three") {
        REQUIRE(strip[0].setRgb(0xAA, 0x10, 0x05).ok());
        CHECK_EQ(sink.getWriteCount(), levelsPerPush(3));
        CHECK_EQ(strip.transmissionCount(), 1u);
        CHECK_EQ(sink.decodeBytes(kLines), strip.payload());
    }

    SUBCASE("bulk operations resend once") {
        REQUIRE(strip.setAll(0x20).ok());
        CHECK_EQ(strip.transmissionCount(), 1u);
        REQUIRE(strip.setAllBrightness(5).ok());
        CHECK_EQ(strip.transmissionCount(), 2u);
        REQUIRE(strip.shiftLeft(Rgb(0x0F, 0, 0)).ok());
        CHECK_EQ(strip.transmissionCount(), 3u);
        REQUIRE(strip.shiftRight(Rgb(0, 0x0F, 0)).ok());
        CHECK_EQ(strip.transmissionCount(), 4u);
        CHECK_EQ(sink.getWriteCount(), 4 * levelsPerPush(3));
        CHECK(strip.autoUpdate());
    }

    SUBCASE("last transmission matches the model") {
        REQUIRE(strip.setAllBrightness(20).ok());
        REQUIRE(strip[2].setBlue(0x60).ok());
        sink.clear();
        REQUIRE(strip[0].setRed(0x11).ok());
        const std::vector<u8> sent = sink.decodeBytes(kLines);
        CHECK_EQ(sent, strip.payload());
        CHECK_EQ(sent[4], 0xE0 | 20);
        CHECK_EQ(sent[7], 0x11);
        CHECK_EQ(sent[13], 0x60);
    }
}

TEST_CASE("setAll and setAllBrightness") {
    LedString strip(LedStringConfig(4));

    REQUIRE(strip.setAll(0x33).ok());
    for (const Led &led : strip.leds()) {
        CHECK_EQ(led.rgb(), Rgb(0x33, 0x33, 0x33));
    }

    REQUIRE(strip.setAllBrightness(0).ok());
    const std::vector<u8> payload = strip.payload();
    for (size_t i = 0; i < strip.size(); ++i) {
        CHECK_EQ(payload[4 + 4 * i], 0xE0);
    }

    SUBCASE("strict mode rejects before touching anything") {
        LedStringConfig config(2);
        config.policy = ChannelPolicy::kStrict;
        LedString strict(config);
        CapturedLog log;
        CHECK_EQ(strict.setAll(256).error(), ResultError::OUT_OF_RANGE);
        CHECK_EQ(strict.setAllBrightness(32).error(), ResultError::OUT_OF_RANGE);
        CHECK_EQ(strict[0].rgb(), Rgb(0, 0, 0));
        CHECK_EQ(strict[1].brightness(), 31);
    }
}

TEST_CASE("shiftRight inserts at the head") {
    LedString strip(LedStringConfig(3));
    paint(strip, {Rgb(1, 2, 3), Rgb(4, 5, 6), Rgb(7, 8, 9)});

    REQUIRE(strip.shiftRight(Rgb(0xAA, 0x10, 0x05)).ok());
    CHECK(colors(strip) == std::vector<Rgb>({Rgb(0xAA, 0x10, 0x05),
                                             Rgb(1, 2, 3), Rgb(4, 5, 6)}));
}

TEST_CASE("shiftLeft inserts at the tail") {
    LedString strip(LedStringConfig(3));
    paint(strip, {Rgb(1, 2, 3), Rgb(4, 5, 6), Rgb(7, 8, 9)});

    REQUIRE(strip.shiftLeft(Rgb(0xAA, 0x10, 0x05)).ok());
    CHECK(colors(strip) == std::vector<Rgb>({Rgb(4, 5, 6), Rgb(7, 8, 9),
                                             Rgb(0xAA, 0x10, 0x05)}));
}

TEST_CASE("Shift operators forward to the shift methods") {
    GpioSinkStub sink;
    LedStringConfig config(3);
    config.lines = kLines;
    LedString strip(config, &sink);
    paint(strip, {Rgb(1, 1, 1), Rgb(2, 2, 2), Rgb(3, 3, 3)});
    sink.clear();

    SUBCASE(">> inserts at the head") {
        REQUIRE((strip >> Rgb(9, 9, 9)).ok());
        CHECK(colors(strip) == std::vector<Rgb>({Rgb(9, 9, 9), Rgb(1, 1, 1),
                                                 Rgb(2, 2, 2)}));
        CHECK_EQ(sink.getWriteCount(), levelsPerPush(3));
    }

    SUBCASE("<< inserts at the tail") {
        REQUIRE((strip << Rgb(9, 9, 9)).ok());
        CHECK(colors(strip) == std::vector<Rgb>({Rgb(2, 2, 2), Rgb(3, 3, 3),
                                                 Rgb(9, 9, 9)}));
        CHECK_EQ(sink.getWriteCount(), levelsPerPush(3));
    }

    SUBCASE("errors come back through the operator") {
        sink.failAtWrite(sink.getAttemptCount());
        CHECK_EQ((strip << Rgb(9, 9, 9)).error(), ResultError::IO_ERROR);
    }
}

TEST_CASE("shiftLeft then shiftRight with the displaced head restores") {
    const std::vector<std::vector<Rgb>> starts = {
        {Rgb(1, 2, 3)},
        {Rgb(1, 2, 3), Rgb(4, 5, 6), Rgb(7, 8, 9)},
        {Rgb(0, 0, 0), Rgb(255, 255, 255), Rgb(0, 0, 0), Rgb(9, 9, 9)},
    };
    for (const std::vector<Rgb> &start : starts) {
        LedString strip(LedStringConfig(start.size()));
        paint(strip, start);

        const Rgb displaced = strip[0].rgb();
        REQUIRE(strip.shiftLeft(Rgb(0x42, 0x42, 0x42)).ok());
        REQUIRE(strip.shiftRight(displaced).ok());
        CHECK(colors(strip) == start);
    }
}

TEST_CASE("Shifts leave brightness alone") {
    LedString strip(LedStringConfig(2));
    REQUIRE(strip[0].setBrightness(3).ok());
    REQUIRE(strip[1].setBrightness(9).ok());
    REQUIRE(strip.shiftRight(Rgb(1, 1, 1)).ok());
    CHECK_EQ(strip[0].brightness(), 3);
    CHECK_EQ(strip[1].brightness(), 9);
}

TEST_CASE("Empty string") {
    GpioSinkStub sink;
    LedStringConfig config(0);
    config.lines = kLines;
    LedString strip(config, &sink);

    CHECK_EQ(strip.payload(), std::vector<u8>(8, 0));
    REQUIRE(strip.shiftLeft(Rgb(1, 2, 3)).ok());
    REQUIRE(strip.shiftRight(Rgb(1, 2, 3)).ok());
    REQUIRE(strip.setAll(5).ok());
    CHECK_EQ(strip.transmissionCount(), 3u);
    CHECK_EQ(sink.getWriteCount(), 3 * levelsPerPush(0));
}

TEST_CASE("update() without lines is a silent no-op") {
    GpioSinkStub sink;
    LedString strip(LedStringConfig(2), &sink);
    CapturedLog log;

    CHECK(strip.update().ok());
    CHECK(strip.update(-1, 0).ok());
    CHECK(strip.update(3, -1).ok());
    CHECK_EQ(sink.getWriteCount(), 0u);
    CHECK(log.lines().empty());
}

TEST_CASE("update(clock, data) overrides the configured lines") {
    GpioSinkStub sink;
    LedString strip(LedStringConfig(1), &sink);
    REQUIRE(strip[0].setRgb(1, 2, 3).ok());

    const GpioLines other(5, 7);
    REQUIRE(strip.update(other.clock, other.data).ok());
    CHECK_EQ(sink.getWriteCount(), levelsPerPush(1));
    CHECK_EQ(sink.decodeBytes(other), strip.payload());
    CHECK_FALSE(strip.lines().isSet());
}

TEST_CASE("update() reports configuration problems") {
    CapturedLog log;

    SUBCASE("no sink") {
        LedStringConfig config(1);
        config.lines = kLines;
        LedString strip(config);
        CHECK_EQ(strip.update().error(), ResultError::NOT_INITIALIZED);
        // Auto mode surfaces the same error through the setter.
        CHECK_EQ(strip[0].setRed(1).error(), ResultError::NOT_INITIALIZED);
        CHECK_EQ(strip[0].red(), 1);
    }

    SUBCASE("clashing lines") {
        GpioSinkStub sink;
        LedString strip(LedStringConfig(1), &sink);
        CHECK_EQ(strip.update(4, 4).error(), ResultError::INVALID_ARGUMENT);
        CHECK_EQ(sink.getWriteCount(), 0u);
    }
}

TEST_CASE("Sink failure aborts the push and keeps the model") {
    GpioSinkStub sink;
    LedStringConfig config(2);
    config.lines = kLines;
    LedString strip(config, &sink);
    CapturedLog log;

    sink.failAtWrite(10);
    Status s = strip[1].setRgb(0x10, 0x20, 0x30);
    CHECK_EQ(s.error(), ResultError::IO_ERROR);
    CHECK(std::string(s.message()).find("MockGPIO") != std::string::npos);
    CHECK(log.contains("gpio write 10/"));

    // Nothing after the failing write reached the port.
    CHECK_EQ(sink.getWriteCount(), 10u);
    CHECK_EQ(sink.getAttemptCount(), 11u);
    CHECK_EQ(strip.transmissionCount(), 0u);
    CHECK_EQ(strip[1].rgb(), Rgb(0x10, 0x20, 0x30));
    CHECK(strip.autoUpdate());

    // The next push goes through in full.
    sink.clear();
    REQUIRE(strip.update().ok());
    CHECK_EQ(sink.decodeBytes(kLines), strip.payload());
    CHECK_EQ(strip.transmissionCount(), 1u);
}

TEST_CASE("Bulk operation failure restores auto mode") {
    GpioSinkStub sink;
    LedStringConfig config(3);
    config.lines = kLines;
    LedString strip(config, &sink);
    CapturedLog log;

    sink.failAtWrite(0);
    CHECK_EQ(strip.shiftRight(Rgb(1, 1, 1)).error(), ResultError::IO_ERROR);
    CHECK(strip.autoUpdate());
    CHECK_EQ(strip[0].rgb(), Rgb(1, 1, 1));
}
