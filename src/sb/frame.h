#pragma once

/// @file sb/frame.h
/// Fixed four byte protocol units of an APA102C / SK9822 transmission.

#include <vector>

#include "sb/int.h"

namespace sb {

/// A four byte unit of the wire stream. Every frame on the strip, including
/// the start and end markers, has exactly this length.
class Frame {
public:
    static constexpr size_t kLength = 4;

    Frame();

    size_t size() const { return kLength; }
    const u8* data() const { return mBytes; }
    u8 operator[](size_t index) const { return mBytes[index]; }

    /// Copy of the frame bytes, in wire order.
    std::vector<u8> payload() const;

    /// Append the frame bytes to @p out.
    void appendTo(std::vector<u8>* out) const;

protected:
    u8 mBytes[kLength];
};

/// All-zero frame opening every transmission. Lets the receiver tell a new
/// update apart from noise while the outputs settle.
class StartFrame : public Frame {
public:
    StartFrame() {}
};

/// All-zero frame closing every transmission. Its only job is to supply the
/// extra clock pulses that push the last LED frame through the chain.
class EndFrame : public Frame {
public:
    EndFrame() {}
};

} // namespace sb
