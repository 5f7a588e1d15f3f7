#pragma once

/// @file sb/gpio_sink.h
/// @brief Destination for bit-banged GPIO levels
///
/// A sink applies one GpioLevel per call to a digital output port, in call
/// order; every call is one discrete bus clock step. Implementations wrap
/// whatever port the platform offers (an FTDI-style async bit-bang port, a
/// memory mapped GPIO register, a capture buffer).
///
/// The caller creates the sink once and hands it to the objects that drive
/// it. Sinks are never opened, cached, or reconnected behind the caller's
/// back.

#include "sb/gpio_types.h"
#include "sb/result.h"

namespace sb {

class GpioSink {
public:
    virtual ~GpioSink() = default;

    /// Apply @p level to the port.
    /// @returns success, or IO_ERROR if the port rejected the write
    virtual Status write(GpioLevel level) = 0;

    /// Human-readable name for logging and error messages.
    virtual const char* getName() const = 0;
};

} // namespace sb
