#pragma once
#include <cstddef>
#include <cstdint>

namespace seatsense {

// Sensor transport. read() waits at most timeoutMs and may return fewer
// bytes than requested; 0 means nothing arrived, < 0 a transport error.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual int read(uint8_t *buf, size_t maxBytes, uint32_t timeoutMs) = 0;
};

// Monotonic millisecond clock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint32_t nowMs() = 0;
};

} // namespace seatsense
