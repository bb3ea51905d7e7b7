// Host transport: a serial device (USB-UART adapter wired to the module) or a
// raw capture file recorded from one.

#pragma once
#include "byte_source.h"
#include "esp_err.h"
#include <cstdint>
#include <string>

class PosixByteSource : public seatsense::ByteSource {
public:
    // baud == 0 leaves the line settings alone (capture files, pipes)
    explicit PosixByteSource(const std::string &path, uint32_t baud = 0);
    ~PosixByteSource() override;

    esp_err_t open();
    void close();

    int read(uint8_t *buf, size_t maxBytes, uint32_t timeoutMs) override;

    // True once a regular file or pipe reported end of input.
    bool eof() const { return atEof; }

private:
    std::string path;
    uint32_t baud;
    int fd = -1;
    bool atEof = false;

    esp_err_t configureTty();
};
