// Startup configuration for the seat finder pipeline.
// Defaults match the GY-MCU90640 (MLX90640) UART module: 32x24 pixels,
// 1544-byte frames, temperatures in centi-degrees.

#pragma once
#include "esp_err.h"
#include <cstddef>
#include <cstdint>

namespace seatsense {

enum class ChecksumPolicy : uint8_t {
    ADDITIVE16_FRAME = 0,   // sum of LE 16-bit words over header + payload (module default)
    ADDITIVE16_PAYLOAD = 1, // sum of LE 16-bit words over payload only
    ADDITIVE8_PAYLOAD = 2   // byte sum over payload, one check byte
};

const char *checksumPolicyName(ChecksumPolicy policy);
size_t checkFieldSize(ChecksumPolicy policy);

struct FrameLayout {
    uint8_t startMarker[2] = {0x5A, 0x5A};
    uint16_t rows = 24;
    uint16_t cols = 32;
    uint8_t wordSize = 2;    // bytes per pixel word (1 or 2)
    uint8_t trailerSize = 2; // sensor die temperature word after the pixels (0 or 2)

    // marker (2) + declared data length (2)
    static constexpr size_t HEADER_SIZE = 4;

    size_t pixelCount() const { return (size_t)rows * cols; }
    size_t payloadSize() const { return pixelCount() * wordSize + trailerSize; }
};

struct SeatFinderConfig {
    FrameLayout layout;
    ChecksumPolicy checksum = ChecksumPolicy::ADDITIVE16_FRAME;

    // Linear word -> degC transform
    bool signedWords = false;
    float scale = 0.01f;
    float offset = 0.0f;

    // Detection
    float occupiedTempDelta = 5.0f;     // degC above the grid median
    uint16_t minOccupiedPixelCount = 4; // qualifying cells needed for OCCUPIED
    uint8_t hysteresisFrames = 2;       // consecutive agreeing grids before the output changes
    uint8_t lossThreshold = 3;          // consecutive lost cycles before UNKNOWN

    // Acquisition
    uint32_t frameTimeoutMs = 1000;
    size_t readChunkSize = 256; // at most frameSize(), so no read can buffer a whole extra frame

    // Feedback
    float minIntensity = 0.3f;       // intensity floor for an active command
    float intensityDeadband = 0.05f; // smaller changes are not re-issued

    // Display scaling limits (degC)
    float displayMinTemp = 0.0f;
    float displayMaxTemp = 300.0f;

    size_t frameSize() const {
        return FrameLayout::HEADER_SIZE + layout.payloadSize() + checkFieldSize(checksum);
    }

    // Logs the first offending field and returns ESP_ERR_INVALID_ARG, ESP_OK otherwise.
    esp_err_t validate() const;
};

} // namespace seatsense
