#include "seat_finder_config.h"
#include "esp_log.h"
#include <cmath>

static const char *TAG = "seat_config";

namespace seatsense {

const char *checksumPolicyName(ChecksumPolicy policy) {
    switch (policy) {
        case ChecksumPolicy::ADDITIVE16_FRAME: return "additive16-frame";
        case ChecksumPolicy::ADDITIVE16_PAYLOAD: return "additive16-payload";
        case ChecksumPolicy::ADDITIVE8_PAYLOAD: return "additive8-payload";
    }
    return "invalid";
}

size_t checkFieldSize(ChecksumPolicy policy) {
    return (policy == ChecksumPolicy::ADDITIVE8_PAYLOAD) ? 1 : 2;
}

esp_err_t SeatFinderConfig::validate() const {
    if (layout.rows == 0 || layout.cols == 0) {
        ESP_LOGE(TAG, "Invalid grid dimensions %ux%u", (unsigned)layout.cols, (unsigned)layout.rows);
        return ESP_ERR_INVALID_ARG;
    }
    if (layout.wordSize != 1 && layout.wordSize != 2) {
        ESP_LOGE(TAG, "Unsupported word size %u (expected 1 or 2)", (unsigned)layout.wordSize);
        return ESP_ERR_INVALID_ARG;
    }
    if (layout.trailerSize != 0 && layout.trailerSize != 2) {
        ESP_LOGE(TAG, "Unsupported trailer size %u (expected 0 or 2)", (unsigned)layout.trailerSize);
        return ESP_ERR_INVALID_ARG;
    }
    // Bounded before payloadSize() is formed so the product cannot wrap a 32-bit size_t
    if (layout.pixelCount() > (0xFFFFu - layout.trailerSize) / layout.wordSize) {
        ESP_LOGE(TAG, "%ux%u grid of %u-byte words does not fit the 16-bit length field",
                 (unsigned)layout.cols, (unsigned)layout.rows, (unsigned)layout.wordSize);
        return ESP_ERR_INVALID_ARG;
    }
    // Word checksums need whole words before the check field
    if (checksum != ChecksumPolicy::ADDITIVE8_PAYLOAD && (layout.payloadSize() % 2) != 0) {
        ESP_LOGE(TAG, "Checksum %s needs an even payload size, got %u",
                 checksumPolicyName(checksum), (unsigned)layout.payloadSize());
        return ESP_ERR_INVALID_ARG;
    }
    if (checksum != ChecksumPolicy::ADDITIVE16_FRAME && checksum != ChecksumPolicy::ADDITIVE16_PAYLOAD &&
        checksum != ChecksumPolicy::ADDITIVE8_PAYLOAD) {
        ESP_LOGE(TAG, "Unknown checksum policy %u", (unsigned)checksum);
        return ESP_ERR_INVALID_ARG;
    }
    if (!std::isfinite(scale) || scale <= 0.0f || !std::isfinite(offset)) {
        ESP_LOGE(TAG, "Invalid temperature transform scale=%f offset=%f", (double)scale, (double)offset);
        return ESP_ERR_INVALID_ARG;
    }
    // The extreme raw words (pixel or trailer) must still map to finite degC
    const int bits = (layout.trailerSize == 2) ? 16 : layout.wordSize * 8;
    const int32_t rawMax = signedWords ? (1 << (bits - 1)) - 1 : (1 << bits) - 1;
    const int32_t rawMin = signedWords ? -(1 << (bits - 1)) : 0;
    if (!std::isfinite((float)rawMax * scale + offset) || !std::isfinite((float)rawMin * scale + offset)) {
        ESP_LOGE(TAG, "Temperature transform overflows for raw words %d..%d (scale=%g offset=%g)",
                 (int)rawMin, (int)rawMax, (double)scale, (double)offset);
        return ESP_ERR_INVALID_ARG;
    }
    if (!std::isfinite(occupiedTempDelta) || occupiedTempDelta <= 0.0f) {
        ESP_LOGE(TAG, "occupiedTempDelta must be > 0, got %f", (double)occupiedTempDelta);
        return ESP_ERR_INVALID_ARG;
    }
    if (minOccupiedPixelCount == 0 || minOccupiedPixelCount > layout.pixelCount()) {
        ESP_LOGE(TAG, "minOccupiedPixelCount must be in 1..%u, got %u",
                 (unsigned)layout.pixelCount(), (unsigned)minOccupiedPixelCount);
        return ESP_ERR_INVALID_ARG;
    }
    if (hysteresisFrames == 0) {
        ESP_LOGE(TAG, "hysteresisFrames must be >= 1");
        return ESP_ERR_INVALID_ARG;
    }
    if (lossThreshold == 0) {
        ESP_LOGE(TAG, "lossThreshold must be >= 1");
        return ESP_ERR_INVALID_ARG;
    }
    if (frameTimeoutMs == 0 || readChunkSize == 0) {
        ESP_LOGE(TAG, "frameTimeoutMs and readChunkSize must be > 0");
        return ESP_ERR_INVALID_ARG;
    }
    // A larger read could leave a whole second frame buffered past its cycle
    if (readChunkSize > frameSize()) {
        ESP_LOGE(TAG, "readChunkSize %u exceeds the %u-byte frame", (unsigned)readChunkSize, (unsigned)frameSize());
        return ESP_ERR_INVALID_ARG;
    }
    if (!(minIntensity >= 0.0f && minIntensity <= 1.0f) ||
        !(intensityDeadband >= 0.0f && intensityDeadband <= 1.0f)) {
        ESP_LOGE(TAG, "minIntensity/intensityDeadband must be within [0,1] (%f, %f)",
                 (double)minIntensity, (double)intensityDeadband);
        return ESP_ERR_INVALID_ARG;
    }
    if (!std::isfinite(displayMinTemp) || !std::isfinite(displayMaxTemp) || displayMinTemp >= displayMaxTemp) {
        ESP_LOGE(TAG, "Display limits inverted (%f..%f)", (double)displayMinTemp, (double)displayMaxTemp);
        return ESP_ERR_INVALID_ARG;
    }
    return ESP_OK;
}

} // namespace seatsense
