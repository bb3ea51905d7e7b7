#include "frame_assembler.h"
#include "esp_log.h"
#include <algorithm>

static const char *TAG = "frame_asm";

namespace seatsense {

const char *frameStatusName(FrameStatus status) {
    switch (status) {
        case FrameStatus::INCOMPLETE: return "incomplete";
        case FrameStatus::VALIDATED: return "validated";
        case FrameStatus::CHECKSUM_FAILED: return "checksum failed";
        case FrameStatus::RESYNCED: return "resynced";
    }
    return "invalid";
}

FrameAssembler::FrameAssembler(const SeatFinderConfig &config) : cfg(config), frameLen(config.frameSize()) {
    buf.reserve(frameLen * 2);
}

uint16_t FrameAssembler::computeCheck(const SeatFinderConfig &config, const uint8_t *frame) {
    const size_t payloadLen = config.layout.payloadSize();
    const uint8_t *payload = frame + FrameLayout::HEADER_SIZE;
    switch (config.checksum) {
        case ChecksumPolicy::ADDITIVE16_FRAME: {
            uint16_t sum = 0;
            const size_t end = FrameLayout::HEADER_SIZE + payloadLen;
            for (size_t i = 0; i + 1 < end; i += 2) {
                sum = (uint16_t)(sum + (frame[i] | (frame[i + 1] << 8)));
            }
            return sum;
        }
        case ChecksumPolicy::ADDITIVE16_PAYLOAD: {
            uint16_t sum = 0;
            for (size_t i = 0; i + 1 < payloadLen; i += 2) {
                sum = (uint16_t)(sum + (payload[i] | (payload[i + 1] << 8)));
            }
            return sum;
        }
        case ChecksumPolicy::ADDITIVE8_PAYLOAD: {
            uint8_t sum = 0;
            for (size_t i = 0; i < payloadLen; i++) sum = (uint8_t)(sum + payload[i]);
            return sum;
        }
    }
    return 0;
}

uint16_t FrameAssembler::receivedCheck() const {
    const size_t at = FrameLayout::HEADER_SIZE + cfg.layout.payloadSize();
    if (checkFieldSize(cfg.checksum) == 1) return buf[at];
    return (uint16_t)(buf[at] | (buf[at + 1] << 8));
}

// Drops everything before the first (possibly partial) start marker.
// Returns the number of bytes dropped.
size_t FrameAssembler::alignToMarker() {
    const uint8_t m0 = cfg.layout.startMarker[0];
    const uint8_t m1 = cfg.layout.startMarker[1];
    size_t i = 0;
    while (i < buf.size()) {
        if (buf[i] == m0 && (i + 1 == buf.size() || buf[i + 1] == m1)) break;
        i++;
    }
    if (i) buf.erase(buf.begin(), buf.begin() + i);
    return i;
}

FrameResult FrameAssembler::ingest(const uint8_t *data, size_t len) {
    FrameResult result;
    if (data && len) buf.insert(buf.end(), data, data + len);

    size_t skipped = 0;
    for (;;) {
        skipped += alignToMarker();
        if (buf.size() < frameLen) break;

        uint16_t declared = buf[2] | (buf[3] << 8);
        if (declared != cfg.layout.payloadSize()) {
            // Marker bytes inside payload data, not a real frame start
            ESP_LOGV(TAG, "False marker: declared length %u, expected %u", (unsigned)declared,
                     (unsigned)cfg.layout.payloadSize());
            buf.erase(buf.begin());
            skipped++;
            continue;
        }

        uint16_t expected = computeCheck(cfg, buf.data());
        uint16_t received = receivedCheck();
        if (expected != received) {
            ESP_LOGD(TAG, "Checksum mismatch (calc 0x%04X, recv 0x%04X), dropping %u buffered bytes",
                     (unsigned)expected, (unsigned)received, (unsigned)buf.size());
            stats.checksumFailures++;
            stats.discardedBytes += (uint32_t)(buf.size() + skipped);
            if (skipped) stats.resyncs++;
            buf.clear();
            result.status = FrameStatus::CHECKSUM_FAILED;
            return result;
        }

        result.frame.emplace(buf.data() + FrameLayout::HEADER_SIZE, cfg.layout.payloadSize());
        buf.erase(buf.begin(), buf.begin() + frameLen);
        stats.validatedFrames++;
        if (skipped) {
            stats.resyncs++;
            stats.discardedBytes += (uint32_t)skipped;
            ESP_LOGD(TAG, "Resynced after skipping %u bytes", (unsigned)skipped);
        }
        result.status = FrameStatus::VALIDATED;
        return result;
    }

    if (skipped) {
        stats.resyncs++;
        stats.discardedBytes += (uint32_t)skipped;
        ESP_LOGD(TAG, "Skipped %u bytes looking for frame start", (unsigned)skipped);
        result.status = FrameStatus::RESYNCED;
    }
    return result;
}

FrameResult FrameAssembler::abandon() {
    if (!buf.empty()) {
        ESP_LOGD(TAG, "Abandoning partial frame (%u of %u bytes)", (unsigned)buf.size(), (unsigned)frameLen);
        stats.abandonedPartials++;
        stats.discardedBytes += (uint32_t)buf.size();
        buf.clear();
    }
    return FrameResult{};
}

} // namespace seatsense
