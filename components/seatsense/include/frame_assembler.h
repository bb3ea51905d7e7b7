// Reassembles sensor frames from an unaligned UART byte stream.
//
// Wire layout (defaults in brackets):
//   [0..1]  start marker                  0x5A 0x5A
//   [2..3]  declared data length (LE)     payload size (0x0602)
//   [4..]   payload: pixel words (LE, row-major), then the die temperature word
//   [end]   check field (LE), size given by the checksum policy
//
// The assembler never assumes alignment: it scans for the start marker, checks
// the declared length and verifies the check field before anything is emitted.

#pragma once
#include "seat_finder_config.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace seatsense {

// Payload region of a frame that passed the integrity check (header and check
// field stripped). Immutable once produced.
class ValidatedFrame {
public:
    ValidatedFrame(const uint8_t *payload, size_t len) : bytes(payload, payload + len) {}

    const uint8_t *data() const { return bytes.data(); }
    size_t size() const { return bytes.size(); }
    const std::vector<uint8_t> &payload() const { return bytes; }

private:
    std::vector<uint8_t> bytes;
};

enum class FrameStatus : uint8_t {
    INCOMPLETE = 0,  // not enough bytes yet, or a partial frame was abandoned
    VALIDATED,
    CHECKSUM_FAILED,
    RESYNCED         // bytes were skipped to realign on a start marker
};

const char *frameStatusName(FrameStatus status);

struct FrameResult {
    FrameStatus status = FrameStatus::INCOMPLETE;
    std::optional<ValidatedFrame> frame; // set only for VALIDATED
};

class FrameAssembler {
public:
    struct Statistics {
        uint32_t validatedFrames = 0;
        uint32_t checksumFailures = 0;
        uint32_t resyncs = 0;
        uint32_t abandonedPartials = 0;
        uint32_t discardedBytes = 0;
    };

    explicit FrameAssembler(const SeatFinderConfig &config);

    // Appends len bytes (may be 0) and resolves at most one frame.
    // Bytes beyond a resolved frame stay buffered; call ingest(nullptr, 0)
    // to resolve the next one.
    FrameResult ingest(const uint8_t *data, size_t len);

    // Caller-imposed timeout: drops any partial accumulation.
    FrameResult abandon();

    size_t buffered() const { return buf.size(); }
    size_t frameSize() const { return frameLen; }
    const Statistics &statistics() const { return stats; }

    // Check value over a complete frame (header first, check field excluded).
    static uint16_t computeCheck(const SeatFinderConfig &config, const uint8_t *frame);

private:
    const SeatFinderConfig cfg;
    size_t frameLen;
    std::vector<uint8_t> buf;
    Statistics stats;

    size_t alignToMarker();
    uint16_t receivedCheck() const;
};

} // namespace seatsense
