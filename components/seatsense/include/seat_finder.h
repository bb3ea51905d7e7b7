// Acquisition loop: bytes -> frame -> grid -> decision -> actuator.
//
// runOneCycle() performs exactly one step and is what tests drive; run() is a
// thin loop around it that honours requestStop() between cycles and always
// leaves the actuator inactive on exit.

#pragma once
#include "byte_source.h"
#include "display_sink.h"
#include "feedback_controller.h"
#include "frame_assembler.h"
#include "occupancy_detector.h"
#include "seat_finder_config.h"
#include "temperature_mapper.h"
#include <atomic>
#include <cstdint>
#include <vector>

namespace seatsense {

enum class CycleOutcome : uint8_t {
    FRAME_OK = 0,
    TRANSPORT_TIMEOUT, // nothing arrived before the deadline
    FRAME_INCOMPLETE,  // bytes arrived but no full frame; partial discarded
    CHECKSUM_FAILED
};

const char *cycleOutcomeName(CycleOutcome outcome);

class SeatFinder {
public:
    struct Statistics {
        uint32_t cycles = 0;
        uint32_t frames = 0;
        uint32_t transportTimeouts = 0;
        uint32_t incompleteFrames = 0;
        uint32_t checksumFailures = 0;
        float fps = 0.0f; // validated frames per second over the last report window
    };

    // display may be null. All references must outlive the SeatFinder.
    SeatFinder(const SeatFinderConfig &config, ByteSource &source, ActuatorDriver &actuator, Clock &clock,
               DisplaySink *display = nullptr);

    CycleOutcome runOneCycle();

    // Loops until requestStop(); releases the actuator before returning.
    void run();
    void requestStop() { stopFlag.store(true); }
    bool stopRequested() const { return stopFlag.load(); }

    const DetectionState &state() const { return detection; }
    const Statistics &statistics() const { return stats; }
    const FrameAssembler::Statistics &frameStatistics() const { return assembler.statistics(); }

private:
    const SeatFinderConfig cfg;
    ByteSource &source;
    ActuatorDriver &actuator;
    Clock &clock;
    DisplaySink *display;

    FrameAssembler assembler;
    TemperatureMapper mapper;
    OccupancyDetector detector;
    FeedbackController feedback;

    DetectionState detection;
    Statistics stats;
    std::vector<uint8_t> chunk;
    std::atomic<bool> stopFlag{false};

    // FPS reporting
    uint32_t windowStartMs = 0;
    uint32_t windowFrames = 0;
    static constexpr uint32_t REPORT_INTERVAL_MS = 5000;

    CycleOutcome acquire(std::optional<ValidatedFrame> &frame);
    void updateRate();
};

} // namespace seatsense
