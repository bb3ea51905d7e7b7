#include "seat_finder.h"
#include "esp_log.h"

static const char *TAG = "seat_finder";

namespace seatsense {

const char *cycleOutcomeName(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::FRAME_OK: return "frame ok";
        case CycleOutcome::TRANSPORT_TIMEOUT: return "transport timeout";
        case CycleOutcome::FRAME_INCOMPLETE: return "frame incomplete";
        case CycleOutcome::CHECKSUM_FAILED: return "checksum failed";
    }
    return "invalid";
}

SeatFinder::SeatFinder(const SeatFinderConfig &config, ByteSource &source, ActuatorDriver &actuator, Clock &clock,
                       DisplaySink *display)
    : cfg(config), source(source), actuator(actuator), clock(clock), display(display), assembler(config),
      mapper(config), detector(config), feedback(config), chunk(config.readChunkSize) {
    windowStartMs = clock.nowMs();
}

CycleOutcome SeatFinder::acquire(std::optional<ValidatedFrame> &frame) {
    // A previous read may already hold the next frame
    FrameResult r = assembler.ingest(nullptr, 0);
    if (r.status == FrameStatus::VALIDATED) {
        frame = std::move(r.frame);
        return CycleOutcome::FRAME_OK;
    }
    if (r.status == FrameStatus::CHECKSUM_FAILED) return CycleOutcome::CHECKSUM_FAILED;

    const uint32_t start = clock.nowMs();
    bool received = false;
    for (;;) {
        uint32_t elapsed = clock.nowMs() - start;
        if (elapsed >= cfg.frameTimeoutMs) break;
        int n = source.read(chunk.data(), chunk.size(), cfg.frameTimeoutMs - elapsed);
        if (n < 0) {
            ESP_LOGW(TAG, "Transport read error (%d)", n);
            break;
        }
        if (n == 0) continue;
        received = true;
        r = assembler.ingest(chunk.data(), (size_t)n);
        ESP_LOGV(TAG, "%d bytes in: %s, %u buffered", n, frameStatusName(r.status), (unsigned)assembler.buffered());
        if (r.status == FrameStatus::VALIDATED) {
            frame = std::move(r.frame);
            return CycleOutcome::FRAME_OK;
        }
        if (r.status == FrameStatus::CHECKSUM_FAILED) return CycleOutcome::CHECKSUM_FAILED;
    }

    // Never carry a partial frame past a timeout
    received = received || assembler.buffered() > 0;
    assembler.abandon();
    return received ? CycleOutcome::FRAME_INCOMPLETE : CycleOutcome::TRANSPORT_TIMEOUT;
}

CycleOutcome SeatFinder::runOneCycle() {
    std::optional<ValidatedFrame> frame;
    CycleOutcome outcome = acquire(frame);
    stats.cycles++;

    switch (outcome) {
        case CycleOutcome::FRAME_OK: {
            TemperatureGrid grid = mapper.map(*frame);
            detection = detector.detect(grid, detection);
            feedback.apply(detection, actuator);
            if (display) {
                display->render(grid, TemperatureMapper::computeStats(grid, cfg.displayMinTemp, cfg.displayMaxTemp));
            }
            stats.frames++;
            windowFrames++;
            break;
        }
        case CycleOutcome::TRANSPORT_TIMEOUT:
            stats.transportTimeouts++;
            break;
        case CycleOutcome::FRAME_INCOMPLETE:
            ESP_LOGD(TAG, "Incomplete frame received.");
            stats.incompleteFrames++;
            break;
        case CycleOutcome::CHECKSUM_FAILED:
            ESP_LOGD(TAG, "Checksum mismatch.");
            stats.checksumFailures++;
            break;
    }
    if (outcome != CycleOutcome::FRAME_OK) {
        detection = detector.frameLost(detection);
        feedback.apply(detection, actuator);
    }
    updateRate();
    return outcome;
}

void SeatFinder::updateRate() {
    uint32_t now = clock.nowMs();
    uint32_t elapsed = now - windowStartMs;
    if (elapsed < REPORT_INTERVAL_MS) return;
    stats.fps = (float)windowFrames * 1000.0f / (float)elapsed;
    const FrameAssembler::Statistics &fs = assembler.statistics();
    ESP_LOGI(TAG, "%.1f FPS, state=%s, frames=%u timeouts=%u incomplete=%u checksum=%u resyncs=%u",
             (double)stats.fps, occupancyName(detection.classification), (unsigned)stats.frames,
             (unsigned)stats.transportTimeouts, (unsigned)stats.incompleteFrames, (unsigned)stats.checksumFailures,
             (unsigned)fs.resyncs);
    windowStartMs = now;
    windowFrames = 0;
}

void SeatFinder::run() {
    ESP_LOGI(TAG, "Starting: %ux%u grid, %u-byte frames, checksum %s", (unsigned)cfg.layout.cols,
             (unsigned)cfg.layout.rows, (unsigned)cfg.frameSize(), checksumPolicyName(cfg.checksum));
    feedback.release(actuator);
    while (!stopFlag.load()) {
        runOneCycle();
    }
    feedback.release(actuator);
    ESP_LOGI(TAG, "Stopped after %u cycles, actuator released", (unsigned)stats.cycles);
}

} // namespace seatsense
