#include "occupancy_detector.h"
#include "esp_log.h"
#include <algorithm>

static const char *TAG = "occupancy";

namespace seatsense {

const char *occupancyName(Occupancy occupancy) {
    switch (occupancy) {
        case Occupancy::UNKNOWN: return "unknown";
        case Occupancy::VACANT: return "vacant";
        case Occupancy::OCCUPIED: return "occupied";
    }
    return "invalid";
}

float OccupancyDetector::median(std::vector<float> values) {
    if (values.empty()) return 0.0f;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    float upper = values[mid];
    if (values.size() % 2) return upper;
    float lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0f;
}

DetectionState OccupancyDetector::detect(const TemperatureGrid &grid, const DetectionState &prior) const {
    DetectionState next = prior;
    next.lossCount = 0;

    const float baseline = median(grid.values());
    uint16_t count = 0;
    std::optional<Cell> focal;
    float focalTemp = 0.0f;
    // Row-major scan with strict '>' keeps the smallest (row, col) on ties
    for (uint16_t r = 0; r < grid.rows(); r++) {
        for (uint16_t c = 0; c < grid.cols(); c++) {
            float t = grid.at(r, c);
            if (t - baseline < cfg.occupiedTempDelta) continue;
            count++;
            if (!focal || t > focalTemp) {
                focal = Cell{r, c};
                focalTemp = t;
            }
        }
    }

    const Occupancy raw = (count >= cfg.minOccupiedPixelCount) ? Occupancy::OCCUPIED : Occupancy::VACANT;
    next.rawClassification = raw;
    next.qualifyingCount = count;
    next.baseline = baseline;
    next.focal = focal;
    next.confidence = grid.size() ? std::clamp((float)count / (float)grid.size(), 0.0f, 1.0f) : 0.0f;

    if (prior.agreement > 0 && raw == prior.candidate) {
        next.agreement = std::min<uint16_t>((uint16_t)(prior.agreement + 1), cfg.hysteresisFrames);
    } else {
        next.candidate = raw;
        next.agreement = 1;
    }

    if (next.classification != raw && next.agreement >= cfg.hysteresisFrames) {
        ESP_LOGI(TAG, "Seat %s -> %s (%u hot cells, baseline %.1f C)", occupancyName(next.classification),
                 occupancyName(raw), (unsigned)count, (double)baseline);
        next.classification = raw;
    } else {
        ESP_LOGV(TAG, "raw=%s emitted=%s run=%u/%u", occupancyName(raw), occupancyName(next.classification),
                 (unsigned)next.agreement, (unsigned)cfg.hysteresisFrames);
    }
    return next;
}

DetectionState OccupancyDetector::frameLost(const DetectionState &prior) const {
    DetectionState next = prior;
    if (next.lossCount < 0xFFFF) next.lossCount++;
    if (next.lossCount < cfg.lossThreshold) return next;

    if (prior.classification != Occupancy::UNKNOWN) {
        ESP_LOGW(TAG, "Sensor silent for %u cycles, state %s -> unknown", (unsigned)next.lossCount,
                 occupancyName(prior.classification));
    }
    next.classification = Occupancy::UNKNOWN;
    next.focal.reset();
    next.confidence = 0.0f;
    next.candidate = Occupancy::UNKNOWN;
    next.agreement = 0;
    next.rawClassification = Occupancy::UNKNOWN;
    next.qualifyingCount = 0;
    return next;
}

} // namespace seatsense
