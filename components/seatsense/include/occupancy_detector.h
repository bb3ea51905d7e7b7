#pragma once
#include "seat_finder_config.h"
#include "temperature_grid.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace seatsense {

enum class Occupancy : uint8_t {
    UNKNOWN = 0,
    VACANT = 1,
    OCCUPIED = 2
};

const char *occupancyName(Occupancy occupancy);

// Carried across cycles. Only OccupancyDetector produces new values.
struct DetectionState {
    Occupancy classification = Occupancy::UNKNOWN; // emitted, debounced
    std::optional<Cell> focal;                      // hottest qualifying cell of the last grid
    float confidence = 0.0f;                        // qualifying cells / grid size

    // Hysteresis bookkeeping
    Occupancy candidate = Occupancy::UNKNOWN; // raw classification of the current run
    uint16_t agreement = 0;                   // length of that run (capped at hysteresisFrames)
    uint16_t lossCount = 0;                   // consecutive lost cycles

    // Last grid, for logging
    Occupancy rawClassification = Occupancy::UNKNOWN;
    uint16_t qualifyingCount = 0;
    float baseline = 0.0f;
};

class OccupancyDetector {
public:
    explicit OccupancyDetector(const SeatFinderConfig &config) : cfg(config) {}

    DetectionState detect(const TemperatureGrid &grid, const DetectionState &prior) const;

    // A cycle ended without a validated frame.
    DetectionState frameLost(const DetectionState &prior) const;

    // Median of values (mean of the two middle values for an even count).
    static float median(std::vector<float> values);

private:
    const SeatFinderConfig cfg;
};

} // namespace seatsense
