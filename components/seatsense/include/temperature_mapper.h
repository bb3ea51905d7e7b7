#pragma once
#include "frame_assembler.h"
#include "seat_finder_config.h"
#include "temperature_grid.h"

namespace seatsense {

// Converts validated payloads into calibrated grids.
// map() cannot fail: the payload size is fixed by the assembler and the
// transform is a plain multiply-add.
class TemperatureMapper {
public:
    explicit TemperatureMapper(const SeatFinderConfig &config) : cfg(config) {}

    TemperatureGrid map(const ValidatedFrame &frame) const;

    static GridStats computeStats(const TemperatureGrid &grid, float displayMin, float displayMax);

private:
    const SeatFinderConfig cfg;

    float toCelsius(const uint8_t *word) const;
};

} // namespace seatsense
