#pragma once
#include "temperature_grid.h"
#include <cstdio>

namespace seatsense {

// Read-only consumer of each grid. Fire and forget: nothing it does feeds
// back into detection, and implementations must not throw.
class DisplaySink {
public:
    virtual ~DisplaySink() = default;
    virtual void render(const TemperatureGrid &grid, const GridStats &stats) = 0;
};

// Prints a character heat map scaled between stats.minTemp and stats.maxTemp,
// with the centre and hottest temperatures underneath.
class TextDisplaySink : public DisplaySink {
public:
    explicit TextDisplaySink(FILE *out = stdout, bool markHottest = true) : out(out), markHottest(markHottest) {}

    void render(const TemperatureGrid &grid, const GridStats &stats) override;

private:
    FILE *out;
    bool markHottest;
};

} // namespace seatsense
