#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace seatsense {

struct Cell {
    uint16_t row = 0;
    uint16_t col = 0;

    bool operator==(const Cell &other) const { return row == other.row && col == other.col; }
    bool operator!=(const Cell &other) const { return !(*this == other); }
};

// Calibrated temperatures in degC, row-major. Always fully populated.
class TemperatureGrid {
public:
    TemperatureGrid(uint16_t rows, uint16_t cols, std::vector<float> values,
                    std::optional<float> sensorTemp = std::nullopt)
        : nRows(rows), nCols(cols), cells(std::move(values)), dieTemp(sensorTemp) {}

    uint16_t rows() const { return nRows; }
    uint16_t cols() const { return nCols; }
    size_t size() const { return cells.size(); }

    float at(uint16_t row, uint16_t col) const { return cells[(size_t)row * nCols + col]; }
    float at(size_t index) const { return cells[index]; }
    const std::vector<float> &values() const { return cells; }

    // Module die temperature from the frame trailer, if the layout has one.
    std::optional<float> sensorTemperature() const { return dieTemp; }

private:
    uint16_t nRows;
    uint16_t nCols;
    std::vector<float> cells;
    std::optional<float> dieTemp;
};

// Display-side summary. min/max are clamped to the display limits and
// never equal, so they can be used directly as a colour scale.
struct GridStats {
    float minTemp = 0.0f;
    float maxTemp = 1.0f;
    float centerTemp = 0.0f;
    Cell hottest;
    float hottestTemp = 0.0f;
};

} // namespace seatsense
