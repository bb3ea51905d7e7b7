#include "temperature_mapper.h"
#include "esp_log.h"
#include <algorithm>

static const char *TAG = "temp_map";

namespace seatsense {

float TemperatureMapper::toCelsius(const uint8_t *word) const {
    int32_t raw;
    if (cfg.layout.wordSize == 1) {
        raw = cfg.signedWords ? (int32_t)(int8_t)word[0] : (int32_t)word[0];
    } else {
        uint16_t u = (uint16_t)(word[0] | (word[1] << 8));
        raw = cfg.signedWords ? (int32_t)(int16_t)u : (int32_t)u;
    }
    return (float)raw * cfg.scale + cfg.offset;
}

TemperatureGrid TemperatureMapper::map(const ValidatedFrame &frame) const {
    const FrameLayout &layout = cfg.layout;
    const size_t n = layout.pixelCount();
    const uint8_t *p = frame.data();

    std::vector<float> values(n);
    for (size_t i = 0; i < n; i++) {
        values[i] = toCelsius(p + i * layout.wordSize);
    }

    std::optional<float> dieTemp;
    if (layout.trailerSize == 2) {
        const uint8_t *t = p + n * layout.wordSize;
        uint16_t u = (uint16_t)(t[0] | (t[1] << 8));
        int32_t raw = cfg.signedWords ? (int32_t)(int16_t)u : (int32_t)u;
        dieTemp = (float)raw * cfg.scale + cfg.offset;
        ESP_LOGD(TAG, "Sensor board temperature: %.2f C", (double)*dieTemp);
    }
    return TemperatureGrid(layout.rows, layout.cols, std::move(values), dieTemp);
}

GridStats TemperatureMapper::computeStats(const TemperatureGrid &grid, float displayMin, float displayMax) {
    GridStats s;
    s.minTemp = displayMax;
    s.maxTemp = displayMin;
    s.hottestTemp = grid.at((size_t)0);
    for (uint16_t r = 0; r < grid.rows(); r++) {
        for (uint16_t c = 0; c < grid.cols(); c++) {
            float t = grid.at(r, c);
            if (t < s.minTemp) s.minTemp = std::max(t, displayMin);
            if (t > s.maxTemp) s.maxTemp = std::min(t, displayMax);
            if (t > s.hottestTemp) {
                s.hottestTemp = t;
                s.hottest = Cell{r, c};
            }
        }
    }
    if (s.maxTemp <= s.minTemp) s.maxTemp = s.minTemp + 1.0f; // flat frame
    s.centerTemp = grid.at((uint16_t)(grid.rows() / 2), (uint16_t)(grid.cols() / 2));
    return s;
}

} // namespace seatsense
