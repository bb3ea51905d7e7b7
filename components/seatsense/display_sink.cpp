#include "display_sink.h"
#include <string>

namespace seatsense {

static const char RAMP[] = " .:-=+*#%@";
static const int RAMP_LEN = sizeof(RAMP) - 1;

void TextDisplaySink::render(const TemperatureGrid &grid, const GridStats &stats) {
    if (!out) return;
    const float span = stats.maxTemp - stats.minTemp;
    std::string line;
    line.reserve(grid.cols() + 1);
    for (uint16_t r = 0; r < grid.rows(); r++) {
        line.clear();
        for (uint16_t c = 0; c < grid.cols(); c++) {
            if (markHottest && stats.hottest == Cell{r, c}) {
                line += 'X';
                continue;
            }
            int level = (int)((grid.at(r, c) - stats.minTemp) / span * (RAMP_LEN - 1) + 0.5f);
            if (level < 0) level = 0;
            if (level >= RAMP_LEN) level = RAMP_LEN - 1;
            line += RAMP[level];
        }
        line += '\n';
        fputs(line.c_str(), out);
    }
    fprintf(out, "center %.1fC  max %.1fC at (%u,%u)  range %.1f..%.1fC\n", (double)stats.centerTemp,
            (double)stats.hottestTemp, (unsigned)stats.hottest.row, (unsigned)stats.hottest.col,
            (double)stats.minTemp, (double)stats.maxTemp);
    fflush(out);
}

} // namespace seatsense
