// Runs the seat finder pipeline on the host against a serial device or a
// recorded capture, printing each decision and actuator change.
//
//   seatsense_replay [-b baud] [-m] [-t delta] [-n pixels] [-y frames] [-l losses]
//                    [-c additive16-frame|additive16-payload|additive8-payload] <device|capture>

#include "esp_log.h"
#include "posix_byte_source.h"
#include "replay_options.h"
#include "seat_finder.h"
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <getopt.h>

static const char *TAG = "replay";

static seatsense::SeatFinder *s_finder = nullptr;

class SteadyClock : public seatsense::Clock {
public:
    uint32_t nowMs() override {
        using namespace std::chrono;
        return (uint32_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }
};

class ConsoleActuator : public seatsense::ActuatorDriver {
public:
    void setCommand(const seatsense::ActuatorCommand &command) override {
        if (command.active) {
            printf("actuator: VIBRATE intensity=%.2f\n", (double)command.intensity);
        } else {
            printf("actuator: off\n");
        }
    }
};

static void on_signal(int) {
    if (s_finder) s_finder->requestStop();
}

static void usage(const char *argv0) {
    fprintf(stderr,
            "usage: %s [-b baud] [-m] [-t delta] [-n pixels] [-y frames] [-l losses] [-c policy] <device|capture>\n"
            "  -b  serial baud rate (tty only, default 115200)\n"
            "  -m  print a heat map for every frame\n"
            "  -t  occupied temperature delta above median, degC\n"
            "  -n  minimum hot cells for occupied\n"
            "  -y  hysteresis frames\n"
            "  -l  lost cycles before unknown\n"
            "  -c  checksum policy\n",
            argv0);
}

static int bad_value(const char *argv0, int opt, const char *value) {
    fprintf(stderr, "invalid value '%s' for -%c\n", value, opt);
    usage(argv0);
    return 2;
}

int main(int argc, char **argv) {
    seatsense::SeatFinderConfig config;
    uint32_t baud = 115200;
    bool heatMap = false;

    int opt;
    unsigned long value = 0;
    while ((opt = getopt(argc, argv, "b:mt:n:y:l:c:h")) != -1) {
        switch (opt) {
            case 'b':
                if (!parseUnsigned(optarg, UINT32_MAX, value)) return bad_value(argv[0], opt, optarg);
                baud = (uint32_t)value;
                break;
            case 'm': heatMap = true; break;
            case 't':
                if (!parseFloat(optarg, config.occupiedTempDelta)) return bad_value(argv[0], opt, optarg);
                break;
            case 'n':
                if (!parseUnsigned(optarg, UINT16_MAX, value)) return bad_value(argv[0], opt, optarg);
                config.minOccupiedPixelCount = (uint16_t)value;
                break;
            case 'y':
                if (!parseUnsigned(optarg, UINT8_MAX, value)) return bad_value(argv[0], opt, optarg);
                config.hysteresisFrames = (uint8_t)value;
                break;
            case 'l':
                if (!parseUnsigned(optarg, UINT8_MAX, value)) return bad_value(argv[0], opt, optarg);
                config.lossThreshold = (uint8_t)value;
                break;
            case 'c':
                if (!parseChecksumPolicy(optarg, config.checksum)) return bad_value(argv[0], opt, optarg);
                break;
            default:
                usage(argv[0]);
                return opt == 'h' ? 0 : 2;
        }
    }
    if (optind != argc - 1) {
        usage(argv[0]);
        return 2;
    }
    if (config.validate() != ESP_OK) return 2;

    PosixByteSource source(argv[optind], baud);
    if (source.open() != ESP_OK) return 1;

    SteadyClock clock;
    ConsoleActuator actuator;
    seatsense::TextDisplaySink display(stdout);
    seatsense::SeatFinder finder(config, source, actuator, clock, heatMap ? &display : nullptr);
    s_finder = &finder;
    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);

    uint32_t frame = 0;
    while (!finder.stopRequested()) {
        seatsense::CycleOutcome outcome = finder.runOneCycle();
        const seatsense::DetectionState &st = finder.state();
        if (outcome == seatsense::CycleOutcome::FRAME_OK) {
            frame++;
            if (st.focal) {
                printf("frame %u: %s (raw %s) hot=%u baseline=%.1fC focal=(%u,%u) confidence=%.4f\n",
                       (unsigned)frame, seatsense::occupancyName(st.classification),
                       seatsense::occupancyName(st.rawClassification), (unsigned)st.qualifyingCount,
                       (double)st.baseline, (unsigned)st.focal->row, (unsigned)st.focal->col,
                       (double)st.confidence);
            } else {
                printf("frame %u: %s (raw %s) hot=0 baseline=%.1fC\n", (unsigned)frame,
                       seatsense::occupancyName(st.classification), seatsense::occupancyName(st.rawClassification),
                       (double)st.baseline);
            }
        } else {
            printf("cycle: %s, state %s (%u lost)\n", seatsense::cycleOutcomeName(outcome),
                   seatsense::occupancyName(st.classification), (unsigned)st.lossCount);
            if (source.eof()) break;
        }
    }

    // Leave the (console) actuator in the inactive state
    actuator.setCommand(seatsense::ActuatorCommand{});
    s_finder = nullptr;

    const seatsense::SeatFinder::Statistics &stats = finder.statistics();
    const seatsense::FrameAssembler::Statistics &fs = finder.frameStatistics();
    ESP_LOGI(TAG, "%u frames, %u checksum failures, %u incomplete, %u timeouts, %u resyncs, %u bytes discarded",
             (unsigned)stats.frames, (unsigned)stats.checksumFailures, (unsigned)stats.incompleteFrames,
             (unsigned)stats.transportTimeouts, (unsigned)fs.resyncs, (unsigned)fs.discardedBytes);
    return 0;
}
