#pragma once
#include "occupancy_detector.h"
#include "seat_finder_config.h"
#include <optional>

namespace seatsense {

struct ActuatorCommand {
    bool active = false;
    float intensity = 0.0f; // 0..1, ignored when inactive

    bool operator==(const ActuatorCommand &other) const {
        return active == other.active && intensity == other.intensity;
    }
    bool operator!=(const ActuatorCommand &other) const { return !(*this == other); }
};

// Haptic output. setCommand() takes effect before the next call; calls are never concurrent.
class ActuatorDriver {
public:
    virtual ~ActuatorDriver() = default;
    virtual void setCommand(const ActuatorCommand &command) = 0;
};

class FeedbackController {
public:
    explicit FeedbackController(const SeatFinderConfig &config) : cfg(config) {}

    // OCCUPIED and UNKNOWN never vibrate. VACANT vibrates harder the fewer hot cells remain.
    ActuatorCommand translate(const DetectionState &state) const;

    // Issues translate(state) only if it differs from the last issued command
    // (active flag flipped, or intensity moved by at least the deadband).
    // Returns true when the driver was called.
    bool apply(const DetectionState &state, ActuatorDriver &driver);

    // Unconditionally drives the actuator inactive.
    void release(ActuatorDriver &driver);

    const std::optional<ActuatorCommand> &lastIssued() const { return last; }

private:
    const SeatFinderConfig cfg;
    std::optional<ActuatorCommand> last;
};

} // namespace seatsense
