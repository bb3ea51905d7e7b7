#include "feedback_controller.h"
#include "esp_log.h"
#include <algorithm>
#include <cmath>

static const char *TAG = "feedback";

namespace seatsense {

ActuatorCommand FeedbackController::translate(const DetectionState &state) const {
    ActuatorCommand cmd;
    if (state.classification != Occupancy::VACANT) return cmd;

    float vacancy = 1.0f - std::clamp(state.confidence, 0.0f, 1.0f);
    cmd.active = true;
    cmd.intensity = std::clamp(cfg.minIntensity + (1.0f - cfg.minIntensity) * vacancy, 0.0f, 1.0f);
    return cmd;
}

bool FeedbackController::apply(const DetectionState &state, ActuatorDriver &driver) {
    ActuatorCommand cmd = translate(state);
    if (last && last->active == cmd.active) {
        if (!cmd.active) return false;
        if (std::fabs(last->intensity - cmd.intensity) < cfg.intensityDeadband) return false;
    }
    ESP_LOGD(TAG, "Actuator %s intensity=%.2f", cmd.active ? "on" : "off", (double)cmd.intensity);
    driver.setCommand(cmd);
    last = cmd;
    return true;
}

void FeedbackController::release(ActuatorDriver &driver) {
    ActuatorCommand off;
    driver.setCommand(off);
    last = off;
}

} // namespace seatsense
