// Vibration motor driven by LEDC PWM. The output is a level (duty = intensity),
// so repeating a command never produces an extra pulse.

#pragma once
#include "driver/ledc.h"
#include "esp_err.h"
#include "feedback_controller.h"

#define SEATSENSE_HAPTIC_PWM_FREQ_HZ 5000
#define SEATSENSE_HAPTIC_DUTY_BITS LEDC_TIMER_10_BIT

class HapticActuator : public seatsense::ActuatorDriver {
public:
    HapticActuator(int gpio, ledc_channel_t channel = LEDC_CHANNEL_0, ledc_timer_t timer = LEDC_TIMER_0);

    // Configures the LEDC timer/channel with the motor off.
    esp_err_t begin();

    void setCommand(const seatsense::ActuatorCommand &command) override;

private:
    int gpio;
    ledc_channel_t channel;
    ledc_timer_t timer;
    bool ready = false;
    uint32_t duty = 0;
};
