#include "haptic_actuator.h"
#include "esp_log.h"

static const char *TAG = "haptic";

static const uint32_t MAX_DUTY = (1u << SEATSENSE_HAPTIC_DUTY_BITS) - 1;

HapticActuator::HapticActuator(int gpio, ledc_channel_t channel, ledc_timer_t timer)
    : gpio(gpio), channel(channel), timer(timer) {}

esp_err_t HapticActuator::begin() {
    ledc_timer_config_t timer_config = {
        .speed_mode = LEDC_LOW_SPEED_MODE,
        .duty_resolution = SEATSENSE_HAPTIC_DUTY_BITS,
        .timer_num = timer,
        .freq_hz = SEATSENSE_HAPTIC_PWM_FREQ_HZ,
        .clk_cfg = LEDC_AUTO_CLK,
    };
    esp_err_t err = ledc_timer_config(&timer_config);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "ledc_timer_config failed: %s", esp_err_to_name(err));
        return err;
    }
    ledc_channel_config_t channel_config = {
        .gpio_num = gpio,
        .speed_mode = LEDC_LOW_SPEED_MODE,
        .channel = channel,
        .intr_type = LEDC_INTR_DISABLE,
        .timer_sel = timer,
        .duty = 0, // motor off initially
        .hpoint = 0,
    };
    err = ledc_channel_config(&channel_config);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "ledc_channel_config(GPIO%d) failed: %s", gpio, esp_err_to_name(err));
        return err;
    }
    ready = true;
    duty = 0;
    ESP_LOGI(TAG, "Vibration motor on GPIO%d", gpio);
    return ESP_OK;
}

void HapticActuator::setCommand(const seatsense::ActuatorCommand &command) {
    if (!ready) {
        ESP_LOGW(TAG, "setCommand() called before begin()");
        return;
    }
    float level = command.active ? command.intensity : 0.0f;
    if (level < 0.0f) level = 0.0f;
    if (level > 1.0f) level = 1.0f;
    uint32_t target = (uint32_t)(level * (float)MAX_DUTY + 0.5f);
    if (target == duty) return;

    esp_err_t err = ledc_set_duty(LEDC_LOW_SPEED_MODE, channel, target);
    if (err == ESP_OK) err = ledc_update_duty(LEDC_LOW_SPEED_MODE, channel);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to set duty %u: %s", (unsigned)target, esp_err_to_name(err));
        return;
    }
    ESP_LOGD(TAG, "Duty %u -> %u", (unsigned)duty, (unsigned)target);
    duty = target;
}
