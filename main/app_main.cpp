#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "haptic_actuator.h"
#include "seat_finder.h"
#include "uart_byte_source.h"

// MLX90640 module on UART1. Default pins for UART1 on many ESP32-C6 boards:
// TX: GPIO2 (-> module RX)
// RX: GPIO3 (<- module TX)
#define SEATSENSE_UART_NUM UART_NUM_1
#define SEATSENSE_TX_PIN 2
#define SEATSENSE_RX_PIN 3
#define SEATSENSE_MOTOR_PIN 15

#define SEATSENSE_TASK_STACK 8192
#define SEATSENSE_TASK_PRIORITY 5

static const char *TAG = "seatsense";

class EspTimerClock : public seatsense::Clock {
public:
    uint32_t nowMs() override { return (uint32_t)(esp_timer_get_time() / 1000ULL); }
};

static seatsense::SeatFinderConfig s_config;
static UartByteSource *s_sensor = nullptr;
static HapticActuator *s_motor = nullptr;
static EspTimerClock s_clock;
static seatsense::SeatFinder *s_finder = nullptr;

static void seat_finder_task(void *arg) {
    seatsense::SeatFinder *finder = static_cast<seatsense::SeatFinder *>(arg);
    finder->run();
    vTaskDelete(NULL);
}

extern "C" void app_main(void) {
    ESP_LOGI(TAG, "Initializing thermal seat finder.");

    // Configuration errors stop here, before anything is driven
    ESP_ERROR_CHECK(s_config.validate());

    s_motor = new HapticActuator(SEATSENSE_MOTOR_PIN);
    ESP_ERROR_CHECK(s_motor->begin());

    // Give the sensor a moment to power up fully before communication.
    vTaskDelay(pdMS_TO_TICKS(500));

    s_sensor = new UartByteSource(SEATSENSE_UART_NUM, SEATSENSE_TX_PIN, SEATSENSE_RX_PIN);
    ESP_ERROR_CHECK(s_sensor->begin());
    s_sensor->flush();

    // The LCD pipeline is not part of this build; nothing is rendered
    s_finder = new seatsense::SeatFinder(s_config, *s_sensor, *s_motor, s_clock, nullptr);

    ESP_LOGI(TAG, "Frame %u bytes, delta %.1f C, >= %u hot cells, hysteresis %u, loss threshold %u",
             (unsigned)s_config.frameSize(), (double)s_config.occupiedTempDelta,
             (unsigned)s_config.minOccupiedPixelCount, (unsigned)s_config.hysteresisFrames,
             (unsigned)s_config.lossThreshold);

    if (xTaskCreate(seat_finder_task, "seat_finder", SEATSENSE_TASK_STACK, s_finder, SEATSENSE_TASK_PRIORITY,
                    NULL) != pdPASS) {
        ESP_LOGE(TAG, "Could not start seat finder task");
        s_motor->setCommand(seatsense::ActuatorCommand{});
    }
}
