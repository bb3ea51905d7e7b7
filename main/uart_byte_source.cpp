#include "uart_byte_source.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include <iomanip>
#include <sstream>

static const char *TAG = "uart_src";

UartByteSource::UartByteSource(uart_port_t uart_num, int tx_pin, int rx_pin, bool debug)
    : uart_num(uart_num), tx_pin(tx_pin), rx_pin(rx_pin), debug_mode(debug) {}

UartByteSource::~UartByteSource() { end(); }

esp_err_t UartByteSource::begin() {
    if (installed) return ESP_OK;
    uart_config_t uart_config = {
        .baud_rate = SEATSENSE_SENSOR_BAUD_RATE,
        .data_bits = UART_DATA_8_BITS,
        .parity    = UART_PARITY_DISABLE,
        .stop_bits = UART_STOP_BITS_1,
        .flow_ctrl = UART_HW_FLOWCTRL_DISABLE,
        .source_clk = UART_SCLK_DEFAULT,
    };
    esp_err_t err = uart_param_config(uart_num, &uart_config);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "uart_param_config failed: %s", esp_err_to_name(err));
        return err;
    }
    err = uart_set_pin(uart_num, tx_pin, rx_pin, UART_PIN_NO_CHANGE, UART_PIN_NO_CHANGE);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "uart_set_pin(tx=%d, rx=%d) failed: %s", tx_pin, rx_pin, esp_err_to_name(err));
        return err;
    }
    // One full frame is 1544 bytes; leave room for a second while the loop is busy
    err = uart_driver_install(uart_num, SEATSENSE_UART_RX_BUFFER, 0, 0, NULL, 0);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "uart_driver_install failed: %s", esp_err_to_name(err));
        return err;
    }
    installed = true;
    ESP_LOGI(TAG, "UART%d ready at %d baud (TX GPIO%d, RX GPIO%d)", (int)uart_num, SEATSENSE_SENSOR_BAUD_RATE,
             tx_pin, rx_pin);
    return ESP_OK;
}

void UartByteSource::end() {
    if (!installed) return;
    esp_err_t err = uart_driver_delete(uart_num);
    if (err != ESP_OK) ESP_LOGW(TAG, "uart_driver_delete failed: %s", esp_err_to_name(err));
    installed = false;
}

void UartByteSource::flush() {
    if (!installed) return;
    esp_err_t err = uart_flush_input(uart_num);
    if (err != ESP_OK) ESP_LOGW(TAG, "uart_flush_input failed: %s", esp_err_to_name(err));
}

void UartByteSource::debugHex(const uint8_t *buf, size_t len, const char *prefix) {
    if (!debug_mode) return;
    if (prefix) ESP_LOGI(TAG, "%s (%d bytes)", prefix, (int)len);
    std::stringstream ss;
    for (size_t i = 0; i < len && i < 32; i++) {
        ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << (int)buf[i] << ' ';
    }
    if (len > 32) ss << "...";
    ESP_LOGI(TAG, "%s", ss.str().c_str());
}

int UartByteSource::read(uint8_t *buf, size_t maxBytes, uint32_t timeoutMs) {
    if (!installed) return -1;
    size_t available = 0;
    if (uart_get_buffered_data_len(uart_num, &available) == ESP_OK && available > 0) {
        // Take what is already here without waiting for maxBytes
        if (available < maxBytes) maxBytes = available;
        timeoutMs = 0;
    } else {
        // Block for the first bytes only
        maxBytes = 1;
    }
    int r = uart_read_bytes(uart_num, buf, (uint32_t)maxBytes, pdMS_TO_TICKS(timeoutMs));
    if (r > 0) debugHex(buf, (size_t)r, "RX");
    return r;
}
