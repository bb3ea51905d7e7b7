// ESP-IDF UART transport for the MLX90640 module (GY-MCU90640 protocol).

#pragma once
#include "byte_source.h"
#include "driver/uart.h"
#include "esp_err.h"
#include <cstdint>

#define SEATSENSE_SENSOR_BAUD_RATE 115200
#define SEATSENSE_UART_RX_BUFFER 4096

class UartByteSource : public seatsense::ByteSource {
public:
    UartByteSource(uart_port_t uart_num, int tx_pin, int rx_pin, bool debug = false);
    ~UartByteSource() override;

    // Configures and installs the UART driver.
    esp_err_t begin();
    void end();

    int read(uint8_t *buf, size_t maxBytes, uint32_t timeoutMs) override;

    // Drops anything the module sent before we were ready to parse it.
    void flush();

private:
    uart_port_t uart_num;
    int tx_pin;
    int rx_pin;
    bool debug_mode = false;
    bool installed = false;

    void debugHex(const uint8_t *buf, size_t len, const char *prefix = nullptr);
};
