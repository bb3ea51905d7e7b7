#include "posix_byte_source.h"
#include "esp_log.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

static const char *TAG = "posix_src";

static speed_t baudToSpeed(uint32_t baud) {
    switch (baud) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        case 460800: return B460800;
        default: return 0;
    }
}

PosixByteSource::PosixByteSource(const std::string &path, uint32_t baud) : path(path), baud(baud) {}

PosixByteSource::~PosixByteSource() { close(); }

esp_err_t PosixByteSource::open() {
    if (fd >= 0) return ESP_OK;
    fd = ::open(path.c_str(), O_RDONLY | O_NOCTTY);
    if (fd < 0) {
        ESP_LOGE(TAG, "Cannot open %s: %s", path.c_str(), strerror(errno));
        return ESP_FAIL;
    }
    atEof = false;
    if (baud && isatty(fd)) {
        esp_err_t err = configureTty();
        if (err != ESP_OK) {
            close();
            return err;
        }
    }
    ESP_LOGI(TAG, "Reading %s", path.c_str());
    return ESP_OK;
}

esp_err_t PosixByteSource::configureTty() {
    speed_t speed = baudToSpeed(baud);
    if (!speed) {
        ESP_LOGE(TAG, "Unsupported baud rate %u", (unsigned)baud);
        return ESP_ERR_INVALID_ARG;
    }
    struct termios tio;
    if (tcgetattr(fd, &tio) != 0) {
        ESP_LOGE(TAG, "tcgetattr(%s): %s", path.c_str(), strerror(errno));
        return ESP_FAIL;
    }
    cfmakeraw(&tio);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        ESP_LOGE(TAG, "tcsetattr(%s): %s", path.c_str(), strerror(errno));
        return ESP_FAIL;
    }
    tcflush(fd, TCIFLUSH);
    return ESP_OK;
}

void PosixByteSource::close() {
    if (fd < 0) return;
    ::close(fd);
    fd = -1;
}

int PosixByteSource::read(uint8_t *buf, size_t maxBytes, uint32_t timeoutMs) {
    if (fd < 0 || atEof) return -1;
    struct pollfd pfd = {fd, POLLIN, 0};
    int ready = poll(&pfd, 1, (int)timeoutMs);
    if (ready < 0) {
        if (errno == EINTR) return 0;
        ESP_LOGE(TAG, "poll(%s): %s", path.c_str(), strerror(errno));
        return -1;
    }
    if (ready == 0) return 0;

    ssize_t n = ::read(fd, buf, maxBytes);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return 0;
        ESP_LOGE(TAG, "read(%s): %s", path.c_str(), strerror(errno));
        return -1;
    }
    if (n == 0 && !isatty(fd)) {
        ESP_LOGI(TAG, "End of input on %s", path.c_str());
        atEof = true;
    }
    return (int)n;
}
