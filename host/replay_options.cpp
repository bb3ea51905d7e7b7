#include "replay_options.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

bool parseUnsigned(const char *text, unsigned long max, unsigned long &out) {
    // strtoul would accept "-1" and wrap it
    if (!text || !isdigit((unsigned char)text[0])) return false;
    errno = 0;
    char *end = nullptr;
    unsigned long value = strtoul(text, &end, 10);
    if (errno == ERANGE || *end != '\0' || value > max) return false;
    out = value;
    return true;
}

bool parseFloat(const char *text, float &out) {
    if (!text || !*text) return false;
    errno = 0;
    char *end = nullptr;
    float value = strtof(text, &end);
    if (errno == ERANGE || *end != '\0' || !std::isfinite(value)) return false;
    out = value;
    return true;
}

bool parseChecksumPolicy(const char *name, seatsense::ChecksumPolicy &out) {
    using seatsense::ChecksumPolicy;
    const ChecksumPolicy all[] = {ChecksumPolicy::ADDITIVE16_FRAME, ChecksumPolicy::ADDITIVE16_PAYLOAD,
                                  ChecksumPolicy::ADDITIVE8_PAYLOAD};
    if (!name) return false;
    for (ChecksumPolicy p : all) {
        if (strcmp(name, seatsense::checksumPolicyName(p)) == 0) {
            out = p;
            return true;
        }
    }
    return false;
}
