// Command-line value parsing for seatsense_replay. Each parser leaves out
// untouched and returns false on malformed or out-of-range input.

#pragma once
#include "seat_finder_config.h"

// Base-10 unsigned value in 0..max. Signs, trailing text and overflow are rejected.
bool parseUnsigned(const char *text, unsigned long max, unsigned long &out);

bool parseFloat(const char *text, float &out);

// Accepts the names printed by checksumPolicyName().
bool parseChecksumPolicy(const char *name, seatsense::ChecksumPolicy &out);
