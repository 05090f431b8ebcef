/*
 * UTC Clock Implementation
 */

#include "logic/utc_clock.hpp"

void utc_clock_sync(UtcClock &clock, uint32_t now_ms, int64_t utc_ms) {
    if (utc_ms <= 0) {
        return;
    }
    clock.anchor_utc_ms = utc_ms;
    clock.anchor_now_ms = now_ms;
    clock.valid = true;
}

bool utc_clock_now(const UtcClock &clock, uint32_t now_ms, int64_t &out) {
    if (!clock.valid) {
        return false;
    }
    /* Unsigned subtraction handles the 49.7 day counter wrap */
    uint32_t elapsed = now_ms - clock.anchor_now_ms;
    out = clock.anchor_utc_ms + static_cast<int64_t>(elapsed);
    return true;
}
