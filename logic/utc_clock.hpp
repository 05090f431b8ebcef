/*
 * UTC Clock - Wall time derived from GPS fixes (no SDK dependencies)
 * The board has no battery-backed RTC: the last fix anchors UTC to the
 * monotonic millisecond counter until the next fix re-anchors it.
 */

#ifndef UTC_CLOCK_HPP
#define UTC_CLOCK_HPP

#include <cstdint>

struct UtcClock {
    int64_t anchor_utc_ms;
    uint32_t anchor_now_ms;
    bool valid;
};

/* Re-anchor on a fix received at now_ms. Non-positive UTC is ignored. */
void utc_clock_sync(UtcClock &clock, uint32_t now_ms, int64_t utc_ms);

/*
 * UTC at now_ms, extrapolated from the anchor.
 * Returns false (out untouched) until the first fix.
 */
bool utc_clock_now(const UtcClock &clock, uint32_t now_ms, int64_t &out);

#endif // UTC_CLOCK_HPP
