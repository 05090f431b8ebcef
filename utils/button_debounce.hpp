/*
 * Debounce - Level debouncing with edge reporting for digital inputs
 * Pure logic, no GPIO dependency. Used for the record button and the
 * external power sense. Testable on host without hardware.
 */

#ifndef BUTTON_DEBOUNCE_HPP
#define BUTTON_DEBOUNCE_HPP

#include <cstdint>

enum class DebounceEdge : uint8_t { None, Rising, Falling };

struct DebounceState {
    bool stable_state = false;    /* Accepted level */
    bool last_raw = false;        /* Last raw reading */
    uint32_t last_change_ms = 0;  /* Timestamp of last raw level change */
};

/*
 * Feed one raw reading.
 *
 * @param now_ms       Current timestamp in milliseconds
 * @param level        Raw level (caller inverts active-low GPIO)
 * @param debounce_ms  Minimum stable interval before accepting a level change
 * @param state        Persistent debounce state (caller-owned)
 * @return Rising / Falling once per accepted change, None otherwise
 */
DebounceEdge debounce_update(uint32_t now_ms, bool level, uint32_t debounce_ms,
                             DebounceState &state);

#endif /* BUTTON_DEBOUNCE_HPP */
