/*
 * Debounce Implementation
 */

#include "utils/button_debounce.hpp"

DebounceEdge debounce_update(uint32_t now_ms, bool level, uint32_t debounce_ms,
                             DebounceState &state) {
    /* Raw level changed: restart the stability window */
    if (level != state.last_raw) {
        state.last_raw = level;
        state.last_change_ms = now_ms;
        return DebounceEdge::None;
    }

    /* Unsigned subtraction handles wrap */
    if (now_ms - state.last_change_ms < debounce_ms) {
        return DebounceEdge::None;
    }

    if (level == state.stable_state) {
        return DebounceEdge::None;
    }
    state.stable_state = level;
    return level ? DebounceEdge::Rising : DebounceEdge::Falling;
}
