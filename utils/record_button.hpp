/*
 * Record Button - Press / long-press state machine
 * Short press toggles recording, a long hold requests a safe shutdown.
 * Pure logic, no GPIO dependency. Testable on host.
 */

#ifndef RECORD_BUTTON_HPP
#define RECORD_BUTTON_HPP

#include <cstdint>

enum class RecordAction : uint8_t {
    None,
    Toggle,        /* Short press released (< feedback threshold) */
    ShowFeedback,  /* Held past feedback threshold (fires once) */
    HideFeedback,  /* Released after feedback but before shutdown */
    Shutdown       /* Held past shutdown threshold (fires once per hold) */
};

struct RecordButtonState {
    bool was_pressed = false;
    uint32_t press_start_ms = 0;
    bool feedback_shown = false;
    bool shutdown_sent = false;
};

/*
 * Update the record button state machine each loop iteration.
 *
 * @param now_ms             Current timestamp in milliseconds
 * @param debounced_pressed  Stable pressed level (DebounceState.stable_state)
 * @param feedback_ms        Hold duration before "Hold to power off" feedback
 * @param shutdown_ms        Hold duration before shutdown
 * @param state              Persistent state (caller-owned)
 * @return Action to take this iteration
 */
RecordAction record_button_update(uint32_t now_ms, bool debounced_pressed,
                                  uint32_t feedback_ms, uint32_t shutdown_ms,
                                  RecordButtonState &state);

#endif /* RECORD_BUTTON_HPP */
