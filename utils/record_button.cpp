/*
 * Record Button Implementation
 */

#include "utils/record_button.hpp"

RecordAction record_button_update(uint32_t now_ms, bool debounced_pressed,
                                  uint32_t feedback_ms, uint32_t shutdown_ms,
                                  RecordButtonState &state) {
    /* New press */
    if (!state.was_pressed && debounced_pressed) {
        state.was_pressed = true;
        state.press_start_ms = now_ms;
        state.feedback_shown = false;
        state.shutdown_sent = false;
        return RecordAction::None;
    }

    /* Held */
    if (state.was_pressed && debounced_pressed) {
        if (state.shutdown_sent) {
            return RecordAction::None;
        }

        /* Unsigned subtraction handles uint32_t wrap */
        uint32_t elapsed = now_ms - state.press_start_ms;
        if (elapsed >= shutdown_ms) {
            state.shutdown_sent = true;
            return RecordAction::Shutdown;
        }
        if (elapsed >= feedback_ms && !state.feedback_shown) {
            state.feedback_shown = true;
            return RecordAction::ShowFeedback;
        }
        return RecordAction::None;
    }

    /* Released */
    if (state.was_pressed && !debounced_pressed) {
        bool had_feedback = state.feedback_shown;
        bool had_shutdown = state.shutdown_sent;
        state.was_pressed = false;
        state.feedback_shown = false;
        state.shutdown_sent = false;

        if (had_shutdown) {
            return RecordAction::None;
        }
        return had_feedback ? RecordAction::HideFeedback : RecordAction::Toggle;
    }

    return RecordAction::None;
}
