/*
 * LED Pattern - Pure session-state to LED level mapping (no GPIO dependencies)
 * Solid while recording, blinking while paused, dark when idle
 */

#ifndef LED_PATTERN_HPP
#define LED_PATTERN_HPP

#include "types.h"
#include <cstdint>

enum class LedPattern : uint8_t { Off, Solid, Blink };

struct LedState {
    LedPattern pattern;
    bool level;
};

/* Stats only arrive while a session runs: not recording means paused */
LedPattern led_pattern_for(const SessionStats &stats);

/*
 * Advance one step (called once per stats delivery).
 * Entering a pattern starts with the LED lit.
 * Returns the level to drive.
 */
bool led_step(LedState &state, LedPattern pattern);

#endif // LED_PATTERN_HPP
