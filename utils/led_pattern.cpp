/*
 * LED Pattern Implementation
 */

#include "utils/led_pattern.hpp"

LedPattern led_pattern_for(const SessionStats &stats) {
    return stats.is_recording ? LedPattern::Solid : LedPattern::Blink;
}

bool led_step(LedState &state, LedPattern pattern) {
    if (pattern != state.pattern) {
        state.pattern = pattern;
        state.level = (pattern != LedPattern::Off);
        return state.level;
    }

    switch (pattern) {
        case LedPattern::Off:   state.level = false; break;
        case LedPattern::Solid: state.level = true; break;
        case LedPattern::Blink: state.level = !state.level; break;
    }
    return state.level;
}
