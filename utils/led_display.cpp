/*
 * Led_Display Implementation
 */

#include "utils/led_display.hpp"

void Led_Display::show_stats(const SessionStats &stats) {
    drive(led_step(state_, led_pattern_for(stats)));
}

void Led_Display::clear() {
    drive(led_step(state_, LedPattern::Off));
}
