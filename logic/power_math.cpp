/*
 * External Power Math Implementation
 */

#include "logic/power_math.hpp"

float power_raw_to_voltage(uint16_t raw, float vref, uint32_t resolution, float divider) {
    if (resolution == 0) {
        return 0.0f;
    }
    return (static_cast<float>(raw) * vref / static_cast<float>(resolution)) * divider;
}

void power_update(PowerState &state, float voltage, float alpha,
                  float present_v, float hysteresis_v) {
    if (!state.initialized) {
        /* Seed filter with first sample */
        state.filtered_voltage = voltage;
        state.initialized = true;
    } else {
        state.filtered_voltage = alpha * voltage + (1.0f - alpha) * state.filtered_voltage;
    }

    float half = hysteresis_v * 0.5f;
    if (state.present) {
        if (state.filtered_voltage < present_v - half) {
            state.present = false;
        }
    } else if (state.filtered_voltage > present_v + half) {
        state.present = true;
    }
}
