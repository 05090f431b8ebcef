/*
 * External Power Math - Pure Algorithms (no SDK dependencies)
 * ADC conversion, EMA smoothing, present / absent with hysteresis
 */

#ifndef POWER_MATH_HPP
#define POWER_MATH_HPP

#include <cstdint>

/* VBUS sense state */
struct PowerState {
    float filtered_voltage;  /* EMA-smoothed VBUS voltage */
    bool initialized;        /* True after first sample */
    bool present;            /* External power (charger / ignition) detected */
};

/*
 * Convert 12-bit ADC raw value to VBUS voltage.
 * Accounts for the 200K/100K divider: voltage = raw * vref / resolution * divider
 */
float power_raw_to_voltage(uint16_t raw, float vref, uint32_t resolution, float divider);

/*
 * Update the EMA filter with a new reading and re-evaluate presence.
 * First sample seeds the filter directly. Presence switches on above
 * present_v + hysteresis/2 and off below present_v - hysteresis/2.
 */
void power_update(PowerState &state, float voltage, float alpha,
                  float present_v, float hysteresis_v);

#endif // POWER_MATH_HPP
