/*
 * Power_Monitor - ADC wrapper for external power (VBUS) sense
 * GP26 (ADC0) via 200K/100K voltage divider
 */

#ifndef POWER_MONITOR_HPP
#define POWER_MONITOR_HPP

#include "config.h"
#include "logic/power_math.hpp"
#include <cstdint>

class Power_Monitor {
public:
    /*
     * Initialize ADC for VBUS sensing.
     * Returns true on success.
     */
    bool init();

    /*
     * Update reading (throttled to VBUS_SAMPLE_INTERVAL_MS).
     * Returns true if a new sample was taken.
     */
    bool update(uint32_t now_ms);

    /* Smoothed VBUS voltage (V) */
    float voltage() const { return state_.filtered_voltage; }

    /* Charger or ignition power present, before debouncing */
    bool present() const { return state_.present; }

private:
    PowerState state_ = {};
    uint32_t last_sample_ms_ = 0;
    bool initialized_ = false;
};

#endif // POWER_MONITOR_HPP
