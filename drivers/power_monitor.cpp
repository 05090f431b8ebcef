/*
 * Power_Monitor Implementation
 */

#include "drivers/power_monitor.hpp"
#include "hardware/adc.h"
#include "hardware/gpio.h"

bool Power_Monitor::init() {
    if (initialized_) {
        return true;
    }

    adc_init();
    adc_gpio_init(VBUS_ADC_PIN);

    initialized_ = true;
    return true;
}

bool Power_Monitor::update(uint32_t now_ms) {
    if (!initialized_) {
        return false;
    }

    if (state_.initialized && (now_ms - last_sample_ms_) < VBUS_SAMPLE_INTERVAL_MS) {
        return false;
    }
    last_sample_ms_ = now_ms;

    adc_select_input(VBUS_ADC_CHANNEL);
    uint16_t raw = adc_read();

    float voltage = power_raw_to_voltage(raw, VBUS_ADC_VREF, VBUS_ADC_RESOLUTION,
                                         VBUS_VOLTAGE_DIVIDER);
    power_update(state_, voltage, VBUS_EMA_ALPHA, VBUS_PRESENT_V, VBUS_HYSTERESIS_V);

    return true;
}
