/*
 * Status_LED Implementation
 */

#include "drivers/status_led.hpp"
#include "hardware/gpio.h"

bool Status_LED::init() {
    gpio_init(STATUS_LED_PIN);
    gpio_set_dir(STATUS_LED_PIN, GPIO_OUT);
    gpio_put(STATUS_LED_PIN, false);
    initialized_ = true;
    return true;
}

void Status_LED::drive(bool level) {
    if (initialized_) {
        gpio_put(STATUS_LED_PIN, level);
    }
}
