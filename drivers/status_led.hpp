/*
 * Status_LED - Led_Display on the onboard LED pin
 * Second output beside USB serial for a recorder without a screen
 */

#ifndef STATUS_LED_HPP
#define STATUS_LED_HPP

#include "config.h"
#include "utils/led_display.hpp"

class Status_LED final : public Led_Display {
public:
    bool init();

protected:
    void drive(bool level) override;

private:
    bool initialized_ = false;
};

#endif // STATUS_LED_HPP
