/*
 * Led_Display - Display_Interface sink that renders the session on one LED
 * Subclasses own the pin; this class owns the pattern.
 */

#ifndef LED_DISPLAY_HPP
#define LED_DISPLAY_HPP

#include "display_interface.hpp"
#include "led_pattern.hpp"

class Led_Display : public Display_Interface {
public:
    /* Text output has no LED rendering */
    void show_status(const char *source, const char *msg) override { (void)source; (void)msg; }
    void show_error(const char *source, const char *msg, DisplaySeverity sev) override {
        (void)source;
        (void)msg;
        (void)sev;
    }

    /**
     * @brief Advance the pattern for the session state and drive the LED.
     * Called once per stats delivery, so the blink period is the stats interval.
     */
    void show_stats(const SessionStats &stats) override;

    /* Session over: LED dark */
    void clear() override;

    LedPattern pattern() const { return state_.pattern; }

protected:
    virtual void drive(bool level) = 0;

private:
    LedState state_ = {LedPattern::Off, false};
};

#endif // LED_DISPLAY_HPP
