/*
 * Dual_Display - Composite display that forwards calls to two Display_Interface implementations
 * Used to output simultaneously to USB CDC serial and a second sink
 */

#ifndef DUAL_DISPLAY_HPP
#define DUAL_DISPLAY_HPP

#include "display_interface.hpp"

class Dual_Display final : public Display_Interface {
public:
    Dual_Display(Display_Interface &a, Display_Interface &b) : a_(a), b_(b) {}

    void show_status(const char *source, const char *msg) override {
        a_.show_status(source, msg);
        b_.show_status(source, msg);
    }

    void show_error(const char *source, const char *msg, DisplaySeverity sev) override {
        a_.show_error(source, msg, sev);
        b_.show_error(source, msg, sev);
    }

    void show_stats(const SessionStats &stats) override {
        a_.show_stats(stats);
        b_.show_stats(stats);
    }

    void clear() override {
        a_.clear();
        b_.clear();
    }

private:
    Display_Interface &a_;
    Display_Interface &b_;
};

#endif // DUAL_DISPLAY_HPP
