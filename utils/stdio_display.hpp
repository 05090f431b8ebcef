/*
 * Stdio_Display - printf-based display implementation
 * Outputs recorder status and ride statistics to the serial console via USB CDC
 */

#ifndef STDIO_DISPLAY_HPP
#define STDIO_DISPLAY_HPP

#include "display_interface.hpp"
#include <cstdio>

class Stdio_Display final : public Display_Interface {
public:
    explicit Stdio_Display(FILE *out = stdout) : out_(out) {}

    void show_status(const char *source, const char *msg) override;
    void show_error(const char *source, const char *msg, DisplaySeverity sev) override;

    /**
     * @brief One "[STATS]" line: state, file, distance, elapsed time, fix quality.
     * Paused sessions add the pause length and the time left before finalize.
     * Unknown accuracy or rate prints as "-".
     */
    void show_stats(const SessionStats &stats) override;
    void clear() override;

private:
    void print_duration(uint32_t ms);
    void print_pair(float current, float average, const char *unit);

    FILE *out_;
};

#endif // STDIO_DISPLAY_HPP
