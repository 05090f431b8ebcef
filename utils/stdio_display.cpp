/*
 * Stdio_Display Implementation - printf-based display output
 */

#include "utils/stdio_display.hpp"

#include <cmath>

static const char *severity_label(DisplaySeverity sev) {
    switch (sev) {
        case DisplaySeverity::Warning: return "WARN";
        case DisplaySeverity::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

/* "h:mm:ss" */
void Stdio_Display::print_duration(uint32_t ms) {
    uint32_t s = ms / 1000U;
    fprintf(out_, "%lu:%02lu:%02lu", static_cast<unsigned long>(s / 3600U),
            static_cast<unsigned long>((s / 60U) % 60U), static_cast<unsigned long>(s % 60U));
}

/* "cur/avg unit", "-" for unknown */
void Stdio_Display::print_pair(float current, float average, const char *unit) {
    if (std::isnan(current)) {
        fputs("-", out_);
    } else {
        fprintf(out_, "%.1f/%.1f%s", static_cast<double>(current), static_cast<double>(average),
                unit);
    }
}

void Stdio_Display::show_status(const char *source, const char *msg) {
    fprintf(out_, "[INFO]  %s: %s\n", source, msg);
}

void Stdio_Display::show_error(const char *source, const char *msg, DisplaySeverity sev) {
    fprintf(out_, "[%s] %s: %s\n", severity_label(sev), source, msg);
}

void Stdio_Display::show_stats(const SessionStats &stats) {
    fprintf(out_, "[STATS] %s %s %.2f km ", stats.is_recording ? "REC" : "PAUSED",
            stats.file_name, stats.distance_m / 1000.0);
    print_duration(stats.duration_ms);
    if (!stats.is_recording) {
        fputs(" paused ", out_);
        print_duration(stats.paused_for_ms);
        fputs(" finalize in ", out_);
        print_duration(stats.pause_timeout_remaining_ms);
    }
    fputs(" acc ", out_);
    print_pair(stats.current_accuracy_m, stats.avg_accuracy_m, "m");
    fputs(" rate ", out_);
    print_pair(stats.current_update_rate_hz, stats.avg_update_rate_hz, "Hz");
    fputs("\n", out_);
}

void Stdio_Display::clear() {
    fputs("\033[2J\033[H", out_);
}
