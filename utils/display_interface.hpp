/*
 * Display_Interface - Abstract status output for the recorder
 * Decouples the main loop from the output device (USB stdio today)
 */

#ifndef DISPLAY_INTERFACE_HPP
#define DISPLAY_INTERFACE_HPP

#include "types.h"
#include <cstdint>

enum class DisplaySeverity : uint8_t { Warning, Error };

class Display_Interface {
public:
    virtual ~Display_Interface() = default;
    virtual void show_status(const char *source, const char *msg) = 0;
    virtual void show_error(const char *source, const char *msg, DisplaySeverity sev) = 0;
    virtual void show_stats(const SessionStats &stats) = 0;
    virtual void clear() = 0;
};

#endif // DISPLAY_INTERFACE_HPP
