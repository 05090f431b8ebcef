/*
 * GPS Wrapper - NMEA receiver on UART0
 * Drains the UART FIFO into the sentence parser, hands out paired fixes
 */

#ifndef GPS_WRAPPER_HPP
#define GPS_WRAPPER_HPP

#include "config.h"
#include "types.h"
#include "logic/nmea_parser.hpp"

#include <cstdint>

class GPS_Wrapper {
public:
    bool init();

    /**
     * @brief Move every byte waiting in the UART into the parser.
     * Bounded per call so a babbling receiver cannot starve the main loop.
     * @return number of bytes consumed
     */
    uint32_t poll();

    bool pop_fix(LocationFix &out) { return parser_.pop_fix(out); }

    /* True once any byte has arrived since init */
    bool receiving() const { return bytes_total_ > 0; }

    uint32_t bytes_total() const { return bytes_total_; }
    NmeaStats get_stats() const { return parser_.get_stats(); }

private:
    static constexpr uint32_t MAX_BYTES_PER_POLL = 512;

    Nmea_Parser parser_;
    uint32_t bytes_total_ = 0;
    bool initialized_ = false;
};

#endif // GPS_WRAPPER_HPP
