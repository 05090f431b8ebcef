/*
 * NMEA Parser - NMEA-0183 byte stream to LocationFix
 *
 * Consumes $--RMC (validity, date/time, position, speed) and $--GGA
 * (altitude, HDOP) from any talker (GP, GN, GL, ...). One fix per valid RMC.
 * Altitude and accuracy come from the GGA carrying the same UTC time,
 * whichever of the two sentences arrives first; an RMC with no partner is
 * released when the next RMC arrives.
 *
 * Line framing, pairing and the ready queue live here; checksum and field
 * parsing are minmea's. Pure logic, no UART dependency. No heap use after
 * construction.
 */

#ifndef NMEA_PARSER_HPP
#define NMEA_PARSER_HPP

#include "types.h"
#include "config.h"

#include <cstddef>
#include <cstdint>

#define NMEA_KNOTS_TO_MPS  0.514444

struct NmeaStats {
    uint32_t sentences;         /* Checksum-valid sentences */
    uint32_t checksum_errors;
    uint32_t overflows;         /* Lines longer than GPS_LINE_MAX */
    uint32_t malformed;         /* RMC / GGA with missing or bad fields */
    uint32_t no_fix;            /* RMC with status V */
    uint32_t fixes;             /* Fixes produced */
    uint32_t fixes_dropped;     /* Ready queue full */
};

/* Fields of one RMC sentence */
struct NmeaRmc {
    bool valid;                 /* Status A */
    uint32_t time_of_day_ms;
    int64_t utc_ms;
    double latitude;
    double longitude;
    bool has_speed;
    float speed_mps;
};

/* Fields of one GGA sentence */
struct NmeaGga {
    uint32_t time_of_day_ms;
    uint8_t quality;            /* 0 = no fix */
    bool has_hdop;
    float hdop;
    bool has_altitude;
    double altitude_m;
};

/*
 * Parse one sentence through minmea and convert it to recorder units
 * (degrees, m/s, ms since midnight / epoch). False if the sentence is not
 * that type or a field is missing or out of range. Coordinates are
 * converted from the raw ddmm.mmmm fixed-point value in double precision.
 */
bool nmea_parse_rmc(const char *sentence, NmeaRmc &out);
bool nmea_parse_gga(const char *sentence, NmeaGga &out);

class Nmea_Parser {
public:
    explicit Nmea_Parser(float uere_m = GPS_UERE_M) : uere_m_(uere_m) {}

    void feed(char c);
    void feed(const char *data, size_t len);

    /* Oldest ready fix; false when none */
    bool pop_fix(LocationFix &out);

    NmeaStats get_stats() const { return stats_; }

private:
    static constexpr size_t READY_MAX = 4U;

    void process_line();
    void on_rmc(const NmeaRmc &rmc);
    void on_gga(const NmeaGga &gga);
    void apply_gga(LocationFix &fix) const;
    void push(const LocationFix &fix);

    float uere_m_;

    char line_[GPS_LINE_MAX] = {};
    size_t len_ = 0;
    bool in_sentence_ = false;

    bool have_gga_ = false;
    NmeaGga gga_ = {};

    bool have_pending_ = false;
    uint32_t pending_tod_ms_ = 0;
    LocationFix pending_;

    LocationFix ready_[READY_MAX];
    size_t ready_head_ = 0;
    size_t ready_count_ = 0;

    NmeaStats stats_ = {};
};

#endif // NMEA_PARSER_HPP
