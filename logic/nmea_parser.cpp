/*
 * NMEA Parser Implementation
 */

#include "logic/nmea_parser.hpp"
#include "logic/track_format.hpp"

#include "minmea.h"

static inline void bump(uint32_t &counter) {
    if (counter < UINT32_MAX) {
        counter++;
    }
}

/*============================================================================
 * Field Conversion
 *============================================================================*/

static bool present(const struct minmea_float &f) {
    return f.scale != 0;
}

static double to_double(const struct minmea_float &f) {
    return static_cast<double>(f.value) / static_cast<double>(f.scale);
}

/* Signed ddmm.mmmm fixed point to degrees */
static bool to_degrees(const struct minmea_float &f, double limit, double &deg) {
    if (!present(f)) {
        return false;
    }
    int_least32_t magnitude = f.value < 0 ? -f.value : f.value;
    int_least32_t whole = magnitude / (f.scale * 100);
    double minutes = static_cast<double>(magnitude % (f.scale * 100)) /
                     static_cast<double>(f.scale);
    if (minutes >= 60.0) {
        return false;
    }
    deg = static_cast<double>(whole) + minutes / 60.0;
    if (deg > limit) {
        return false;
    }
    if (f.value < 0) {
        deg = -deg;
    }
    return true;
}

static bool to_time_of_day(const struct minmea_time &t, uint32_t &tod_ms) {
    if (t.hours < 0 || t.hours > 23 || t.minutes < 0 || t.minutes > 59 ||
        t.seconds < 0 || t.seconds > 60 || t.microseconds < 0) {
        return false;
    }
    tod_ms = ((static_cast<uint32_t>(t.hours) * 60U + static_cast<uint32_t>(t.minutes)) * 60U +
              static_cast<uint32_t>(t.seconds)) * 1000U +
             static_cast<uint32_t>(t.microseconds / 1000);
    return true;
}

/*============================================================================
 * Sentences
 *============================================================================*/

bool nmea_parse_rmc(const char *sentence, NmeaRmc &out) {
    struct minmea_sentence_rmc frame;
    if (!minmea_parse_rmc(&frame, sentence)) {
        return false;
    }

    out = NmeaRmc{};
    if (!to_time_of_day(frame.time, out.time_of_day_ms)) {
        return false;
    }
    out.valid = frame.valid;
    if (!out.valid) {
        return true;
    }

    if (!to_degrees(frame.latitude, 90.0, out.latitude) ||
        !to_degrees(frame.longitude, 180.0, out.longitude)) {
        return false;
    }

    if (present(frame.speed) && frame.speed.value >= 0) {
        out.has_speed = true;
        out.speed_mps = static_cast<float>(to_double(frame.speed) * NMEA_KNOTS_TO_MPS);
    }

    /* Two-digit year */
    const struct minmea_date &d = frame.date;
    if (d.day < 1 || d.day > 31 || d.month < 1 || d.month > 12 || d.year < 0 || d.year > 99) {
        return false;
    }
    out.utc_ms = utc_ms_from_civil(2000 + d.year, static_cast<unsigned>(d.month),
                                   static_cast<unsigned>(d.day), 0, 0, 0) +
                 out.time_of_day_ms;
    return true;
}

bool nmea_parse_gga(const char *sentence, NmeaGga &out) {
    struct minmea_sentence_gga frame;
    if (!minmea_parse_gga(&frame, sentence)) {
        return false;
    }

    out = NmeaGga{};
    if (!to_time_of_day(frame.time, out.time_of_day_ms)) {
        return false;
    }
    out.quality = static_cast<uint8_t>(frame.fix_quality > 0 ? frame.fix_quality : 0);

    if (present(frame.hdop) && frame.hdop.value > 0) {
        out.has_hdop = true;
        out.hdop = static_cast<float>(to_double(frame.hdop));
    }
    if (present(frame.altitude)) {
        out.has_altitude = true;
        out.altitude_m = to_double(frame.altitude);
    }
    return true;
}

/*============================================================================
 * Stream
 *============================================================================*/

void Nmea_Parser::feed(const char *data, size_t len) {
    for (size_t i = 0; i < len; i++) {
        feed(data[i]);
    }
}

void Nmea_Parser::feed(char c) {
    if (c == '$') {
        in_sentence_ = true;
        len_ = 0;
    }
    if (!in_sentence_) {
        return;
    }

    if (c == '\r' || c == '\n') {
        line_[len_] = '\0';
        in_sentence_ = false;
        process_line();
        return;
    }

    if (len_ + 1 >= sizeof(line_)) {
        bump(stats_.overflows);
        in_sentence_ = false;
        return;
    }
    line_[len_++] = c;
}

void Nmea_Parser::process_line() {
    /* Strict: a sentence without "*HH" is rejected */
    enum minmea_sentence_id id = minmea_sentence_id(line_, true);
    if (id == MINMEA_INVALID) {
        bump(stats_.checksum_errors);
        return;
    }
    bump(stats_.sentences);

    if (id == MINMEA_SENTENCE_RMC) {
        NmeaRmc rmc;
        if (nmea_parse_rmc(line_, rmc)) {
            on_rmc(rmc);
        } else {
            bump(stats_.malformed);
        }
    } else if (id == MINMEA_SENTENCE_GGA) {
        NmeaGga gga;
        if (nmea_parse_gga(line_, gga)) {
            on_gga(gga);
        } else {
            bump(stats_.malformed);
        }
    }
}

void Nmea_Parser::on_rmc(const NmeaRmc &rmc) {
    /* A newer epoch releases the unmatched one */
    if (have_pending_) {
        push(pending_);
        have_pending_ = false;
    }

    if (!rmc.valid) {
        bump(stats_.no_fix);
        return;
    }

    LocationFix fix;
    fix.latitude = rmc.latitude;
    fix.longitude = rmc.longitude;
    fix.has_speed = rmc.has_speed;
    fix.speed_mps = rmc.speed_mps;
    fix.utc_ms = rmc.utc_ms;

    if (have_gga_ && gga_.time_of_day_ms == rmc.time_of_day_ms) {
        apply_gga(fix);
        push(fix);
        return;
    }
    pending_ = fix;
    pending_tod_ms_ = rmc.time_of_day_ms;
    have_pending_ = true;
}

void Nmea_Parser::on_gga(const NmeaGga &gga) {
    gga_ = gga;
    have_gga_ = true;

    if (have_pending_ && pending_tod_ms_ == gga.time_of_day_ms) {
        apply_gga(pending_);
        push(pending_);
        have_pending_ = false;
    }
}

void Nmea_Parser::apply_gga(LocationFix &fix) const {
    if (gga_.quality == 0) {
        return;
    }
    if (gga_.has_altitude) {
        fix.has_altitude = true;
        fix.altitude_m = gga_.altitude_m;
    }
    if (gga_.has_hdop) {
        fix.has_accuracy = true;
        fix.accuracy_m = gga_.hdop * uere_m_;
    }
}

void Nmea_Parser::push(const LocationFix &fix) {
    if (ready_count_ == READY_MAX) {
        /* Overwrite the oldest */
        ready_head_ = (ready_head_ + 1) % READY_MAX;
        ready_count_--;
        bump(stats_.fixes_dropped);
    }
    ready_[(ready_head_ + ready_count_) % READY_MAX] = fix;
    ready_count_++;
    bump(stats_.fixes);
}

bool Nmea_Parser::pop_fix(LocationFix &out) {
    if (ready_count_ == 0) {
        return false;
    }
    out = ready_[ready_head_];
    ready_head_ = (ready_head_ + 1) % READY_MAX;
    ready_count_--;
    return true;
}
