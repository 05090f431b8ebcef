/*
 * Track Formats - implementation
 */

#include "logic/track_format.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

static constexpr int64_t MS_PER_DAY = 86400000LL;

/*============================================================================
 * Civil Calendar
 *============================================================================
 * Days since 1970-01-01 <-> (y, m, d), H. Hinnant's era algorithm.
 */
static int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153U * (m > 2 ? m - 3 : m + 9) + 2U) / 5U + d - 1U;
    const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static void civil_from_days(int64_t z, int &y, unsigned &m, unsigned &d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
    const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
    const unsigned mp = (5U * doy + 2U) / 153U;
    d = doy - (153U * mp + 2U) / 5U + 1U;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

struct CivilTime {
    int year;
    unsigned month, day, hour, minute, second;
};

static bool to_civil(int64_t utc_ms, CivilTime &t) {
    if (utc_ms < 0) {
        return false;
    }
    int64_t days = utc_ms / MS_PER_DAY;
    int64_t secs = (utc_ms % MS_PER_DAY) / 1000;
    civil_from_days(days, t.year, t.month, t.day);
    t.hour = static_cast<unsigned>(secs / 3600);
    t.minute = static_cast<unsigned>((secs / 60) % 60);
    t.second = static_cast<unsigned>(secs % 60);
    return t.year <= 9999;
}

int64_t utc_ms_from_civil(int year, unsigned month, unsigned day,
                          unsigned hour, unsigned minute, unsigned second) {
    int64_t days = days_from_civil(year, month, day);
    return days * MS_PER_DAY +
           (static_cast<int64_t>(hour) * 3600 + minute * 60 + second) * 1000;
}

bool format_token(int64_t utc_ms, char *buf, size_t cap) {
    CivilTime t;
    if (!to_civil(utc_ms, t)) {
        return false;
    }
    int len = snprintf(buf, cap, "%04d-%02u-%02u_%02u-%02u-%02u",
                       t.year, t.month, t.day, t.hour, t.minute, t.second);
    return len > 0 && static_cast<size_t>(len) < cap;
}

bool format_iso_time(int64_t utc_ms, char *buf, size_t cap) {
    CivilTime t;
    if (!to_civil(utc_ms, t)) {
        return false;
    }
    int len = snprintf(buf, cap, "%04d-%02u-%02uT%02u:%02u:%02uZ",
                       t.year, t.month, t.day, t.hour, t.minute, t.second);
    return len > 0 && static_cast<size_t>(len) < cap;
}

bool parse_iso_time(const char *text, int64_t *utc_ms) {
    int year = 0;
    unsigned month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;

    if (sscanf(text, "%4d-%2u-%2uT%2u:%2u:%2u%n",
               &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    const char *p = text + consumed;
    int64_t frac_ms = 0;
    if (*p == '.') {
        p++;
        int64_t scale = 100;
        while (*p >= '0' && *p <= '9') {
            frac_ms += (*p - '0') * scale;
            scale /= 10;
            p++;
        }
    }
    if (*p != '\0' && *p != 'Z') {
        return false;
    }

    *utc_ms = utc_ms_from_civil(year, month, day, hour, minute, second) + frac_ms;
    return true;
}

/*============================================================================
 * File Names
 *============================================================================*/

bool segment_file_name(const char *token, uint32_t seq, char *buf, size_t cap) {
    int len = snprintf(buf, cap, "%s_%04lu.inc", token, static_cast<unsigned long>(seq));
    return len > 0 && static_cast<size_t>(len) < cap;
}

bool track_file_name(const char *token, char *buf, size_t cap) {
    int len = snprintf(buf, cap, "track_%s.gpx", token);
    return len > 0 && static_cast<size_t>(len) < cap;
}

bool parse_segment_file_name(const char *name, std::string &token, uint32_t &seq) {
    size_t len = strlen(name);
    static constexpr size_t EXT_LEN = 4U; /* ".inc" */
    if (len <= EXT_LEN || strcmp(name + len - EXT_LEN, ".inc") != 0) {
        return false;
    }

    const char *underscore = nullptr;
    for (const char *p = name; p < name + len - EXT_LEN; p++) {
        if (*p == '_') {
            underscore = p;
        }
    }
    if (underscore == nullptr || underscore == name) {
        return false;
    }

    const char *digits = underscore + 1;
    const char *end = name + len - EXT_LEN;
    if (digits == end) {
        return false;
    }
    uint64_t value = 0;
    for (const char *p = digits; p < end; p++) {
        if (*p < '0' || *p > '9') {
            return false;
        }
        value = value * 10U + static_cast<uint64_t>(*p - '0');
        if (value > UINT32_MAX) {
            return false;
        }
    }

    token.assign(name, static_cast<size_t>(underscore - name));
    seq = static_cast<uint32_t>(value);
    return true;
}

/*============================================================================
 * Segment Lines
 *============================================================================*/

int format_segment_line(const TrackPoint &point, char *buf, size_t cap) {
    char lean[24] = "";
    char accel[24] = "";
    if (!std::isnan(point.lean_deg)) {
        snprintf(lean, sizeof(lean), "%.2f", static_cast<double>(point.lean_deg));
    }
    if (!std::isnan(point.long_accel_mps2)) {
        snprintf(accel, sizeof(accel), "%.3f", static_cast<double>(point.long_accel_mps2));
    }

    int len = snprintf(buf, cap, "%.17g,%.17g,%.9g,%lld,%.17g,%s,%s\n",
                       point.latitude,
                       point.longitude,
                       static_cast<double>(point.speed_mps),
                       static_cast<long long>(point.timestamp_ms),
                       point.elevation,
                       lean,
                       accel);
    if (len <= 0 || static_cast<size_t>(len) >= cap) {
        return -1;
    }
    return len;
}

/* Copy the next comma-separated field; false when the line is exhausted */
static bool next_field(const char *&p, char *field, size_t cap, bool &overflow) {
    if (p == nullptr) {
        return false;
    }
    size_t n = 0;
    overflow = false;
    while (*p != '\0' && *p != ',' && *p != '\r' && *p != '\n') {
        if (n + 1 < cap) {
            field[n++] = *p;
        } else {
            overflow = true;
        }
        p++;
    }
    field[n] = '\0';
    if (*p == ',') {
        p++;
    } else {
        p = nullptr; /* End of line: no more fields */
    }
    return true;
}

static bool parse_double(const char *text, double &out) {
    if (*text == '\0') {
        return false;
    }
    char *end = nullptr;
    out = strtod(text, &end);
    return end != text && *end == '\0';
}

static float parse_optional(const char *text) {
    double value;
    if (!parse_double(text, value)) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    return static_cast<float>(value);
}

bool parse_segment_line(const char *line, TrackPoint &out) {
    char fields[7][32];
    int count = 0;
    bool overflow = false;
    const char *p = line;

    while (count < 7 && next_field(p, fields[count], sizeof(fields[count]), overflow)) {
        if (overflow) {
            return false;
        }
        count++;
    }
    if (count < 5) {
        return false;
    }

    TrackPoint point;
    double speed;
    if (!parse_double(fields[0], point.latitude) ||
        !parse_double(fields[1], point.longitude) ||
        !parse_double(fields[2], speed) ||
        !parse_double(fields[4], point.elevation)) {
        return false;
    }

    char *end = nullptr;
    long long ts = strtoll(fields[3], &end, 10);
    if (end == fields[3] || *end != '\0') {
        return false;
    }
    /* Only timestamps the GPX writer can render */
    CivilTime civil;
    if (!to_civil(static_cast<int64_t>(ts), civil)) {
        return false;
    }

    point.speed_mps = static_cast<float>(speed);
    point.timestamp_ms = static_cast<int64_t>(ts);
    point.lean_deg = count > 5 ? parse_optional(fields[5]) : std::numeric_limits<float>::quiet_NaN();
    point.long_accel_mps2 = count > 6 ? parse_optional(fields[6]) : std::numeric_limits<float>::quiet_NaN();
    out = point;
    return true;
}

/*============================================================================
 * GPX Writer
 *============================================================================*/

static int checked_length(int len, size_t cap) {
    if (len <= 0 || static_cast<size_t>(len) >= cap) {
        return -1;
    }
    return len;
}

int gpx_format_header(int64_t first_point_utc_ms, char *buf, size_t cap) {
    char token[TOKEN_BUF];
    if (!format_token(first_point_utc_ms, token, sizeof(token))) {
        return -1;
    }
    int len = snprintf(buf, cap,
                       "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                       "<gpx version=\"1.1\" creator=\"RideTrack\" "
                       "xmlns=\"http://www.topografix.com/GPX/1/1\" "
                       "xmlns:ridetrack=\"http://ridetrack.local/gpx/1\">\n"
                       "  <trk>\n"
                       "    <name>Track %s</name>\n"
                       "    <trkseg>\n",
                       token);
    return checked_length(len, cap);
}

int gpx_format_point(const TrackPoint &point, char *buf, size_t cap) {
    char time[24];
    if (!format_iso_time(point.timestamp_ms, time, sizeof(time))) {
        return -1;
    }

    int len = snprintf(buf, cap,
                       "      <trkpt lat=\"%.17g\" lon=\"%.17g\">\n"
                       "        <ele>%.17g</ele>\n"
                       "        <time>%s</time>\n"
                       "        <speed>%.9g</speed>\n",
                       point.latitude, point.longitude, point.elevation, time,
                       static_cast<double>(point.speed_mps));
    if (checked_length(len, cap) < 0) {
        return -1;
    }
    size_t used = static_cast<size_t>(len);

    bool has_lean = !std::isnan(point.lean_deg);
    bool has_accel = !std::isnan(point.long_accel_mps2);
    if (has_lean || has_accel) {
        len = snprintf(buf + used, cap - used, "        <extensions>\n");
        if (checked_length(len, cap - used) < 0) {
            return -1;
        }
        used += static_cast<size_t>(len);

        if (has_lean) {
            len = snprintf(buf + used, cap - used,
                           "          <ridetrack:lean>%.2f</ridetrack:lean>\n",
                           static_cast<double>(point.lean_deg));
            if (checked_length(len, cap - used) < 0) {
                return -1;
            }
            used += static_cast<size_t>(len);
        }
        if (has_accel) {
            len = snprintf(buf + used, cap - used,
                           "          <ridetrack:accel>%.3f</ridetrack:accel>\n",
                           static_cast<double>(point.long_accel_mps2));
            if (checked_length(len, cap - used) < 0) {
                return -1;
            }
            used += static_cast<size_t>(len);
        }

        len = snprintf(buf + used, cap - used, "        </extensions>\n");
        if (checked_length(len, cap - used) < 0) {
            return -1;
        }
        used += static_cast<size_t>(len);
    }

    len = snprintf(buf + used, cap - used, "      </trkpt>\n");
    if (checked_length(len, cap - used) < 0) {
        return -1;
    }
    used += static_cast<size_t>(len);
    return static_cast<int>(used);
}

int gpx_format_footer(char *buf, size_t cap) {
    int len = snprintf(buf, cap, "    </trkseg>\n  </trk>\n</gpx>\n");
    return checked_length(len, cap);
}

/*============================================================================
 * GPX Reader
 *============================================================================*/

/* Value of name="..." (or '...') inside an opening tag */
static bool find_attribute(const std::string &tag, const char *name, std::string &value) {
    size_t name_len = strlen(name);
    size_t pos = 0;
    while ((pos = tag.find(name, pos)) != std::string::npos) {
        bool boundary = pos > 0 && (tag[pos - 1] == ' ' || tag[pos - 1] == '\t' ||
                                    tag[pos - 1] == '\n' || tag[pos - 1] == '\r');
        size_t eq = pos + name_len;
        while (eq < tag.size() && tag[eq] == ' ') {
            eq++;
        }
        if (boundary && eq + 1 < tag.size() && tag[eq] == '=') {
            size_t q = eq + 1;
            while (q < tag.size() && tag[q] == ' ') {
                q++;
            }
            if (q < tag.size() && (tag[q] == '"' || tag[q] == '\'')) {
                size_t close = tag.find(tag[q], q + 1);
                if (close == std::string::npos) {
                    return false;
                }
                value = tag.substr(q + 1, close - q - 1);
                return true;
            }
        }
        pos += name_len;
    }
    return false;
}

/* Text of the first child element with the given local name, any prefix */
static bool find_child_text(const std::string &element, const char *local, std::string &text) {
    std::string plain = std::string("<") + local + ">";
    std::string prefixed = std::string(":") + local + ">";

    size_t start = element.find(plain);
    size_t open_len = plain.size();
    size_t alt = element.find(prefixed);
    /* A prefixed match must belong to an opening tag, not "</x:local>" */
    while (alt != std::string::npos) {
        size_t lt = element.rfind('<', alt);
        if (lt != std::string::npos && lt + 1 < element.size() && element[lt + 1] != '/') {
            break;
        }
        alt = element.find(prefixed, alt + 1);
    }
    if (alt != std::string::npos && (start == std::string::npos || alt < start)) {
        start = alt;
        open_len = prefixed.size();
    }
    if (start == std::string::npos) {
        return false;
    }

    size_t begin = start + open_len;
    size_t end = element.find('<', begin);
    if (end == std::string::npos) {
        return false;
    }

    /* Trim surrounding whitespace */
    while (begin < end && isspace(static_cast<unsigned char>(element[begin]))) {
        begin++;
    }
    while (end > begin && isspace(static_cast<unsigned char>(element[end - 1]))) {
        end--;
    }
    text = element.substr(begin, end - begin);
    return true;
}

bool Gpx_Reader::parse_point(const std::string &element, TrackPoint &point) const {
    size_t tag_end = element.find('>');
    if (tag_end == std::string::npos) {
        return false;
    }
    std::string open_tag = element.substr(0, tag_end);

    std::string value;
    if (!find_attribute(open_tag, "lat", value) || !parse_double(value.c_str(), point.latitude)) {
        return false;
    }
    if (!find_attribute(open_tag, "lon", value) || !parse_double(value.c_str(), point.longitude)) {
        return false;
    }

    double number;
    if (find_child_text(element, "ele", value) && parse_double(value.c_str(), number)) {
        point.elevation = number;
    }
    if (find_child_text(element, "speed", value) && parse_double(value.c_str(), number)) {
        point.speed_mps = static_cast<float>(number);
    }
    int64_t ms;
    if (find_child_text(element, "time", value) && parse_iso_time(value.c_str(), &ms)) {
        point.timestamp_ms = ms;
    }
    if (find_child_text(element, "lean", value)) {
        point.lean_deg = parse_optional(value.c_str());
    }
    if (find_child_text(element, "accel", value)) {
        point.long_accel_mps2 = parse_optional(value.c_str());
    }
    return true;
}

void Gpx_Reader::feed(const char *text) {
    static constexpr const char *OPEN = "<trkpt";
    static constexpr const char *CLOSE = "</trkpt>";
    static constexpr size_t OPEN_LEN = 6U;
    static constexpr size_t CLOSE_LEN = 8U;

    pending_ += text;

    for (;;) {
        size_t start = pending_.find(OPEN);
        if (start == std::string::npos) {
            /* Keep a tail long enough to hold a split "<trkpt" */
            if (pending_.size() > OPEN_LEN) {
                pending_.erase(0, pending_.size() - OPEN_LEN);
            }
            return;
        }
        if (start > 0) {
            pending_.erase(0, start);
        }

        size_t tag_end = pending_.find('>');
        if (tag_end == std::string::npos) {
            return;
        }

        size_t element_end;
        if (pending_[tag_end - 1] == '/') {
            element_end = tag_end + 1;
        } else {
            size_t close = pending_.find(CLOSE, tag_end);
            if (close == std::string::npos) {
                return;
            }
            element_end = close + CLOSE_LEN;
        }

        TrackPoint point;
        if (parse_point(pending_.substr(0, element_end), point)) {
            out_.push_back(point);
            if (points_read_ < UINT32_MAX) {
                points_read_++;
            }
        } else if (points_skipped_ < UINT32_MAX) {
            points_skipped_++;
        }
        pending_.erase(0, element_end);
    }
}
