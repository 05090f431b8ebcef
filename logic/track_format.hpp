/*
 * Track Formats - segment lines, GPX 1.1 documents, file names and UTC text
 * Pure string formatting / parsing, no filesystem access
 */

#ifndef TRACK_FORMAT_HPP
#define TRACK_FORMAT_HPP

#include "types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/* "yyyy-MM-dd_HH-mm-ss" */
static constexpr size_t TOKEN_LEN = 19U;
static constexpr size_t TOKEN_BUF = TOKEN_LEN + 1U;

/*============================================================================
 * UTC Time
 *============================================================================
 * Proleptic Gregorian calendar, no leap seconds. Valid for years 1970..9999.
 */
int64_t utc_ms_from_civil(int year, unsigned month, unsigned day,
                          unsigned hour, unsigned minute, unsigned second);

/* Session token, UTC: "2024-06-01_14-03-59" */
bool format_token(int64_t utc_ms, char *buf, size_t cap);

/* GPX time, UTC, second precision: "2024-06-01T14:03:59Z" */
bool format_iso_time(int64_t utc_ms, char *buf, size_t cap);

/* Accepts "yyyy-MM-ddTHH:mm:ss[.fff][Z]"; fraction kept to milliseconds. */
bool parse_iso_time(const char *text, int64_t *utc_ms);

/*============================================================================
 * File Names
 *============================================================================*/
bool segment_file_name(const char *token, uint32_t seq, char *buf, size_t cap);
bool track_file_name(const char *token, char *buf, size_t cap);

/*
 * Split "{token}_{seq}.inc" at the last underscore.
 * Returns false for names that are not segment files.
 */
bool parse_segment_file_name(const char *name, std::string &token, uint32_t &seq);

/*============================================================================
 * Segment Lines
 *============================================================================
 * lat,lon,speed,timestampMs,elevation,lean,accel
 * Lean / accel blank when NaN. Returns the line length including '\n', or
 * -1 if cap is too small.
 */
int format_segment_line(const TrackPoint &point, char *buf, size_t cap);

/*
 * At least five fields must parse; lean / accel read NaN when blank, missing
 * or malformed. Trailing "\r\n" is ignored. Timestamps outside the
 * format_iso_time range (before 1970 or after 9999) are rejected.
 */
bool parse_segment_line(const char *line, TrackPoint &out);

/*============================================================================
 * GPX Writer
 *============================================================================
 * Each call renders one fragment; the caller streams them out in order:
 * header, one point per fix, footer. Return value as format_segment_line.
 */
int gpx_format_header(int64_t first_point_utc_ms, char *buf, size_t cap);
int gpx_format_point(const TrackPoint &point, char *buf, size_t cap);
int gpx_format_footer(char *buf, size_t cap);

/*============================================================================
 * GPX Reader
 *============================================================================
 * Incremental: feed() takes arbitrary text fragments (file lines, chunks) and
 * appends every completed <trkpt> to the output vector. Only the text of
 * one unfinished track point is buffered.
 */
class Gpx_Reader {
public:
    explicit Gpx_Reader(std::vector<TrackPoint> &out) : out_(out) {}

    void feed(const char *text);

    uint32_t points_read() const { return points_read_; }
    uint32_t points_skipped() const { return points_skipped_; }

private:
    bool parse_point(const std::string &element, TrackPoint &point) const;

    std::vector<TrackPoint> &out_;
    std::string pending_;
    uint32_t points_read_ = 0;
    uint32_t points_skipped_ = 0;
};

#endif // TRACK_FORMAT_HPP
