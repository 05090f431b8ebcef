/*
 * Core Type Definitions for RideTrack Recorder Firmware
 * Shared by logic/, drivers/ and host tests
 */

#ifndef RIDETRACK_TYPES_H
#define RIDETRACK_TYPES_H

#include <stdint.h>
#include <stdbool.h>

/*============================================================================
 * Sensor Data Types
 *============================================================================*/

typedef struct {
    float w;
    float x;
    float y;
    float z;
} Quat;

typedef struct {
    float x;
    float y;
    float z;
} Vec3;

#ifdef __cplusplus

#include <limits>
#include "config.h"

/*============================================================================
 * Track Point
 *============================================================================
 *
 * One recorded GPS fix stamped with the latest sensor fusion output.
 *
 * - double for latitude/longitude/elevation: degrees need ~1e-7 resolution
 *   (1 cm) which float cannot hold away from the equator.
 * - float for speed and inertial values: sensor precision is far coarser.
 * - lean_deg / long_accel_mps2 are NaN when no inertial source was active;
 *   consumers must treat NaN as "unknown", never as zero.
 * - timestamp_ms is UTC milliseconds since the Unix epoch (from the GPS).
 */
struct TrackPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    double elevation = 0.0;
    float speed_mps = 0.0f;
    int64_t timestamp_ms = 0;
    float lean_deg = std::numeric_limits<float>::quiet_NaN();
    float long_accel_mps2 = std::numeric_limits<float>::quiet_NaN();
};

/*============================================================================
 * Location Fix (push source interface)
 *============================================================================
 * Absent optional fields are flagged with has_* = false; the session engine
 * reads an absent speed or altitude as zero.
 */
struct LocationFix {
    double latitude = 0.0;
    double longitude = 0.0;
    float speed_mps = 0.0f;
    double altitude_m = 0.0;
    float accuracy_m = 0.0f;
    int64_t utc_ms = 0;
    bool has_speed = false;
    bool has_altitude = false;
    bool has_accuracy = false;
};

/*============================================================================
 * Inertial Samples (push source interface)
 *============================================================================
 * Timestamps are sensor microseconds; only differences are used.
 */
struct OrientationSample {
    double R[3][3];          /* Device-to-world rotation, row-major */
    uint64_t timestamp_us;
};

struct AccelSample {
    Vec3 linear_accel;       /* Gravity-removed, device frame [m/s^2] */
    uint64_t timestamp_us;
};

/*============================================================================
 * Session Statistics (periodic payload for the status display)
 *============================================================================*/
struct SessionStats {
    double distance_m;
    uint32_t duration_ms;                 /* Since session start, pauses included */
    bool is_recording;
    char file_name[STORAGE_PATH_MAX];     /* Final track name of this session */
    uint32_t pause_timeout_remaining_ms;  /* 0 unless paused */
    uint32_t paused_for_ms;               /* 0 unless paused */
    float current_accuracy_m;             /* NaN until a fix reports accuracy */
    float avg_accuracy_m;
    float current_update_rate_hz;         /* NaN until two fixes arrived */
    float avg_update_rate_hz;
};

#endif /* __cplusplus */

#endif /* RIDETRACK_TYPES_H */
