/*
 * Motion Analytics - distance, moving time and GPS-derived lean / g-force
 * Pure functions over a finished point sequence, testable on host
 *
 * Used on finalize (summary log line) and for tracks recorded without an
 * IMU, where lean and longitudinal force are estimated from the trajectory.
 */

#ifndef MOTION_ANALYTICS_HPP
#define MOTION_ANALYTICS_HPP

#include "types.h"
#include <cstddef>
#include <cstdint>

/*============================================================================
 * Distance
 *============================================================================*/
double track_distance_m(const TrackPoint *points, size_t count);

/*============================================================================
 * Moving / Paused Classification
 *============================================================================
 * An interval is moving when 0 < dt <= ANALYTICS_MAX_GAP_MS and the mean of
 * its endpoint speeds exceeds ANALYTICS_MOVING_SPEED_MPS. Everything else in
 * the first-to-last span is paused.
 */
struct MotionSummary {
    int64_t total_ms;
    int64_t moving_ms;
    int64_t paused_ms;
    double distance_m;
    double avg_moving_speed_mps;   /* distance / moving time, 0 if never moving */
};

MotionSummary classify_motion(const TrackPoint *points, size_t count);

/*============================================================================
 * Trajectory Fallbacks
 *============================================================================
 * out must hold count entries. End points and rejected points read 0.
 *
 * Lean: turn radius from mean segment length over the bearing change at each
 * interior point, lean = atan(v^2 / (r*g)), right turn positive, clamped to
 * ANALYTICS_MAX_LEAN_DEG.
 *
 * Longitudinal force: dv / dt / g on the later point of each interval.
 */
void lean_fallback_deg(const TrackPoint *points, size_t count, float *out);
void long_accel_fallback_g(const TrackPoint *points, size_t count, float *out);

/*
 * Series selection: sensor values when any point carries them (missing
 * entries read as 0, accel converted to g), trajectory fallback otherwise.
 * Return true when the series came from the sensor.
 */
bool lean_series_deg(const TrackPoint *points, size_t count, float *out);
bool long_accel_series_g(const TrackPoint *points, size_t count, float *out);

/*============================================================================
 * Track Summary
 *============================================================================
 * Recomputed from scratch on every call.
 */
struct TrackSummary {
    size_t point_count;
    int64_t start_ms;
    int64_t end_ms;
    int64_t duration_ms;
    double distance_m;
    int64_t moving_ms;
    int64_t paused_ms;
    double avg_moving_speed_mps;
    float max_speed_mps;
    float max_lean_deg;        /* Largest |lean| */
    float max_accel_g;         /* Largest forward force, >= 0 */
    float max_decel_g;         /* Largest braking force as a magnitude, >= 0 */
    bool has_sensor_data;
};

/*
 * Streaming form: feed points in order, then finish. Holds a two-point window
 * so a merge can summarise a track of any length without buffering it.
 */
struct TrackSummaryBuilder {
    TrackSummary summary;
    TrackPoint window[2];          /* [0] older, [1] newest */
    double moving_distance_m;
    float sensor_lean_max;
    float sensor_accel_max;
    float sensor_decel_max;
    float fallback_lean_max;
    float fallback_accel_max;
    float fallback_decel_max;
    bool lean_from_sensor;
    bool accel_from_sensor;
};

void summary_begin(TrackSummaryBuilder &b);
void summary_add(TrackSummaryBuilder &b, const TrackPoint &point);
TrackSummary summary_finish(const TrackSummaryBuilder &b);

TrackSummary summarize_track(const TrackPoint *points, size_t count);

#endif // MOTION_ANALYTICS_HPP
