/*
 * Motion Analytics - implementation
 */

#include "logic/motion_analytics.hpp"
#include "logic/geo_math.hpp"
#include "config.h"

#include <cmath>

static constexpr double DEG_TO_RAD = M_PI / 180.0;
static constexpr double RAD_TO_DEG = 180.0 / M_PI;

double track_distance_m(const TrackPoint *points, size_t count) {
    double total = 0.0;
    for (size_t i = 1; i < count; i++) {
        total += haversine_m(points[i - 1], points[i]);
    }
    return total;
}

/* Interval counts toward moving time */
static bool interval_moving(const TrackPoint &a, const TrackPoint &b) {
    int64_t dt = b.timestamp_ms - a.timestamp_ms;
    if (dt <= 0 || dt > ANALYTICS_MAX_GAP_MS) {
        return false;
    }
    double mean_speed = (static_cast<double>(a.speed_mps) + b.speed_mps) / 2.0;
    return mean_speed > ANALYTICS_MOVING_SPEED_MPS;
}

/* Trajectory lean at cur, 0 when rejected */
static float lean_at(const TrackPoint &prev, const TrackPoint &cur, const TrackPoint &next) {
    double v = cur.speed_mps;
    if (v < ANALYTICS_MIN_LEAN_SPEED_MPS) {
        return 0.0f;
    }

    double d_in = haversine_m(prev, cur);
    double d_out = haversine_m(cur, next);
    if (d_in < ANALYTICS_MIN_SEGMENT_M || d_out < ANALYTICS_MIN_SEGMENT_M) {
        return 0.0f;
    }

    double b_in = initial_bearing_deg(prev.latitude, prev.longitude, cur.latitude, cur.longitude);
    double b_out = initial_bearing_deg(cur.latitude, cur.longitude, next.latitude, next.longitude);
    double delta = wrap_deg_180(b_out - b_in);
    if (fabs(delta) < ANALYTICS_MIN_TURN_DEG) {
        return 0.0f;
    }

    /* Arc length over turned angle */
    double radius = ((d_in + d_out) / 2.0) / (fabs(delta) * DEG_TO_RAD);
    double lean = atan((v * v) / (radius * GRAVITY_MPS2)) * RAD_TO_DEG;
    if (lean > ANALYTICS_MAX_LEAN_DEG) {
        lean = ANALYTICS_MAX_LEAN_DEG;
    }
    return static_cast<float>(delta > 0.0 ? lean : -lean);
}

/* Trajectory longitudinal force over a-b in g, 0 when the interval is unusable */
static float accel_between(const TrackPoint &a, const TrackPoint &b) {
    int64_t dt = b.timestamp_ms - a.timestamp_ms;
    if (dt <= 0 || dt > ANALYTICS_MAX_ACCEL_GAP_MS) {
        return 0.0f;
    }
    double dv = static_cast<double>(b.speed_mps) - a.speed_mps;
    return static_cast<float>(dv / (static_cast<double>(dt) / 1000.0) / GRAVITY_MPS2);
}

MotionSummary classify_motion(const TrackPoint *points, size_t count) {
    MotionSummary s = {};
    if (count == 0) {
        return s;
    }

    s.total_ms = points[count - 1].timestamp_ms - points[0].timestamp_ms;
    if (s.total_ms < 0) {
        s.total_ms = 0;
    }

    double moving_dist = 0.0;
    for (size_t i = 1; i < count; i++) {
        const TrackPoint &a = points[i - 1];
        const TrackPoint &b = points[i];
        double d = haversine_m(a, b);
        s.distance_m += d;
        if (interval_moving(a, b)) {
            s.moving_ms += b.timestamp_ms - a.timestamp_ms;
            moving_dist += d;
        }
    }

    s.paused_ms = s.total_ms - s.moving_ms;
    if (s.paused_ms < 0) {
        s.paused_ms = 0;
    }
    if (s.moving_ms > 0) {
        s.avg_moving_speed_mps = moving_dist / (static_cast<double>(s.moving_ms) / 1000.0);
    }
    return s;
}

void lean_fallback_deg(const TrackPoint *points, size_t count, float *out) {
    for (size_t i = 0; i < count; i++) {
        out[i] = 0.0f;
    }

    for (size_t i = 1; i + 1 < count; i++) {
        out[i] = lean_at(points[i - 1], points[i], points[i + 1]);
    }
}

void long_accel_fallback_g(const TrackPoint *points, size_t count, float *out) {
    for (size_t i = 0; i < count; i++) {
        out[i] = 0.0f;
    }

    for (size_t i = 1; i < count; i++) {
        out[i] = accel_between(points[i - 1], points[i]);
    }
}

bool lean_series_deg(const TrackPoint *points, size_t count, float *out) {
    bool any = false;
    for (size_t i = 0; i < count; i++) {
        if (!std::isnan(points[i].lean_deg)) {
            any = true;
            break;
        }
    }

    if (!any) {
        lean_fallback_deg(points, count, out);
        return false;
    }
    for (size_t i = 0; i < count; i++) {
        out[i] = std::isnan(points[i].lean_deg) ? 0.0f : points[i].lean_deg;
    }
    return true;
}

bool long_accel_series_g(const TrackPoint *points, size_t count, float *out) {
    bool any = false;
    for (size_t i = 0; i < count; i++) {
        if (!std::isnan(points[i].long_accel_mps2)) {
            any = true;
            break;
        }
    }

    if (!any) {
        long_accel_fallback_g(points, count, out);
        return false;
    }
    for (size_t i = 0; i < count; i++) {
        float a = points[i].long_accel_mps2;
        out[i] = std::isnan(a) ? 0.0f : static_cast<float>(a / GRAVITY_MPS2);
    }
    return true;
}

/*============================================================================
 * Track Summary
 *============================================================================
 * Sensor and trajectory maxima are tracked side by side; finish picks the
 * sensor figures when any point carried them. Missing sensor entries count
 * as 0, which never raises a maximum.
 */
static void raise_extremes(float g, float &accel_max, float &decel_max) {
    if (g > accel_max) {
        accel_max = g;
    }
    if (-g > decel_max) {
        decel_max = -g;
    }
}

void summary_begin(TrackSummaryBuilder &b) {
    b = TrackSummaryBuilder{};
}

void summary_add(TrackSummaryBuilder &b, const TrackPoint &point) {
    TrackSummary &s = b.summary;

    if (s.point_count == 0) {
        s.start_ms = point.timestamp_ms;
    } else {
        const TrackPoint &last = b.window[1];
        double d = haversine_m(last, point);
        s.distance_m += d;
        if (interval_moving(last, point)) {
            s.moving_ms += point.timestamp_ms - last.timestamp_ms;
            b.moving_distance_m += d;
        }
        raise_extremes(accel_between(last, point), b.fallback_accel_max, b.fallback_decel_max);
        if (s.point_count >= 2) {
            float lean = fabsf(lean_at(b.window[0], last, point));
            if (lean > b.fallback_lean_max) {
                b.fallback_lean_max = lean;
            }
        }
    }

    if (!std::isnan(point.lean_deg)) {
        b.lean_from_sensor = true;
        if (fabsf(point.lean_deg) > b.sensor_lean_max) {
            b.sensor_lean_max = fabsf(point.lean_deg);
        }
    }
    if (!std::isnan(point.long_accel_mps2)) {
        b.accel_from_sensor = true;
        raise_extremes(static_cast<float>(point.long_accel_mps2 / GRAVITY_MPS2),
                       b.sensor_accel_max, b.sensor_decel_max);
    }
    if (point.speed_mps > s.max_speed_mps) {
        s.max_speed_mps = point.speed_mps;
    }

    s.end_ms = point.timestamp_ms;
    s.point_count++;
    b.window[0] = b.window[1];
    b.window[1] = point;
}

TrackSummary summary_finish(const TrackSummaryBuilder &b) {
    TrackSummary s = b.summary;
    if (s.point_count == 0) {
        return s;
    }

    s.duration_ms = s.end_ms - s.start_ms;
    if (s.duration_ms < 0) {
        s.duration_ms = 0;
    }
    s.paused_ms = s.duration_ms - s.moving_ms;
    if (s.paused_ms < 0) {
        s.paused_ms = 0;
    }
    if (s.moving_ms > 0) {
        s.avg_moving_speed_mps = b.moving_distance_m / (static_cast<double>(s.moving_ms) / 1000.0);
    }

    s.max_lean_deg = b.lean_from_sensor ? b.sensor_lean_max : b.fallback_lean_max;
    s.max_accel_g = b.accel_from_sensor ? b.sensor_accel_max : b.fallback_accel_max;
    s.max_decel_g = b.accel_from_sensor ? b.sensor_decel_max : b.fallback_decel_max;
    s.has_sensor_data = b.lean_from_sensor || b.accel_from_sensor;
    return s;
}

TrackSummary summarize_track(const TrackPoint *points, size_t count) {
    TrackSummaryBuilder b;
    summary_begin(b);
    for (size_t i = 0; i < count; i++) {
        summary_add(b, points[i]);
    }
    return summary_finish(b);
}
