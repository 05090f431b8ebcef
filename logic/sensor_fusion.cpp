/*
 * Sensor Fusion - lean angle and longitudinal acceleration implementation
 */

#include "logic/sensor_fusion.hpp"
#include "logic/nav_math.hpp"
#include "config.h"

#include <cmath>
#include <limits>

static constexpr double RAD_TO_DEG = 180.0 / M_PI;

/* Seconds between two sensor timestamps; 0 when not strictly increasing */
static inline double interval_s(uint64_t prev_us, uint64_t now_us) {
    if (prev_us == 0 || now_us <= prev_us) {
        return 0.0;
    }
    return static_cast<double>(now_us - prev_us) * 1e-6;
}

bool fusion_start(FusionState &state, bool orientation_available, bool accel_available) {
    state = FusionState{};
    if (!orientation_available) {
        return false;
    }
    state.accel_available = accel_available;
    state.phase = FusionPhase::Calibrating;
    return true;
}

void fusion_stop(FusionState &state) {
    state = FusionState{};
}

static void calibrate(FusionState &state, const OrientationSample &sample) {
    mat3_copy(sample.R, state.ref);
    mat3_transpose(state.ref, state.ref_inv);

    /* Forward: device Y axis (column 1) projected onto the world horizontal plane */
    double fx = state.ref[0][1];
    double fy = state.ref[1][1];
    double len = sqrt(fx * fx + fy * fy);
    if (len > FUSION_FORWARD_MIN_LEN) {
        state.forward[0] = fx / len;
        state.forward[1] = fy / len;
        state.forward_degenerate = false;
    } else {
        state.forward[0] = 1.0;
        state.forward[1] = 0.0;
        state.forward_degenerate = true;
    }
    state.forward[2] = 0.0;

    state.accel_seeded = false;
    state.filtered_lean_deg = 0.0;
    state.filtered_accel_mps2 = 0.0;
    state.last_orientation_us = sample.timestamp_us;
    state.last_accel_us = 0;
    state.phase = FusionPhase::Active;
}

void fusion_on_orientation(FusionState &state, const OrientationSample &sample) {
    if (state.phase == FusionPhase::Inactive) {
        return;
    }

    mat3_copy(sample.R, state.live);
    state.have_live = true;

    if (state.phase == FusionPhase::Calibrating) {
        calibrate(state, sample);
        return;
    }

    /* R_rel = R_live * R_ref^-1; lean is the roll component */
    mat3_multiply(state.live, state.ref_inv, state.rel);
    double raw_lean = atan2(state.rel[2][1], state.rel[2][2]) * RAD_TO_DEG;

    /* Filtered lean restarts from 0 at calibration, timed from the reference sample */
    double dt = interval_s(state.last_orientation_us, sample.timestamp_us);
    if (dt > 0.0) {
        double alpha = lowpass_alpha(dt, FUSION_CUTOFF_HZ);
        state.filtered_lean_deg = alpha * raw_lean + (1.0 - alpha) * state.filtered_lean_deg;
    } else {
        state.filtered_lean_deg = raw_lean;
    }
    state.last_orientation_us = sample.timestamp_us;
}

void fusion_on_quaternion(FusionState &state, Quat q, uint64_t timestamp_us) {
    OrientationSample sample;
    quaternion_to_rotation_matrix(q, sample.R);
    sample.timestamp_us = timestamp_us;
    fusion_on_orientation(state, sample);
}

void fusion_on_accel(FusionState &state, const AccelSample &sample) {
    if (state.phase != FusionPhase::Active || !state.have_live) {
        return;
    }

    /* Device frame -> world frame with the live orientation */
    const double a_dev[3] = {
        static_cast<double>(sample.linear_accel.x),
        static_cast<double>(sample.linear_accel.y),
        static_cast<double>(sample.linear_accel.z),
    };
    double a_world[3];
    mat3_rotate(state.live, a_dev, a_world);

    /* Signed component along the calibrated horizontal forward heading */
    double raw = a_world[0] * state.forward[0] + a_world[1] * state.forward[1];

    double dt = interval_s(state.last_accel_us, sample.timestamp_us);
    if (state.accel_seeded && dt > 0.0) {
        double alpha = lowpass_alpha(dt, FUSION_CUTOFF_HZ);
        state.filtered_accel_mps2 = alpha * raw + (1.0 - alpha) * state.filtered_accel_mps2;
    } else {
        state.filtered_accel_mps2 = raw;
        state.accel_seeded = true;
    }
    state.last_accel_us = sample.timestamp_us;
}

float fusion_lean_deg(const FusionState &state) {
    if (state.phase != FusionPhase::Active) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    return static_cast<float>(state.filtered_lean_deg);
}

float fusion_long_accel_mps2(const FusionState &state) {
    if (state.phase != FusionPhase::Active || !state.accel_seeded) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    return static_cast<float>(state.filtered_accel_mps2);
}
