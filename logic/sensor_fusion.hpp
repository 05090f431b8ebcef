/*
 * Sensor Fusion - IMU-derived lean angle and longitudinal acceleration
 * Pure logic module, no hardware dependencies, testable on host
 */

#ifndef SENSOR_FUSION_HPP
#define SENSOR_FUSION_HPP

#include "types.h"
#include <cstdint>

enum class FusionPhase : uint8_t { Inactive, Calibrating, Active };

/*============================================================================
 * Fusion State
 *============================================================================
 * Calibration frame, exponential-moving-average filter state and scratch
 * matrices. Everything the per-sample path touches lives here so the 50Hz
 * path never allocates.
 *
 * Calibration: the first orientation after fusion_start() is taken as
 * "upright, pointing forward". This zeroes the arbitrary handlebar mount.
 */
struct FusionState {
    FusionPhase phase = FusionPhase::Inactive;
    bool accel_available = false;

    /* Calibration frame */
    double ref[3][3] = {};
    double ref_inv[3][3] = {};       /* Transpose of ref (orthonormal) */
    double forward[3] = {1.0, 0.0, 0.0};
    bool forward_degenerate = false; /* Default forward used (edge-on mount) */

    /* Live orientation, needed to rotate acceleration into world frame */
    double live[3][3] = {};
    bool have_live = false;

    /* Scratch */
    double rel[3][3] = {};

    /* Filter state */
    uint64_t last_orientation_us = 0;
    uint64_t last_accel_us = 0;
    bool accel_seeded = false;
    double filtered_lean_deg = 0.0;
    double filtered_accel_mps2 = 0.0;
};

/*
 * Activate fusion. Returns false (and stays Inactive) when no orientation
 * source exists; callers then record points without inertial fields.
 */
bool fusion_start(FusionState &state, bool orientation_available, bool accel_available);

/* Deactivate; discards calibration and filter state. */
void fusion_stop(FusionState &state);

/*
 * Feed one orientation sample. While Calibrating it becomes the reference
 * frame; while Active it updates the filtered lean angle.
 */
void fusion_on_orientation(FusionState &state, const OrientationSample &sample);

/* Quaternion convenience for BNO08x game rotation vector reports. */
void fusion_on_quaternion(FusionState &state, Quat q, uint64_t timestamp_us);

/*
 * Feed one gravity-free acceleration sample (device frame). Ignored until
 * calibrated and a live orientation is known.
 */
void fusion_on_accel(FusionState &state, const AccelSample &sample);

/* Outputs; NaN while not Active (or no accel sample yet for acceleration). */
float fusion_lean_deg(const FusionState &state);
float fusion_long_accel_mps2(const FusionState &state);

inline bool fusion_active(const FusionState &state) {
    return state.phase == FusionPhase::Active;
}

#endif // SENSOR_FUSION_HPP
