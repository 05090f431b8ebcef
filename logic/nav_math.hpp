/*
 * Orientation Math - Rotation matrix helpers for sensor fusion
 * Row-major double[3][3], device-to-world convention
 */

#ifndef NAV_MATH_HPP
#define NAV_MATH_HPP

#include "types.h"

#ifdef __cplusplus
extern "C" {
#endif

/*============================================================================
 * Quaternion to Rotation Matrix
 *============================================================================
 * Converts unit quaternion to 3x3 rotation matrix using Shoemake 1985
 * algebraic form. Normalizes quaternion internally with threshold guard.
 * Degenerate input (zero-length) yields identity matrix.
 */
void quaternion_to_rotation_matrix(Quat q, double R[3][3]);

/*============================================================================
 * Matrix Helpers
 *============================================================================
 * out must not alias the inputs.
 */
void mat3_transpose(const double src[3][3], double out[3][3]);
void mat3_multiply(const double a[3][3], const double b[3][3], double out[3][3]);
void mat3_rotate(const double R[3][3], const double v[3], double out[3]);
void mat3_copy(const double src[3][3], double out[3][3]);

/*============================================================================
 * Low-Pass Filter Coefficient
 *============================================================================
 * Single-pole RC filter discretised for a variable sample interval:
 *   RC = 1 / (2*pi*fc),  alpha = dt / (RC + dt)
 * Returns 1.0 (pass-through) for non-positive dt or cutoff.
 */
double lowpass_alpha(double dt_s, double cutoff_hz);

#ifdef __cplusplus
}
#endif

#endif // NAV_MATH_HPP
