/*
 * Orientation Math - implementation
 */

#include "logic/nav_math.hpp"
#include <cmath>

/*============================================================================
 * Quaternion to Rotation Matrix
 *============================================================================*/
void quaternion_to_rotation_matrix(Quat q, double R[3][3]) {
    double w = static_cast<double>(q.w);
    double x = static_cast<double>(q.x);
    double y = static_cast<double>(q.y);
    double z = static_cast<double>(q.z);

    double norm_sq = w * w + x * x + y * y + z * z;

    /* Normalize with threshold guard to avoid division by near-zero */
    if (norm_sq < 1e-12) {
        /* Degenerate quaternion - set identity matrix */
        R[0][0] = 1.0; R[0][1] = 0.0; R[0][2] = 0.0;
        R[1][0] = 0.0; R[1][1] = 1.0; R[1][2] = 0.0;
        R[2][0] = 0.0; R[2][1] = 0.0; R[2][2] = 1.0;
        return;
    }

    double inv_n = 1.0 / sqrt(norm_sq);
    w *= inv_n;
    x *= inv_n;
    y *= inv_n;
    z *= inv_n;

    double xx = x * x;
    double yy = y * y;
    double zz = z * z;
    double xy = x * y;
    double xz = x * z;
    double yz = y * z;
    double wx = w * x;
    double wy = w * y;
    double wz = w * z;

    R[0][0] = 1.0 - 2.0 * (yy + zz);
    R[0][1] = 2.0 * (xy - wz);
    R[0][2] = 2.0 * (xz + wy);

    R[1][0] = 2.0 * (xy + wz);
    R[1][1] = 1.0 - 2.0 * (xx + zz);
    R[1][2] = 2.0 * (yz - wx);

    R[2][0] = 2.0 * (xz - wy);
    R[2][1] = 2.0 * (yz + wx);
    R[2][2] = 1.0 - 2.0 * (xx + yy);
}

/*============================================================================
 * Matrix Helpers
 *============================================================================*/
void mat3_transpose(const double src[3][3], double out[3][3]) {
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            out[r][c] = src[c][r];
        }
    }
}

void mat3_multiply(const double a[3][3], const double b[3][3], double out[3][3]) {
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            out[r][c] = a[r][0] * b[0][c] + a[r][1] * b[1][c] + a[r][2] * b[2][c];
        }
    }
}

void mat3_rotate(const double R[3][3], const double v[3], double out[3]) {
    for (int r = 0; r < 3; r++) {
        out[r] = R[r][0] * v[0] + R[r][1] * v[1] + R[r][2] * v[2];
    }
}

void mat3_copy(const double src[3][3], double out[3][3]) {
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            out[r][c] = src[r][c];
        }
    }
}

/*============================================================================
 * Low-Pass Filter Coefficient
 *============================================================================*/
double lowpass_alpha(double dt_s, double cutoff_hz) {
    if (dt_s <= 0.0 || cutoff_hz <= 0.0) {
        return 1.0;
    }
    double rc = 1.0 / (2.0 * M_PI * cutoff_hz);
    return dt_s / (rc + dt_s);
}
