#include <gtest/gtest.h>
#include <cmath>
#include "logic/nav_math.hpp"

constexpr double TOL = 1e-10;
constexpr double COS45 = 0.7071067811865476; // cos(π/4)
constexpr double SIN45 = 0.7071067811865476; // sin(π/4)

#define EXPECT_DOUBLE_NEAR(val1, val2) EXPECT_NEAR(val1, val2, TOL)

static void expect_identity(const double R[3][3]) {
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            EXPECT_DOUBLE_NEAR(R[r][c], r == c ? 1.0 : 0.0);
        }
    }
}

// Rotation about X (roll) by angle in degrees
static void rot_x(double deg, double R[3][3]) {
    double a = deg * M_PI / 180.0;
    double c = cos(a);
    double s = sin(a);
    R[0][0] = 1.0; R[0][1] = 0.0; R[0][2] = 0.0;
    R[1][0] = 0.0; R[1][1] = c;   R[1][2] = -s;
    R[2][0] = 0.0; R[2][1] = s;   R[2][2] = c;
}

// ============================================================================
// Test Suite: QuaternionToRotationMatrix
// ============================================================================

TEST(QuaternionToRotationMatrix, IdentityQuaternion) {
    Quat q = {.w = 1.0f, .x = 0.0f, .y = 0.0f, .z = 0.0f};
    double R[3][3];
    quaternion_to_rotation_matrix(q, R);
    expect_identity(R);
}

TEST(QuaternionToRotationMatrix, Rotation90Z) {
    Quat q = {.w = static_cast<float>(COS45), .x = 0.0f, .y = 0.0f, .z = static_cast<float>(SIN45)};
    double R[3][3];
    quaternion_to_rotation_matrix(q, R);

    // 90° rotation about Z-axis: [[0,-1,0],[1,0,0],[0,0,1]]
    EXPECT_NEAR(R[0][0], 0.0, 1e-6);
    EXPECT_NEAR(R[0][1], -1.0, 1e-6);
    EXPECT_NEAR(R[1][0], 1.0, 1e-6);
    EXPECT_NEAR(R[1][1], 0.0, 1e-6);
    EXPECT_NEAR(R[2][2], 1.0, 1e-6);
}

TEST(QuaternionToRotationMatrix, Rotation90XMatchesRollMatrix) {
    Quat q = {.w = static_cast<float>(COS45), .x = static_cast<float>(SIN45), .y = 0.0f, .z = 0.0f};
    double R[3][3];
    double expected[3][3];
    quaternion_to_rotation_matrix(q, R);
    rot_x(90.0, expected);

    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            EXPECT_NEAR(R[r][c], expected[r][c], 1e-6);
        }
    }
}

TEST(QuaternionToRotationMatrix, DegenerateZeroQuaternion) {
    Quat q = {.w = 0.0f, .x = 0.0f, .y = 0.0f, .z = 0.0f};
    double R[3][3];
    quaternion_to_rotation_matrix(q, R);
    expect_identity(R);
}

TEST(QuaternionToRotationMatrix, NonUnitQuaternionNormalized) {
    Quat q = {.w = 2.0f, .x = 0.0f, .y = 0.0f, .z = 0.0f};
    double R[3][3];
    quaternion_to_rotation_matrix(q, R);
    expect_identity(R);
}

// ============================================================================
// Test Suite: Mat3
// ============================================================================

TEST(Mat3, TransposeOfRotationIsInverse) {
    double R[3][3];
    double Rt[3][3];
    double product[3][3];
    rot_x(37.0, R);
    mat3_transpose(R, Rt);
    mat3_multiply(R, Rt, product);
    expect_identity(product);
}

TEST(Mat3, TransposeSwapsOffDiagonal) {
    const double src[3][3] = {{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};
    double out[3][3];
    mat3_transpose(src, out);
    EXPECT_DOUBLE_NEAR(out[0][1], 4.0);
    EXPECT_DOUBLE_NEAR(out[1][0], 2.0);
    EXPECT_DOUBLE_NEAR(out[2][0], 3.0);
    EXPECT_DOUBLE_NEAR(out[1][1], 5.0);
}

TEST(Mat3, MultiplyComposesRotations) {
    double a[3][3];
    double b[3][3];
    double expected[3][3];
    double out[3][3];
    rot_x(20.0, a);
    rot_x(25.0, b);
    rot_x(45.0, expected);
    mat3_multiply(a, b, out);
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            EXPECT_DOUBLE_NEAR(out[r][c], expected[r][c]);
        }
    }
}

TEST(Mat3, RotateVector) {
    double R[3][3];
    rot_x(90.0, R);
    const double v[3] = {0.0, 1.0, 0.0};
    double out[3];
    mat3_rotate(R, v, out);

    // Y axis rolled 90° about X lands on Z
    EXPECT_DOUBLE_NEAR(out[0], 0.0);
    EXPECT_DOUBLE_NEAR(out[1], 0.0);
    EXPECT_DOUBLE_NEAR(out[2], 1.0);
}

TEST(Mat3, CopyIsExact) {
    double src[3][3];
    double out[3][3] = {};
    rot_x(12.5, src);
    mat3_copy(src, out);
    for (int r = 0; r < 3; r++) {
        for (int c = 0; c < 3; c++) {
            EXPECT_EQ(out[r][c], src[r][c]);
        }
    }
}

// ============================================================================
// Test Suite: LowpassAlpha
// ============================================================================

TEST(LowpassAlpha, FiftyHzAtTwoHzCutoff) {
    // RC = 1/(2π·2) = 0.0795775; alpha = 0.02 / (0.0795775 + 0.02)
    EXPECT_NEAR(lowpass_alpha(0.02, 2.0), 0.02 / (1.0 / (4.0 * M_PI) + 0.02), 1e-12);
    EXPECT_NEAR(lowpass_alpha(0.02, 2.0), 0.2008, 1e-3);
}

TEST(LowpassAlpha, LongerIntervalWeighsNewSampleMore) {
    EXPECT_GT(lowpass_alpha(0.1, 2.0), lowpass_alpha(0.02, 2.0));
    EXPECT_LT(lowpass_alpha(10.0, 2.0), 1.0);
}

TEST(LowpassAlpha, NonPositiveInputsPassThrough) {
    EXPECT_DOUBLE_NEAR(lowpass_alpha(0.0, 2.0), 1.0);
    EXPECT_DOUBLE_NEAR(lowpass_alpha(-0.01, 2.0), 1.0);
    EXPECT_DOUBLE_NEAR(lowpass_alpha(0.02, 0.0), 1.0);
}
