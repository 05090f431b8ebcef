/*
 * Unit tests for external power sense math
 * ADC conversion, EMA smoothing, presence hysteresis
 */

#include <gtest/gtest.h>
#include <cmath>
#include "logic/power_math.hpp"
#include "config.h"

// ============================================================================
// Test Suite: PowerMath_RawToVoltage
// ============================================================================

TEST(PowerMath_RawToVoltage, Midscale) {
    // 2048 * 3.3 / 4096 * 3 = 4.95V
    EXPECT_NEAR(power_raw_to_voltage(2048, 3.3f, 4096, 3.0f), 4.95f, 0.01f);
}

TEST(PowerMath_RawToVoltage, Zero) {
    EXPECT_FLOAT_EQ(power_raw_to_voltage(0, 3.3f, 4096, 3.0f), 0.0f);
}

TEST(PowerMath_RawToVoltage, UsbFiveVolts) {
    // 5.0V / 3 / 3.3 * 4096 ~ 2069
    EXPECT_NEAR(power_raw_to_voltage(2069, VBUS_ADC_VREF, VBUS_ADC_RESOLUTION,
                                     VBUS_VOLTAGE_DIVIDER), 5.0f, 0.01f);
}

TEST(PowerMath_RawToVoltage, ZeroResolutionGuard) {
    EXPECT_FLOAT_EQ(power_raw_to_voltage(2048, 3.3f, 0, 3.0f), 0.0f);
}

// ============================================================================
// Test Suite: PowerMath_Filter
// ============================================================================

TEST(PowerMath_Filter, FirstSampleSeeds) {
    PowerState state = {};
    power_update(state, 5.0f, 0.3f, 4.5f, 0.2f);
    EXPECT_TRUE(state.initialized);
    EXPECT_FLOAT_EQ(state.filtered_voltage, 5.0f);
    EXPECT_TRUE(state.present);
}

TEST(PowerMath_Filter, Smoothing) {
    PowerState state = {};
    power_update(state, 4.0f, 0.3f, 4.5f, 0.2f);
    // 0.3 * 5.0 + 0.7 * 4.0 = 4.3
    power_update(state, 5.0f, 0.3f, 4.5f, 0.2f);
    EXPECT_NEAR(state.filtered_voltage, 4.3f, 0.001f);
    EXPECT_FALSE(state.present);
}

TEST(PowerMath_Filter, SingleSpikeDoesNotDetect) {
    PowerState state = {};
    power_update(state, 0.0f, VBUS_EMA_ALPHA, VBUS_PRESENT_V, VBUS_HYSTERESIS_V);
    power_update(state, 5.0f, VBUS_EMA_ALPHA, VBUS_PRESENT_V, VBUS_HYSTERESIS_V);
    EXPECT_FALSE(state.present);
}

TEST(PowerMath_Filter, PlugDetectedWithinASecond) {
    PowerState state = {};
    power_update(state, 0.0f, VBUS_EMA_ALPHA, VBUS_PRESENT_V, VBUS_HYSTERESIS_V);
    int samples = 0;
    while (!state.present && samples < 100) {
        power_update(state, 5.1f, VBUS_EMA_ALPHA, VBUS_PRESENT_V, VBUS_HYSTERESIS_V);
        samples++;
    }
    EXPECT_TRUE(state.present);
    EXPECT_LE(static_cast<uint32_t>(samples) * VBUS_SAMPLE_INTERVAL_MS, 1000U);
}

// ============================================================================
// Test Suite: PowerMath_Hysteresis
// ============================================================================

TEST(PowerMath_Hysteresis, InsideBandKeepsState) {
    PowerState on = {};
    power_update(on, 5.0f, 1.0f, 4.5f, 0.2f);
    ASSERT_TRUE(on.present);
    power_update(on, 4.45f, 1.0f, 4.5f, 0.2f);
    EXPECT_TRUE(on.present);

    PowerState off = {};
    power_update(off, 0.0f, 1.0f, 4.5f, 0.2f);
    ASSERT_FALSE(off.present);
    power_update(off, 4.55f, 1.0f, 4.5f, 0.2f);
    EXPECT_FALSE(off.present);
}

TEST(PowerMath_Hysteresis, CrossingBandSwitches) {
    PowerState state = {};
    power_update(state, 0.0f, 1.0f, 4.5f, 0.2f);
    power_update(state, 4.61f, 1.0f, 4.5f, 0.2f);
    EXPECT_TRUE(state.present);
    power_update(state, 4.39f, 1.0f, 4.5f, 0.2f);
    EXPECT_FALSE(state.present);
}

TEST(PowerMath_Hysteresis, NoiseAroundThresholdDoesNotChatter) {
    PowerState state = {};
    power_update(state, 5.0f, 1.0f, 4.5f, 0.2f);
    int changes = 0;
    bool last = state.present;
    for (int i = 0; i < 50; i++) {
        float v = (i % 2 == 0) ? 4.47f : 4.53f;
        power_update(state, v, 1.0f, 4.5f, 0.2f);
        if (state.present != last) {
            changes++;
            last = state.present;
        }
    }
    EXPECT_EQ(changes, 0);
}
