/*
 * IMU Wrapper for BNO08x on RP2350
 * Game rotation vector (no magnetometer) and linear acceleration for lean
 * and longitudinal acceleration estimates
 */

#ifndef IMU_WRAPPER_HPP
#define IMU_WRAPPER_HPP

#include "config.h"
#include "types.h"

#include "pico/stdlib.h"

#include "hardware/gpio.h"
#include "hardware/i2c.h"

#include "bno08x.h"

#include <cstdint>

class IMU_Wrapper {
public:
    bool init();

    /**
     * @brief Drain pending sensor events into the cached samples.
     * @return true if at least one orientation or accel event arrived
     */
    bool poll();
    void flush();
    void hardware_reset();

    /* New-sample latches, cleared by the take_* calls */
    bool take_orientation(OrientationSample &out);
    bool take_accel(AccelSample &out);

    uint8_t get_rotation_accuracy() const { return last_rv_accuracy_; }

    uint16_t consecutive_failures = 0;

private:
    static constexpr uint8_t IMU_ADDR = 0x4B;
    static constexpr int MAX_DRAIN_ITERATIONS = 10;
    static constexpr int MAX_FLUSH_ITERATIONS = 200;
    static constexpr uint32_t I2C_PROBE_TIMEOUT_US = 100000;

    static constexpr int MAX_PROBE_CYCLES = 20;
    static constexpr int MAX_READ_RETRIES = 10;
    static constexpr uint32_t HINTN_WAIT_MS = 1000;
    static constexpr int BUS_RECOVERY_INTERVAL = 3;
    static constexpr uint32_t BUS_RECOVERY_SETTLE_MS = 100;
    static constexpr uint16_t SHTP_DRAIN_BUF_SIZE = 256;

    BNO08x imu_;
    Quat cached_quat_ = {1.0f, 0.0f, 0.0f, 0.0f};
    Vec3 cached_accel_ = {0.0f, 0.0f, 0.0f};
    uint64_t quat_time_us_ = 0;
    uint64_t accel_time_us_ = 0;
    bool quat_fresh_ = false;
    bool accel_fresh_ = false;

    uint8_t last_rv_accuracy_ = 0;

    void bus_recovery();
    bool probe();
    bool drain_events();
    bool enable_reports();
};

#endif // IMU_WRAPPER_HPP
