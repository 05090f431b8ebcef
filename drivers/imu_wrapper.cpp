/*
 * IMU Wrapper Implementation for BNO08x on RP2350
 */

#include "drivers/imu_wrapper.hpp"
#include "logic/nav_math.hpp"

#include "sh2.h"

#include <cstdio>

bool IMU_Wrapper::init() {
    // 1. Configure INT pin as input (HINTN: sensor asserts LOW when ready)
    gpio_init(IMU_INT_PIN);
    gpio_set_dir(IMU_INT_PIN, GPIO_IN);
    gpio_pull_up(IMU_INT_PIN);

    // 2. RST pin, LOW then HIGH for a clean hardware reset
    gpio_init(IMU_RST_PIN);
    gpio_set_dir(IMU_RST_PIN, GPIO_OUT);
    gpio_put(IMU_RST_PIN, 0);
    sleep_ms(10);
    gpio_put(IMU_RST_PIN, 1);
    sleep_ms(100);

    // 3. Initialize I2C bus
    i2c_init(i2c1, IMU_I2C_FREQ_HZ);
    gpio_set_function(IMU_SDA_PIN, GPIO_FUNC_I2C);
    gpio_set_function(IMU_SCL_PIN, GPIO_FUNC_I2C);
    gpio_pull_up(IMU_SDA_PIN);
    gpio_pull_up(IMU_SCL_PIN);

    // 4. Wait for an SHTP header before handing the bus to the library
    if (!probe()) {
        printf("[IMU] No SHTP response after %d probe cycles\n", MAX_PROBE_CYCLES);
        return false;
    }

    if (!imu_.begin(IMU_ADDR, i2c1)) {
        printf("[IMU] begin() failed\n");
        return false;
    }

    if (imu_.prodIds.numEntries > 0) {
        printf("[IMU] Firmware %u.%u.%u part=%lu\n",
               imu_.prodIds.entry[0].swVersionMajor,
               imu_.prodIds.entry[0].swVersionMinor,
               imu_.prodIds.entry[0].swVersionPatch,
               static_cast<unsigned long>(imu_.prodIds.entry[0].swPartNumber));
    }

    // 5. Dynamic calibration for accel and gyro only, the game vector ignores the magnetometer
    if (!imu_.setCalibrationConfig(SH2_CAL_ACCEL | SH2_CAL_GYRO)) {
        printf("[IMU] Warning: failed to enable calibration config\n");
    }

    if (!enable_reports()) {
        printf("[IMU] Failed to enable reports\n");
        return false;
    }

    printf("[IMU] Initialized OK\n");
    stdio_flush();
    consecutive_failures = 0;
    return true;
}

bool IMU_Wrapper::probe() {
    static constexpr uint8_t addrs[] = {0x4B, 0x4A};

    for (int cycle = 0; cycle < MAX_PROBE_CYCLES; cycle++) {
        // Some boards leave INT unconnected: the last 5 cycles poll regardless
        absolute_time_t deadline = make_timeout_time_ms(HINTN_WAIT_MS);
        bool hint = false;
        while (!time_reached(deadline)) {
            if (!gpio_get(IMU_INT_PIN)) { hint = true; break; }
            sleep_us(100);
        }
        if (!hint && cycle < MAX_PROBE_CYCLES - 5) {
            continue;
        }

        for (uint8_t addr : addrs) {
            uint8_t dummy = 0;
            if (i2c_write_timeout_us(i2c1, addr, &dummy, 1, false, I2C_PROBE_TIMEOUT_US) < 0) {
                continue;
            }

            uint8_t hdr[4] = {0};
            int rd = -2;
            for (int retry = 0; retry < MAX_READ_RETRIES && rd == -2; retry++) {
                rd = i2c_read_timeout_us(i2c1, addr, hdr, 4, false, I2C_PROBE_TIMEOUT_US);
                if (rd == -2) sleep_ms(1);
            }

            if (rd == 4) {
                uint16_t pkt_len = (hdr[0] | (hdr[1] << 8)) & 0x7FFF;
                if (pkt_len > 4) {
                    static uint8_t drain[SHTP_DRAIN_BUF_SIZE];
                    uint16_t remain = (pkt_len - 4 > SHTP_DRAIN_BUF_SIZE)
                                      ? SHTP_DRAIN_BUF_SIZE
                                      : static_cast<uint16_t>(pkt_len - 4);
                    i2c_read_timeout_us(i2c1, addr, drain, remain, false,
                                        I2C_PROBE_TIMEOUT_US);
                }
                return true;
            }
        }

        if (cycle % BUS_RECOVERY_INTERVAL == (BUS_RECOVERY_INTERVAL - 1)) {
            bus_recovery();
        }
    }
    return false;
}

void IMU_Wrapper::bus_recovery() {
    gpio_init(IMU_SDA_PIN);
    gpio_init(IMU_SCL_PIN);
    gpio_set_dir(IMU_SDA_PIN, GPIO_IN);
    gpio_set_dir(IMU_SCL_PIN, GPIO_OUT);

    // 9 clock pulses to release a stuck slave
    for (int j = 0; j < 9; j++) {
        gpio_put(IMU_SCL_PIN, 0);
        sleep_us(10);
        gpio_put(IMU_SCL_PIN, 1);
        sleep_us(10);
        if (gpio_get(IMU_SDA_PIN)) break;
    }

    // STOP condition: SDA LOW->HIGH while SCL HIGH
    gpio_set_dir(IMU_SDA_PIN, GPIO_OUT);
    gpio_put(IMU_SCL_PIN, 0);
    sleep_us(10);
    gpio_put(IMU_SDA_PIN, 0);
    sleep_us(10);
    gpio_put(IMU_SCL_PIN, 1);
    sleep_us(10);
    gpio_put(IMU_SDA_PIN, 1);
    sleep_us(10);

    gpio_set_function(IMU_SDA_PIN, GPIO_FUNC_I2C);
    gpio_set_function(IMU_SCL_PIN, GPIO_FUNC_I2C);
    gpio_pull_up(IMU_SDA_PIN);
    gpio_pull_up(IMU_SCL_PIN);
    sleep_ms(BUS_RECOVERY_SETTLE_MS);
}

bool IMU_Wrapper::poll() {
    if (drain_events()) {
        consecutive_failures = 0;
        return true;
    }
    if (consecutive_failures < UINT16_MAX) { consecutive_failures++; }
    return false;
}

void IMU_Wrapper::flush() {
    for (int i = 0; i < MAX_FLUSH_ITERATIONS; i++) {
        if (!imu_.getSensorEvent()) {
            break;
        }
    }
    quat_fresh_ = false;
    accel_fresh_ = false;
}

void IMU_Wrapper::hardware_reset() {
    gpio_put(IMU_RST_PIN, 0);
    sleep_ms(10);
    gpio_put(IMU_RST_PIN, 1);
    sleep_ms(100);

    if (imu_.begin(IMU_ADDR, i2c1) && enable_reports()) {
        printf("[IMU] Recovered after hardware reset\n");
        consecutive_failures = 0;
    } else {
        printf("[IMU] Hardware reset did not recover sensor\n");
    }
}

bool IMU_Wrapper::take_orientation(OrientationSample &out) {
    if (!quat_fresh_) {
        return false;
    }
    quaternion_to_rotation_matrix(cached_quat_, out.R);
    out.timestamp_us = quat_time_us_;
    quat_fresh_ = false;
    return true;
}

bool IMU_Wrapper::take_accel(AccelSample &out) {
    if (!accel_fresh_) {
        return false;
    }
    out.linear_accel = cached_accel_;
    out.timestamp_us = accel_time_us_;
    accel_fresh_ = false;
    return true;
}

bool IMU_Wrapper::drain_events() {
    bool got_event = false;

    for (int i = 0; i < MAX_DRAIN_ITERATIONS; i++) {
        if (!imu_.getSensorEvent()) {
            break;
        }

        uint8_t event_id = imu_.getSensorEventID();
        uint64_t now_us = time_us_64();

        if (event_id == SH2_GAME_ROTATION_VECTOR) {
            cached_quat_.x = imu_.getGameQuatI();
            cached_quat_.y = imu_.getGameQuatJ();
            cached_quat_.z = imu_.getGameQuatK();
            cached_quat_.w = imu_.getGameQuatReal();
            last_rv_accuracy_ = imu_.getQuatAccuracy();
            quat_time_us_ = now_us;
            quat_fresh_ = true;
            got_event = true;
        } else if (event_id == SH2_LINEAR_ACCELERATION) {
            cached_accel_.x = imu_.getLinAccelX();
            cached_accel_.y = imu_.getLinAccelY();
            cached_accel_.z = imu_.getLinAccelZ();
            accel_time_us_ = now_us;
            accel_fresh_ = true;
            got_event = true;
        }
    }

    return got_event;
}

bool IMU_Wrapper::enable_reports() {
    if (!imu_.enableGameRotationVector(IMU_REPORT_INTERVAL_MS)) {
        printf("[IMU] Failed to enable game rotation vector\n");
        return false;
    }
    if (!imu_.enableLinearAccelerometer(IMU_REPORT_INTERVAL_MS)) {
        printf("[IMU] Failed to enable linear accel\n");
        return false;
    }
    printf("[IMU] Game RV + linear accel enabled at %u ms\n",
           static_cast<unsigned>(IMU_REPORT_INTERVAL_MS));
    stdio_flush();
    return true;
}
