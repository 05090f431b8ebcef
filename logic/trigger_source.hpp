/*
 * Trigger Sources - Deployment policies that decide when a ride starts / pauses
 *
 * The session engine only understands Start and Pause; each policy turns its
 * own input (external power, vehicle motion, nothing at all) into those two
 * signals. Selected at build time by RIDETRACK_TRIGGER_MODE.
 * Pure logic, no hardware dependency.
 */

#ifndef TRIGGER_SOURCE_HPP
#define TRIGGER_SOURCE_HPP

#include "types.h"
#include "utils/button_debounce.hpp"

#include <cstdint>

enum class TriggerSignal : uint8_t { None, Start, Pause };

class Trigger_Source {
public:
    virtual ~Trigger_Source() = default;

    /* Inputs; a policy ignores the ones it does not use */
    virtual void on_power(uint32_t now_ms, bool external_power) { (void)now_ms; (void)external_power; }
    virtual void on_accel(uint32_t now_ms, const Vec3 &linear_accel) { (void)now_ms; (void)linear_accel; }

    /* At most one signal per call */
    virtual TriggerSignal poll(uint32_t now_ms) = 0;

    virtual const char *name() const = 0;
};

/*============================================================================
 * Power: charger / ignition connect = Start, disconnect = Pause
 *============================================================================*/
class Power_Trigger final : public Trigger_Source {
public:
    explicit Power_Trigger(uint32_t debounce_ms) : debounce_ms_(debounce_ms) {}

    void on_power(uint32_t now_ms, bool external_power) override;
    TriggerSignal poll(uint32_t now_ms) override;
    const char *name() const override { return "power"; }

private:
    uint32_t debounce_ms_;
    bool level_ = false;
    DebounceState debounce_;
};

/*============================================================================
 * Motion: acceleration above threshold = Start, sustained stillness = Pause
 *============================================================================*/
class Motion_Trigger final : public Trigger_Source {
public:
    Motion_Trigger(float threshold_mps2, uint32_t stillness_ms)
        : threshold_mps2_(threshold_mps2), stillness_ms_(stillness_ms) {}

    void on_accel(uint32_t now_ms, const Vec3 &linear_accel) override;
    TriggerSignal poll(uint32_t now_ms) override;
    const char *name() const override { return "motion"; }

    bool moving() const { return moving_; }

private:
    float threshold_mps2_;
    uint32_t stillness_ms_;
    bool motion_seen_ = false;      /* Above threshold since last poll */
    uint32_t last_motion_ms_ = 0;
    bool moving_ = false;
};

/*============================================================================
 * Manual: Start once after boot, never Pause; the record button stops
 *============================================================================*/
class Manual_Trigger final : public Trigger_Source {
public:
    TriggerSignal poll(uint32_t now_ms) override;
    const char *name() const override { return "manual"; }

private:
    bool started_ = false;
};

#endif // TRIGGER_SOURCE_HPP
