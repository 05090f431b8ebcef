/*
 * Trigger Sources Implementation
 */

#include "logic/trigger_source.hpp"

/*============================================================================
 * Power
 *============================================================================*/

void Power_Trigger::on_power(uint32_t now_ms, bool external_power) {
    (void)now_ms;
    level_ = external_power;
}

TriggerSignal Power_Trigger::poll(uint32_t now_ms) {
    switch (debounce_update(now_ms, level_, debounce_ms_, debounce_)) {
        case DebounceEdge::Rising:  return TriggerSignal::Start;
        case DebounceEdge::Falling: return TriggerSignal::Pause;
        case DebounceEdge::None:    break;
    }
    return TriggerSignal::None;
}

/*============================================================================
 * Motion
 *============================================================================*/

void Motion_Trigger::on_accel(uint32_t now_ms, const Vec3 &a) {
    /* Squared compare, no sqrt on the sample path */
    float mag2 = a.x * a.x + a.y * a.y + a.z * a.z;
    if (mag2 > threshold_mps2_ * threshold_mps2_) {
        motion_seen_ = true;
        last_motion_ms_ = now_ms;
    }
}

TriggerSignal Motion_Trigger::poll(uint32_t now_ms) {
    if (!moving_) {
        if (motion_seen_) {
            moving_ = true;
            motion_seen_ = false;
            return TriggerSignal::Start;
        }
        return TriggerSignal::None;
    }

    motion_seen_ = false;
    if (now_ms - last_motion_ms_ >= stillness_ms_) {
        moving_ = false;
        return TriggerSignal::Pause;
    }
    return TriggerSignal::None;
}

/*============================================================================
 * Manual
 *============================================================================*/

TriggerSignal Manual_Trigger::poll(uint32_t now_ms) {
    (void)now_ms;
    if (started_) {
        return TriggerSignal::None;
    }
    started_ = true;
    return TriggerSignal::Start;
}
