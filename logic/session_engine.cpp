/*
 * Session Engine Implementation
 */

#include "logic/session_engine.hpp"
#include "logic/geo_math.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <string>

static constexpr float NaNf = std::numeric_limits<float>::quiet_NaN();

/* Upper bound on token bumps; one per second of clock skew */
static constexpr int TOKEN_BUMP_LIMIT = 3600;

static inline void bump(uint32_t &counter) {
    if (counter < UINT32_MAX) {
        counter++;
    }
}

Session_Engine::Session_Engine(Increment_Log &log, const SessionConfig &config)
    : log_(log), config_(config) {
    stats_.current_accuracy_m = NaNf;
    stats_.avg_accuracy_m = NaNf;
    stats_.current_update_rate_hz = NaNf;
    stats_.avg_update_rate_hz = NaNf;
}

/*============================================================================
 * Recovery
 *============================================================================*/

RecoveryReport Session_Engine::begin() {
    RecoveryReport report = {};
    if (begun_) {
        return report;
    }

    if (!log_.init()) {
        printf("[SESSION] Storage layout incomplete, recording may fail\n");
    }
    report.purged_files = log_.purge_finalized_leftovers();

    std::vector<OrphanSession> orphans;
    if (!log_.list_orphan_sessions(orphans)) {
        printf("[SESSION] Could not scan %s/ for orphans\n", INCREMENT_DIR);
    }

    for (const OrphanSession &orphan : orphans) {
        report.found++;
        MergeResult result = log_.merge_to_final_track(orphan.token.c_str(), orphan.files);
        switch (result) {
            case MergeResult::Written:
                report.recovered++;
                break;
            case MergeResult::Empty:
                report.empty++;
                break;
            case MergeResult::Failed:
                report.failed++;
                printf("[SESSION] Recovery of %s failed, segments kept\n", orphan.token.c_str());
                continue;
        }
        if (!log_.delete_segments(orphan.token.c_str())) {
            printf("[SESSION] Segments of %s not fully deleted\n", orphan.token.c_str());
        }
    }

    if (report.found > 0) {
        printf("[SESSION] Recovered %lu/%lu orphan sessions (%lu empty, %lu failed)\n",
               static_cast<unsigned long>(report.recovered),
               static_cast<unsigned long>(report.found),
               static_cast<unsigned long>(report.empty),
               static_cast<unsigned long>(report.failed));
    }

    phase_ = SessionPhase::Idle;
    begun_ = true;
    return report;
}

/*============================================================================
 * Event Dispatch
 *============================================================================*/

uint16_t Session_Engine::apply(const SessionEvent &event) {
    if (!begun_) {
        return 0;
    }

    switch (event.type) {
        case SessionEventType::Start:
            return on_start(event);
        case SessionEventType::Pause:
            return on_pause(event);
        case SessionEventType::Stop:
            return on_stop(event);
        case SessionEventType::Fix:
            return on_fix(event);
        case SessionEventType::Orientation:
            fusion_on_orientation(fusion_, event.orientation);
            return 0;
        case SessionEventType::Accel:
            fusion_on_accel(fusion_, event.accel);
            return 0;
        case SessionEventType::Tick:
            return on_tick(event);
    }
    return 0;
}

/*============================================================================
 * Transitions
 *============================================================================*/

uint16_t Session_Engine::on_start(const SessionEvent &e) {
    if (phase_ == SessionPhase::Recording) {
        return 0;
    }

    if (phase_ == SessionPhase::PendingFinalize) {
        /* Resume: token, buffer, sequence, distance and start time carry over */
        finalize_armed_ = false;
        finalize_retry_ = false;
        phase_ = SessionPhase::Recording;
        flush_armed_ = true;
        last_flush_ms_ = e.now_ms;
        fusion_start(fusion_, config_.orientation_available, config_.accel_available);
        printf("[SESSION] Resumed %s after %lu ms\n", token_,
               static_cast<unsigned long>(e.now_ms - pause_start_ms_));
        return SESSION_FX_RESUMED;
    }

    reset_session();
    if (!allocate_token(e.utc_ms)) {
        printf("[SESSION] No free token near %lld, start refused\n",
               static_cast<long long>(e.utc_ms));
        return 0;
    }

    phase_ = SessionPhase::Recording;
    running_ = true;
    start_ms_ = e.now_ms;
    stats_armed_ = true;
    last_stats_ms_ = e.now_ms;
    flush_armed_ = true;
    last_flush_ms_ = e.now_ms;
    fusion_start(fusion_, config_.orientation_available, config_.accel_available);
    bump(counters_.sessions_started);

    printf("[SESSION] Started %s (fusion %s)\n", token_,
           fusion_.phase == FusionPhase::Inactive ? "off" : "on");
    return SESSION_FX_STARTED;
}

uint16_t Session_Engine::on_pause(const SessionEvent &e) {
    if (phase_ != SessionPhase::Recording) {
        return 0;
    }

    uint16_t fx = flush_buffer();
    last_flush_ms_ = e.now_ms;
    fusion_stop(fusion_);
    have_fix_rx_ = false;

    phase_ = SessionPhase::PendingFinalize;
    finalize_armed_ = true;
    pause_start_ms_ = e.now_ms;

    printf("[SESSION] Paused %s, finalize in %lu s\n", token_,
           static_cast<unsigned long>(config_.finalize_timeout_ms / 1000U));
    return fx | SESSION_FX_PAUSED;
}

uint16_t Session_Engine::on_stop(const SessionEvent &e) {
    if (phase_ == SessionPhase::Idle) {
        return 0;
    }
    if (phase_ == SessionPhase::Recording) {
        pause_start_ms_ = e.now_ms;
    }
    return finalize(e.now_ms);
}

/*============================================================================
 * Fix Recording
 *============================================================================*/

uint16_t Session_Engine::on_fix(const SessionEvent &e) {
    if (phase_ != SessionPhase::Recording) {
        bump(counters_.fixes_ignored);
        return 0;
    }

    const LocationFix &fix = e.fix;
    TrackPoint point;
    point.latitude = fix.latitude;
    point.longitude = fix.longitude;
    point.elevation = fix.has_altitude ? fix.altitude_m : 0.0;
    point.speed_mps = fix.has_speed ? fix.speed_mps : 0.0f;
    point.timestamp_ms = fix.utc_ms;
    point.lean_deg = fusion_lean_deg(fusion_);
    point.long_accel_mps2 = fusion_long_accel_mps2(fusion_);

    if (have_last_point_) {
        distance_m_ += haversine_m(last_point_, point);
    }
    last_point_ = point;
    have_last_point_ = true;
    buffer_.push_back(point);
    bump(counters_.fixes_recorded);

    /* Fix quality */
    if (fix.has_accuracy) {
        current_accuracy_m_ = fix.accuracy_m;
        accuracy_sum_ += fix.accuracy_m;
        accuracy_count_++;
    }
    if (have_fix_rx_) {
        uint32_t dt = e.now_ms - last_fix_rx_ms_;
        if (dt > 0) {
            current_rate_hz_ = 1000.0f / static_cast<float>(dt);
            rate_sum_ += current_rate_hz_;
            rate_count_++;
        }
    }
    have_fix_rx_ = true;
    last_fix_rx_ms_ = e.now_ms;

    uint16_t fx = SESSION_FX_FIX_RECORDED;
    if (!buffer_warned_ && buffer_.size() > config_.buffer_warn_points) {
        buffer_warned_ = true;
        fx |= SESSION_FX_BUFFER_WARNING;
    }
    return fx;
}

/*============================================================================
 * Timers
 *============================================================================*/

uint16_t Session_Engine::on_tick(const SessionEvent &e) {
    if (phase_ == SessionPhase::Idle) {
        return 0;
    }

    const uint32_t now = e.now_ms;
    uint16_t fx = 0;

    if (finalize_retry_) {
        if (now - last_retry_ms_ >= config_.flush_interval_ms) {
            fx |= finalize(now);
        }
    } else if (finalize_armed_ && now - pause_start_ms_ >= config_.finalize_timeout_ms) {
        printf("[SESSION] Pause window elapsed for %s\n", token_);
        fx |= finalize(now);
    } else if (flush_armed_ && now - last_flush_ms_ >= config_.flush_interval_ms &&
               (phase_ == SessionPhase::Recording || !buffer_.empty())) {
        last_flush_ms_ = now;
        fx |= flush_buffer();
    }

    if (stats_armed_ && now - last_stats_ms_ >= config_.stats_interval_ms) {
        last_stats_ms_ = now;
        refresh_stats(now);
        fx |= SESSION_FX_STATS_READY;
    }
    return fx;
}

uint16_t Session_Engine::flush_buffer() {
    if (buffer_.empty()) {
        return 0;
    }
    if (!log_.write_segment(token_, next_seq_, buffer_.data(), buffer_.size())) {
        bump(counters_.flush_failures);
        return SESSION_FX_SEGMENT_FAILED;
    }
    buffer_.clear();
    buffer_warned_ = false;
    next_seq_++;
    return SESSION_FX_SEGMENT_WRITTEN;
}

/*============================================================================
 * Finalize
 *============================================================================*/

uint16_t Session_Engine::finalize(uint32_t now_ms) {
    fusion_stop(fusion_);
    flush_armed_ = false;

    uint16_t fx = flush_buffer();
    if (!buffer_.empty()) {
        printf("[SESSION] Finalize of %s deferred, %lu points unflushed\n", token_,
               static_cast<unsigned long>(buffer_.size()));
        enter_finalize_retry(now_ms);
        return fx | SESSION_FX_FINALIZE_FAILED;
    }

    std::vector<std::string> files;
    if (!log_.list_segments(token_, files)) {
        printf("[SESSION] Finalize of %s deferred, segments not listable\n", token_);
        enter_finalize_retry(now_ms);
        return fx | SESSION_FX_FINALIZE_FAILED;
    }

    TrackSummary summary = {};
    MergeResult result = log_.merge_to_final_track(token_, files, &summary);
    if (result == MergeResult::Failed) {
        enter_finalize_retry(now_ms);
        return fx | SESSION_FX_FINALIZE_FAILED;
    }

    /* Merge committed; a failed delete is cleaned up at next boot */
    if (!log_.delete_segments(token_)) {
        printf("[SESSION] Segments of %s not fully deleted\n", token_);
    }

    if (result == MergeResult::Written) {
        if (!track_file_name(token_, last_track_name_, sizeof(last_track_name_))) {
            last_track_name_[0] = '\0';
        }
        last_summary_ = summary;
        fx |= SESSION_FX_FINALIZED;
        printf("[SESSION] Finalized %s: %lu points, %.0f m\n", last_track_name_,
               static_cast<unsigned long>(summary.point_count), summary.distance_m);
    } else {
        last_track_name_[0] = '\0';
        last_summary_ = TrackSummary{};
        fx |= SESSION_FX_FINALIZE_EMPTY;
        printf("[SESSION] Closed %s without points\n", token_);
    }

    bump(counters_.sessions_finalized);
    reset_session();
    return fx;
}

void Session_Engine::enter_finalize_retry(uint32_t now_ms) {
    bump(counters_.finalize_failures);
    phase_ = SessionPhase::PendingFinalize;
    finalize_armed_ = false;
    finalize_retry_ = true;
    last_retry_ms_ = now_ms;
}

/* Back to Idle: every timer disarmed together */
void Session_Engine::reset_session() {
    phase_ = SessionPhase::Idle;
    running_ = false;
    fusion_stop(fusion_);

    token_[0] = '\0';
    start_ms_ = 0;
    next_seq_ = 0;
    distance_m_ = 0.0;
    last_point_ = TrackPoint{};
    have_last_point_ = false;
    buffer_.clear();
    buffer_warned_ = false;

    stats_armed_ = false;
    flush_armed_ = false;
    finalize_armed_ = false;
    finalize_retry_ = false;

    current_accuracy_m_ = 0.0f;
    accuracy_sum_ = 0.0;
    accuracy_count_ = 0;
    have_fix_rx_ = false;
    current_rate_hz_ = 0.0f;
    rate_sum_ = 0.0;
    rate_count_ = 0;
}

/*============================================================================
 * Token
 *============================================================================*/

bool Session_Engine::token_taken(const char *token) {
    if (log_.final_track_exists(token)) {
        return true;
    }
    std::vector<std::string> files;
    return log_.list_segments(token, files) && !files.empty();
}

bool Session_Engine::allocate_token(int64_t utc_ms) {
    for (int i = 0; i < TOKEN_BUMP_LIMIT; i++) {
        if (!format_token(utc_ms, token_, sizeof(token_))) {
            break;
        }
        if (!token_taken(token_)) {
            return true;
        }
        utc_ms += 1000;
    }
    token_[0] = '\0';
    return false;
}

/*============================================================================
 * Statistics
 *============================================================================*/

void Session_Engine::refresh_stats(uint32_t now_ms) {
    stats_.distance_m = distance_m_;
    stats_.duration_ms = now_ms - start_ms_;
    stats_.is_recording = phase_ == SessionPhase::Recording;
    if (!track_file_name(token_, stats_.file_name, sizeof(stats_.file_name))) {
        stats_.file_name[0] = '\0';
    }

    stats_.paused_for_ms = 0;
    stats_.pause_timeout_remaining_ms = 0;
    if (phase_ == SessionPhase::PendingFinalize) {
        uint32_t paused = now_ms - pause_start_ms_;
        stats_.paused_for_ms = paused;
        if (finalize_armed_ && paused < config_.finalize_timeout_ms) {
            stats_.pause_timeout_remaining_ms = config_.finalize_timeout_ms - paused;
        }
    }

    if (accuracy_count_ > 0) {
        stats_.current_accuracy_m = current_accuracy_m_;
        stats_.avg_accuracy_m = static_cast<float>(accuracy_sum_ / accuracy_count_);
    } else {
        stats_.current_accuracy_m = NaNf;
        stats_.avg_accuracy_m = NaNf;
    }
    if (rate_count_ > 0) {
        stats_.current_update_rate_hz = current_rate_hz_;
        stats_.avg_update_rate_hz = static_cast<float>(rate_sum_ / rate_count_);
    } else {
        stats_.current_update_rate_hz = NaNf;
        stats_.avg_update_rate_hz = NaNf;
    }
}
