/*
 * Session Engine - Recording lifecycle state machine
 *
 * Idle -> Recording -> PendingFinalize -> (Recording | Idle)
 *
 * Every input (trigger edge, GPS fix, IMU sample, periodic tick) arrives as a
 * SessionEvent through apply(); the returned effect flags tell the main loop
 * what happened. All timers are deadlines held in the engine and evaluated on
 * Tick, so disarming them is a plain state change.
 *
 * Single-threaded: call from the main loop only.
 */

#ifndef SESSION_ENGINE_HPP
#define SESSION_ENGINE_HPP

#include "types.h"
#include "config.h"
#include "logic/increment_log.hpp"
#include "logic/motion_analytics.hpp"
#include "logic/sensor_fusion.hpp"
#include "logic/track_format.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

/*============================================================================
 * Effect Flags (returned by apply)
 *============================================================================*/
#define SESSION_FX_STARTED          0x0001U  /* New session, new token */
#define SESSION_FX_RESUMED          0x0002U  /* Pause cancelled, same token */
#define SESSION_FX_PAUSED           0x0004U  /* Finalize deadline armed */
#define SESSION_FX_FINALIZED        0x0008U  /* Track written, session closed */
#define SESSION_FX_FINALIZE_EMPTY   0x0010U  /* Session closed without points */
#define SESSION_FX_FINALIZE_FAILED  0x0020U  /* Still PendingFinalize, will retry */
#define SESSION_FX_STATS_READY      0x0040U  /* stats() refreshed */
#define SESSION_FX_SEGMENT_WRITTEN  0x0080U
#define SESSION_FX_SEGMENT_FAILED   0x0100U  /* Buffer kept */
#define SESSION_FX_BUFFER_WARNING   0x0200U  /* Unflushed points crossed the warn level */
#define SESSION_FX_FIX_RECORDED     0x0400U

enum class SessionPhase : uint8_t { Idle, Recording, PendingFinalize };

enum class SessionEventType : uint8_t { Start, Pause, Stop, Fix, Orientation, Accel, Tick };

/*============================================================================
 * Events
 *============================================================================
 * now_ms: monotonic milliseconds since boot (wraps; only differences used).
 * utc_ms: wall clock for the session token, Start only.
 */
struct SessionEvent {
    SessionEventType type = SessionEventType::Tick;
    uint32_t now_ms = 0;
    int64_t utc_ms = 0;
    LocationFix fix;
    OrientationSample orientation = {};
    AccelSample accel = {};
};

inline SessionEvent make_session_event(SessionEventType type, uint32_t now_ms) {
    SessionEvent e;
    e.type = type;
    e.now_ms = now_ms;
    return e;
}

inline SessionEvent make_start_event(uint32_t now_ms, int64_t utc_ms) {
    SessionEvent e = make_session_event(SessionEventType::Start, now_ms);
    e.utc_ms = utc_ms;
    return e;
}

inline SessionEvent make_fix_event(uint32_t now_ms, const LocationFix &fix) {
    SessionEvent e = make_session_event(SessionEventType::Fix, now_ms);
    e.fix = fix;
    return e;
}

inline SessionEvent make_orientation_event(uint32_t now_ms, const OrientationSample &sample) {
    SessionEvent e = make_session_event(SessionEventType::Orientation, now_ms);
    e.orientation = sample;
    return e;
}

inline SessionEvent make_accel_event(uint32_t now_ms, const AccelSample &sample) {
    SessionEvent e = make_session_event(SessionEventType::Accel, now_ms);
    e.accel = sample;
    return e;
}

/*============================================================================
 * Runtime Configuration
 *============================================================================*/
struct SessionConfig {
    uint32_t finalize_timeout_ms = FINALIZE_TIMEOUT_MS;
    uint32_t stats_interval_ms = STATS_INTERVAL_MS;
    uint32_t flush_interval_ms = FLUSH_INTERVAL_MS;
    uint32_t buffer_warn_points = BUFFER_WARN_POINTS;
    bool orientation_available = false;   /* Set from IMU init result */
    bool accel_available = false;
};

/* Result of begin(): sessions left behind by an unclean shutdown */
struct RecoveryReport {
    uint32_t found;
    uint32_t recovered;
    uint32_t empty;
    uint32_t failed;       /* Segments kept, retried next boot */
    uint32_t purged_files;
};

struct SessionCounters {
    uint32_t sessions_started;
    uint32_t sessions_finalized;
    uint32_t fixes_recorded;
    uint32_t fixes_ignored;          /* Arrived while not Recording */
    uint32_t flush_failures;
    uint32_t finalize_failures;
};

/*============================================================================
 * Session Engine Class
 *============================================================================*/
class Session_Engine {
public:
    Session_Engine(Increment_Log &log, const SessionConfig &config);

    /* Disable copy/move */
    Session_Engine(const Session_Engine&) = delete;
    Session_Engine& operator=(const Session_Engine&) = delete;

    /**
     * @brief Recover orphaned sessions, then enter Idle.
     * Purges leftovers of finalized tracks, merges and deletes every orphan.
     * apply() is a no-op until this has run.
     */
    RecoveryReport begin();

    /**
     * @brief Feed one event.
     * @return SESSION_FX_* bitfield
     */
    uint16_t apply(const SessionEvent &event);

    SessionPhase phase() const { return phase_; }
    bool is_running() const { return running_; }
    bool finalize_retry_pending() const { return finalize_retry_; }

    /* Last payload computed on a stats tick */
    const SessionStats &stats() const { return stats_; }

    /* Empty string while Idle */
    const char *token() const { return token_; }

    size_t buffered_points() const { return buffer_.size(); }
    uint32_t next_sequence() const { return next_seq_; }
    double distance_m() const { return distance_m_; }
    FusionPhase fusion_phase() const { return fusion_.phase; }

    /* Track produced by the most recent FINALIZED effect */
    const char *last_track_name() const { return last_track_name_; }
    const TrackSummary &last_summary() const { return last_summary_; }

    SessionCounters get_counters() const { return counters_; }

private:
    uint16_t on_start(const SessionEvent &e);
    uint16_t on_pause(const SessionEvent &e);
    uint16_t on_stop(const SessionEvent &e);
    uint16_t on_fix(const SessionEvent &e);
    uint16_t on_tick(const SessionEvent &e);

    bool allocate_token(int64_t utc_ms);
    bool token_taken(const char *token);
    uint16_t flush_buffer();
    uint16_t finalize(uint32_t now_ms);
    void enter_finalize_retry(uint32_t now_ms);
    void reset_session();
    void refresh_stats(uint32_t now_ms);

    Increment_Log &log_;
    SessionConfig config_;

    bool begun_ = false;
    SessionPhase phase_ = SessionPhase::Idle;
    bool running_ = false;

    /* Session */
    char token_[TOKEN_BUF] = {};
    uint32_t start_ms_ = 0;
    uint32_t next_seq_ = 0;
    double distance_m_ = 0.0;
    TrackPoint last_point_;
    bool have_last_point_ = false;
    std::vector<TrackPoint> buffer_;
    bool buffer_warned_ = false;

    /* Timers: armed flag + reference time */
    bool stats_armed_ = false;
    uint32_t last_stats_ms_ = 0;
    bool flush_armed_ = false;
    uint32_t last_flush_ms_ = 0;
    bool finalize_armed_ = false;
    uint32_t pause_start_ms_ = 0;
    bool finalize_retry_ = false;
    uint32_t last_retry_ms_ = 0;

    /* Fix quality */
    float current_accuracy_m_ = 0.0f;
    double accuracy_sum_ = 0.0;
    uint32_t accuracy_count_ = 0;
    bool have_fix_rx_ = false;
    uint32_t last_fix_rx_ms_ = 0;
    float current_rate_hz_ = 0.0f;
    double rate_sum_ = 0.0;
    uint32_t rate_count_ = 0;

    FusionState fusion_;

    SessionStats stats_ = {};
    char last_track_name_[STORAGE_PATH_MAX] = {};
    TrackSummary last_summary_ = {};
    SessionCounters counters_ = {};
};

#endif // SESSION_ENGINE_HPP
