/*
 * Unit tests for Session_Engine over Increment_Log and the in-memory storage
 * Tests: Begin, Start, Fix, Flush, PauseResume, Finalize, Stats, Fusion
 */

#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>

#include "logic/session_engine.hpp"
#include "logic/increment_log.hpp"
#include "logic/track_format.hpp"
#include "config.h"
#include "memory_storage.hpp"

// 2024-06-01T14:03:59Z
constexpr int64_t T0 = 1717250639000LL;
static const char *TOKEN = "2024-06-01_14-03-59";
static const char *TRACK = "tracks/track_2024-06-01_14-03-59.gpx";

constexpr double TOL = 1e-6;

// ============================================================================
// Test Helpers
// ============================================================================

static LocationFix fix_at(int i) {
    LocationFix f;
    f.latitude = 48.0;
    f.longitude = 11.0 + static_cast<double>(i) * 1e-4;
    f.speed_mps = 7.5f;
    f.has_speed = true;
    f.altitude_m = 500.0;
    f.has_altitude = true;
    f.accuracy_m = 4.0f;
    f.has_accuracy = true;
    f.utc_ms = T0 + static_cast<int64_t>(i) * 1000;
    return f;
}

static OrientationSample identity_at(uint64_t ts_us) {
    OrientationSample s = {};
    s.R[0][0] = 1.0;
    s.R[1][1] = 1.0;
    s.R[2][2] = 1.0;
    s.timestamp_us = ts_us;
    return s;
}

static SessionEvent tick(uint32_t now) {
    return make_session_event(SessionEventType::Tick, now);
}

class SessionEngineTest : public ::testing::Test {
protected:
    Memory_Storage storage;
    Increment_Log inc_log{storage};
    SessionConfig config;
    Session_Engine engine{inc_log, config};

    void start_at(uint32_t now, int64_t utc = T0) {
        ASSERT_TRUE(engine.apply(make_start_event(now, utc)) & SESSION_FX_STARTED);
    }

    /* Fixes i in [first, first+count) received 1 s apart starting at now */
    void feed_fixes(int first, int count, uint32_t now) {
        for (int i = 0; i < count; i++) {
            engine.apply(make_fix_event(now + static_cast<uint32_t>(i) * 1000U,
                                        fix_at(first + i)));
        }
    }

    std::vector<TrackPoint> read_back(const char *path) {
        std::vector<TrackPoint> pts;
        EXPECT_TRUE(inc_log.read_track(path, pts));
        return pts;
    }
};

// ============================================================================
// Begin / Recovery
// ============================================================================

TEST(SessionBegin, ApplyBeforeBeginIsNoop) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    Session_Engine engine(inc_log, SessionConfig{});

    EXPECT_EQ(engine.apply(make_start_event(0, T0)), 0);
    EXPECT_EQ(engine.phase(), SessionPhase::Idle);
    EXPECT_FALSE(engine.is_running());
}

TEST(SessionBegin, RecoversOrphanSessions) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    ASSERT_TRUE(inc_log.init());

    std::vector<TrackPoint> pts(3);
    for (size_t i = 0; i < pts.size(); i++) {
        pts[i].latitude = 48.0;
        pts[i].longitude = 11.0 + static_cast<double>(i) * 1e-4;
        pts[i].timestamp_ms = T0 + static_cast<int64_t>(i) * 1000;
    }
    ASSERT_TRUE(inc_log.write_segment(TOKEN, 0, pts.data(), 2));
    ASSERT_TRUE(inc_log.write_segment(TOKEN, 1, pts.data() + 2, 1));
    storage.put("increments/2024-06-02_08-00-00_0000.inc", "garbage\n");

    Session_Engine engine(inc_log, SessionConfig{});
    RecoveryReport report = engine.begin();

    EXPECT_EQ(report.found, 2U);
    EXPECT_EQ(report.recovered, 1U);
    EXPECT_EQ(report.empty, 1U);
    EXPECT_EQ(report.failed, 0U);
    EXPECT_TRUE(storage.has(TRACK));
    EXPECT_TRUE(storage.names_in(INCREMENT_DIR).empty());

    std::vector<OrphanSession> orphans;
    ASSERT_TRUE(inc_log.list_orphan_sessions(orphans));
    EXPECT_TRUE(orphans.empty());

    std::vector<TrackPoint> back;
    ASSERT_TRUE(inc_log.read_track(TRACK, back));
    EXPECT_EQ(back.size(), 3U);
}

TEST(SessionBegin, FailedRecoveryKeepsSegments) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    ASSERT_TRUE(inc_log.init());
    TrackPoint p;
    p.timestamp_ms = T0;
    ASSERT_TRUE(inc_log.write_segment(TOKEN, 0, &p, 1));

    storage.fail_rename = true;
    Session_Engine engine(inc_log, SessionConfig{});
    RecoveryReport report = engine.begin();

    EXPECT_EQ(report.found, 1U);
    EXPECT_EQ(report.failed, 1U);
    EXPECT_FALSE(storage.has(TRACK));
    EXPECT_TRUE(storage.has("increments/2024-06-01_14-03-59_0000.inc"));
    EXPECT_EQ(engine.phase(), SessionPhase::Idle);
}

TEST(SessionBegin, RecoversAroundPointWithUnrenderableTime) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    ASSERT_TRUE(inc_log.init());
    TrackPoint p;
    p.latitude = 48.0;
    p.longitude = 11.0;
    p.timestamp_ms = T0;
    ASSERT_TRUE(inc_log.write_segment(TOKEN, 0, &p, 1));
    storage.put("increments/2024-06-01_14-03-59_0001.inc", "48.0,11.1,5,-1000,500,,\n");

    Session_Engine engine(inc_log, SessionConfig{});
    RecoveryReport report = engine.begin();

    EXPECT_EQ(report.found, 1U);
    EXPECT_EQ(report.recovered, 1U);
    EXPECT_EQ(report.failed, 0U);
    EXPECT_TRUE(storage.names_in(INCREMENT_DIR).empty());

    std::vector<TrackPoint> back;
    ASSERT_TRUE(inc_log.read_track(TRACK, back));
    ASSERT_EQ(back.size(), 1U);
    EXPECT_EQ(back[0].timestamp_ms, T0);
}

TEST(SessionBegin, PurgesSegmentsOfFinalizedTracks) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    ASSERT_TRUE(inc_log.init());
    TrackPoint p;
    ASSERT_TRUE(inc_log.write_segment(TOKEN, 0, &p, 1));
    storage.put(TRACK, "<gpx></gpx>\n");
    storage.put("tracks/track_2024-06-02_08-00-00.gpx.tmp", "<gpx>");

    Session_Engine engine(inc_log, SessionConfig{});
    RecoveryReport report = engine.begin();

    EXPECT_EQ(report.found, 0U);
    EXPECT_EQ(report.purged_files, 2U);
    EXPECT_TRUE(storage.names_in(INCREMENT_DIR).empty());
    EXPECT_EQ(storage.content(TRACK), "<gpx></gpx>\n");
}

// ============================================================================
// Start
// ============================================================================

TEST_F(SessionEngineTest, StartAllocatesTokenFromUtc) {
    engine.begin();
    start_at(100);

    EXPECT_EQ(engine.phase(), SessionPhase::Recording);
    EXPECT_TRUE(engine.is_running());
    EXPECT_STREQ(engine.token(), TOKEN);
    EXPECT_EQ(engine.next_sequence(), 0U);
}

TEST_F(SessionEngineTest, TokenBumpedPastExistingTrack) {
    engine.begin();
    storage.put(TRACK, "<gpx></gpx>\n");
    storage.put("tracks/track_2024-06-01_14-04-00.gpx", "<gpx></gpx>\n");

    start_at(0);
    EXPECT_STREQ(engine.token(), "2024-06-01_14-04-01");
}

TEST_F(SessionEngineTest, StartWhileRecordingIsIgnored) {
    engine.begin();
    start_at(0);
    EXPECT_EQ(engine.apply(make_start_event(500, T0 + 5000)), 0);
    EXPECT_STREQ(engine.token(), TOKEN);
}

TEST_F(SessionEngineTest, FusionInactiveWithoutImu) {
    engine.begin();
    start_at(0);
    EXPECT_EQ(engine.fusion_phase(), FusionPhase::Inactive);
}

// ============================================================================
// Fix Recording
// ============================================================================

TEST_F(SessionEngineTest, FixIgnoredWhileIdle) {
    engine.begin();
    EXPECT_EQ(engine.apply(make_fix_event(0, fix_at(0))), 0);
    EXPECT_EQ(engine.buffered_points(), 0U);
    EXPECT_EQ(engine.get_counters().fixes_ignored, 1U);
}

TEST_F(SessionEngineTest, DistanceAdvancesByHaversine) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 3, 100);

    EXPECT_EQ(engine.buffered_points(), 3U);
    // 2 x 1e-4 deg of longitude at 48N
    double expected = 2.0 * 6371000.0 * (1e-4 * M_PI / 180.0) * std::cos(48.0 * M_PI / 180.0);
    EXPECT_NEAR(engine.distance_m(), expected, 0.01);
}

TEST_F(SessionEngineTest, AbsentSpeedAndAltitudeReadAsZero) {
    engine.begin();
    start_at(0);
    LocationFix f = fix_at(0);
    f.has_speed = false;
    f.has_altitude = false;
    f.has_accuracy = false;
    EXPECT_TRUE(engine.apply(make_fix_event(10, f)) & SESSION_FX_FIX_RECORDED);
    engine.apply(make_session_event(SessionEventType::Stop, 20));

    std::vector<TrackPoint> pts = read_back(TRACK);
    ASSERT_EQ(pts.size(), 1U);
    EXPECT_EQ(pts[0].speed_mps, 0.0f);
    EXPECT_EQ(pts[0].elevation, 0.0);
    EXPECT_TRUE(std::isnan(pts[0].lean_deg));
    EXPECT_TRUE(std::isnan(pts[0].long_accel_mps2));
}

TEST(SessionFix, BufferWarningRaisedOnceWhenCrossingThreshold) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    SessionConfig cfg;
    cfg.buffer_warn_points = 2;
    Session_Engine engine(inc_log, cfg);
    engine.begin();
    engine.apply(make_start_event(0, T0));

    EXPECT_FALSE(engine.apply(make_fix_event(1, fix_at(0))) & SESSION_FX_BUFFER_WARNING);
    EXPECT_FALSE(engine.apply(make_fix_event(2, fix_at(1))) & SESSION_FX_BUFFER_WARNING);
    EXPECT_TRUE(engine.apply(make_fix_event(3, fix_at(2))) & SESSION_FX_BUFFER_WARNING);
    EXPECT_FALSE(engine.apply(make_fix_event(4, fix_at(3))) & SESSION_FX_BUFFER_WARNING);
}

// ============================================================================
// Flush
// ============================================================================

TEST_F(SessionEngineTest, FlushTickWritesSegment) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 4, 1000);

    EXPECT_FALSE(engine.apply(tick(FLUSH_INTERVAL_MS - 1)) & SESSION_FX_SEGMENT_WRITTEN);
    EXPECT_TRUE(engine.apply(tick(FLUSH_INTERVAL_MS)) & SESSION_FX_SEGMENT_WRITTEN);
    EXPECT_EQ(engine.buffered_points(), 0U);
    EXPECT_EQ(engine.next_sequence(), 1U);
    EXPECT_TRUE(storage.has("increments/2024-06-01_14-03-59_0000.inc"));
}

TEST_F(SessionEngineTest, EmptyBufferWritesNoSegment) {
    engine.begin();
    start_at(0);
    EXPECT_EQ(engine.apply(tick(FLUSH_INTERVAL_MS)) & SESSION_FX_SEGMENT_WRITTEN, 0);
    EXPECT_TRUE(storage.names_in(INCREMENT_DIR).empty());
    EXPECT_EQ(engine.next_sequence(), 0U);
}

TEST_F(SessionEngineTest, FailedFlushKeepsBufferForRetry) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 3, 1000);

    storage.fail_rename = true;
    EXPECT_TRUE(engine.apply(tick(FLUSH_INTERVAL_MS)) & SESSION_FX_SEGMENT_FAILED);
    EXPECT_EQ(engine.buffered_points(), 3U);
    EXPECT_EQ(engine.next_sequence(), 0U);
    EXPECT_TRUE(storage.names_in(INCREMENT_DIR).empty());

    storage.fail_rename = false;
    feed_fixes(3, 1, FLUSH_INTERVAL_MS + 1000);
    EXPECT_TRUE(engine.apply(tick(2 * FLUSH_INTERVAL_MS)) & SESSION_FX_SEGMENT_WRITTEN);
    EXPECT_EQ(engine.buffered_points(), 0U);
    EXPECT_EQ(engine.get_counters().flush_failures, 1U);

    std::vector<TrackPoint> pts;
    std::vector<std::string> files;
    ASSERT_TRUE(inc_log.list_segments(TOKEN, files));
    inc_log.read_segments(files, pts);
    ASSERT_EQ(pts.size(), 4U);
    EXPECT_EQ(pts[3].timestamp_ms, T0 + 3000);
}

// ============================================================================
// Pause / Resume
// ============================================================================

TEST_F(SessionEngineTest, PauseFlushesAndIgnoresFixes) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 2, 1000);

    uint16_t fx = engine.apply(make_session_event(SessionEventType::Pause, 3000));
    EXPECT_TRUE(fx & SESSION_FX_PAUSED);
    EXPECT_TRUE(fx & SESSION_FX_SEGMENT_WRITTEN);
    EXPECT_EQ(engine.phase(), SessionPhase::PendingFinalize);
    EXPECT_TRUE(engine.is_running());

    EXPECT_EQ(engine.apply(make_fix_event(4000, fix_at(5))), 0);
    EXPECT_EQ(engine.buffered_points(), 0U);
}

TEST_F(SessionEngineTest, ResumeKeepsTokenAndYieldsOneContiguousTrack) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 3, 1000);
    engine.apply(make_session_event(SessionEventType::Pause, 4000));
    double paused_distance = engine.distance_m();

    // Start during the pause window, with a later wall clock
    uint16_t fx = engine.apply(make_start_event(60000, T0 + 60000));
    EXPECT_TRUE(fx & SESSION_FX_RESUMED);
    EXPECT_FALSE(fx & SESSION_FX_STARTED);
    EXPECT_STREQ(engine.token(), TOKEN);
    EXPECT_EQ(engine.next_sequence(), 1U);
    EXPECT_DOUBLE_EQ(engine.distance_m(), paused_distance);

    feed_fixes(3, 2, 61000);
    fx = engine.apply(make_session_event(SessionEventType::Stop, 70000));
    EXPECT_TRUE(fx & SESSION_FX_FINALIZED);

    std::vector<std::string> tracks = storage.names_in(TRACK_DIR);
    ASSERT_EQ(tracks.size(), 1U);
    std::vector<TrackPoint> pts = read_back(TRACK);
    ASSERT_EQ(pts.size(), 5U);
    for (size_t i = 0; i < pts.size(); i++) {
        EXPECT_EQ(pts[i].timestamp_ms, T0 + static_cast<int64_t>(i) * 1000);
    }
    // Distance continues across the pause: the resume point links to the last one
    EXPECT_NEAR(engine.last_summary().distance_m, paused_distance * 2.0, 0.01);
}

TEST_F(SessionEngineTest, DurationCountsFromOriginalStart) {
    engine.begin();
    start_at(1000);
    engine.apply(make_session_event(SessionEventType::Pause, 5000));
    engine.apply(make_start_event(9000, T0 + 8000));

    ASSERT_TRUE(engine.apply(tick(11000)) & SESSION_FX_STATS_READY);
    EXPECT_EQ(engine.stats().duration_ms, 10000U);
    EXPECT_TRUE(engine.stats().is_recording);
}

TEST_F(SessionEngineTest, PauseWhileIdleIsIgnored) {
    engine.begin();
    EXPECT_EQ(engine.apply(make_session_event(SessionEventType::Pause, 0)), 0);
    EXPECT_EQ(engine.phase(), SessionPhase::Idle);
}

// ============================================================================
// Finalize
// ============================================================================

TEST_F(SessionEngineTest, PauseWindowElapsedFinalizes) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 3, 1000);
    engine.apply(make_session_event(SessionEventType::Pause, 4000));

    EXPECT_FALSE(engine.apply(tick(4000 + FINALIZE_TIMEOUT_MS - 1)) & SESSION_FX_FINALIZED);
    uint16_t fx = engine.apply(tick(4000 + FINALIZE_TIMEOUT_MS));
    EXPECT_TRUE(fx & SESSION_FX_FINALIZED);
    EXPECT_EQ(engine.phase(), SessionPhase::Idle);
    EXPECT_FALSE(engine.is_running());
    EXPECT_STREQ(engine.token(), "");
    EXPECT_STREQ(engine.last_track_name(), "track_2024-06-01_14-03-59.gpx");
    EXPECT_EQ(engine.last_summary().point_count, 3U);
    EXPECT_TRUE(storage.has(TRACK));
    EXPECT_TRUE(storage.names_in(INCREMENT_DIR).empty());
}

TEST_F(SessionEngineTest, StopFromRecordingFinalizesBufferedPoints) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 2, 1000);

    uint16_t fx = engine.apply(make_session_event(SessionEventType::Stop, 2500));
    EXPECT_TRUE(fx & SESSION_FX_SEGMENT_WRITTEN);
    EXPECT_TRUE(fx & SESSION_FX_FINALIZED);
    EXPECT_EQ(read_back(TRACK).size(), 2U);
    EXPECT_EQ(engine.get_counters().sessions_finalized, 1U);
}

TEST_F(SessionEngineTest, StopWithoutPointsClosesEmpty) {
    engine.begin();
    start_at(0);
    uint16_t fx = engine.apply(make_session_event(SessionEventType::Stop, 500));
    EXPECT_TRUE(fx & SESSION_FX_FINALIZE_EMPTY);
    EXPECT_FALSE(fx & SESSION_FX_FINALIZED);
    EXPECT_TRUE(storage.names_in(TRACK_DIR).empty());
    EXPECT_EQ(engine.phase(), SessionPhase::Idle);
}

TEST_F(SessionEngineTest, FailedFinalizeRetriesOnFlushInterval) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 3, 1000);

    storage.fail_rename = true;
    uint16_t fx = engine.apply(make_session_event(SessionEventType::Stop, 5000));
    EXPECT_TRUE(fx & SESSION_FX_FINALIZE_FAILED);
    EXPECT_EQ(engine.phase(), SessionPhase::PendingFinalize);
    EXPECT_TRUE(engine.finalize_retry_pending());
    EXPECT_EQ(engine.buffered_points(), 3U);

    storage.fail_rename = false;
    EXPECT_FALSE(engine.apply(tick(5000 + FLUSH_INTERVAL_MS - 1)) & SESSION_FX_FINALIZED);
    fx = engine.apply(tick(5000 + FLUSH_INTERVAL_MS));
    EXPECT_TRUE(fx & SESSION_FX_FINALIZED);
    EXPECT_EQ(engine.phase(), SessionPhase::Idle);
    EXPECT_EQ(read_back(TRACK).size(), 3U);
    EXPECT_EQ(engine.get_counters().finalize_failures, 1U);
}

TEST_F(SessionEngineTest, MergeFailureKeepsSegments) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 2, 1000);
    engine.apply(tick(FLUSH_INTERVAL_MS));
    ASSERT_EQ(engine.next_sequence(), 1U);

    storage.fail_rename = true;
    EXPECT_TRUE(engine.apply(make_session_event(SessionEventType::Stop, 11000)) &
                SESSION_FX_FINALIZE_FAILED);
    EXPECT_TRUE(storage.has("increments/2024-06-01_14-03-59_0000.inc"));
    EXPECT_FALSE(storage.has(TRACK));
    EXPECT_FALSE(storage.has(std::string(TRACK) + ".tmp"));
}

TEST_F(SessionEngineTest, LateTickAfterStopIsNoop) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 2, 1000);
    engine.apply(make_session_event(SessionEventType::Pause, 3000));
    engine.apply(make_session_event(SessionEventType::Stop, 4000));
    ASSERT_EQ(engine.phase(), SessionPhase::Idle);

    int writes_before = storage.open_write_calls;
    EXPECT_EQ(engine.apply(tick(4000 + STATS_INTERVAL_MS)), 0);
    EXPECT_EQ(engine.apply(tick(4000 + FLUSH_INTERVAL_MS)), 0);
    EXPECT_EQ(engine.apply(tick(3000 + FINALIZE_TIMEOUT_MS)), 0);
    EXPECT_EQ(storage.open_write_calls, writes_before);
}

TEST_F(SessionEngineTest, NewSessionAfterFinalizeGetsFreshState) {
    engine.begin();
    start_at(0);
    feed_fixes(0, 3, 1000);
    engine.apply(make_session_event(SessionEventType::Stop, 5000));

    start_at(10000, T0 + 3600000);
    EXPECT_STREQ(engine.token(), "2024-06-01_15-03-59");
    EXPECT_EQ(engine.next_sequence(), 0U);
    EXPECT_EQ(engine.distance_m(), 0.0);
    EXPECT_EQ(engine.buffered_points(), 0U);
}

// ============================================================================
// Statistics
// ============================================================================

TEST_F(SessionEngineTest, StatsEveryIntervalWhileRecording) {
    engine.begin();
    start_at(0);
    EXPECT_FALSE(engine.apply(tick(STATS_INTERVAL_MS - 1)) & SESSION_FX_STATS_READY);
    EXPECT_TRUE(engine.apply(tick(STATS_INTERVAL_MS)) & SESSION_FX_STATS_READY);
    EXPECT_FALSE(engine.apply(tick(STATS_INTERVAL_MS + 10)) & SESSION_FX_STATS_READY);

    const SessionStats &s = engine.stats();
    EXPECT_STREQ(s.file_name, "track_2024-06-01_14-03-59.gpx");
    EXPECT_TRUE(std::isnan(s.current_accuracy_m));
    EXPECT_TRUE(std::isnan(s.avg_update_rate_hz));
    EXPECT_EQ(s.pause_timeout_remaining_ms, 0U);
}

TEST_F(SessionEngineTest, StatsReportAccuracyAndUpdateRate) {
    engine.begin();
    start_at(0);
    LocationFix a = fix_at(0);
    a.accuracy_m = 3.0f;
    LocationFix b = fix_at(1);
    b.accuracy_m = 5.0f;
    LocationFix c = fix_at(2);
    c.has_accuracy = false;
    engine.apply(make_fix_event(100, a));
    engine.apply(make_fix_event(300, b));     // 5 Hz
    engine.apply(make_fix_event(400, c));     // 10 Hz
    ASSERT_TRUE(engine.apply(tick(1000)) & SESSION_FX_STATS_READY);

    const SessionStats &s = engine.stats();
    EXPECT_NEAR(s.current_accuracy_m, 5.0, TOL);
    EXPECT_NEAR(s.avg_accuracy_m, 4.0, TOL);
    EXPECT_NEAR(s.current_update_rate_hz, 10.0, 1e-4);
    EXPECT_NEAR(s.avg_update_rate_hz, 7.5, 1e-4);
    EXPECT_GT(s.distance_m, 0.0);
}

TEST_F(SessionEngineTest, StatsWhilePausedCountDown) {
    engine.begin();
    start_at(0);
    engine.apply(make_session_event(SessionEventType::Pause, 500));
    ASSERT_TRUE(engine.apply(tick(2500)) & SESSION_FX_STATS_READY);

    const SessionStats &s = engine.stats();
    EXPECT_FALSE(s.is_recording);
    EXPECT_EQ(s.paused_for_ms, 2000U);
    EXPECT_EQ(s.pause_timeout_remaining_ms, FINALIZE_TIMEOUT_MS - 2000U);
    EXPECT_EQ(s.duration_ms, 2500U);
}

TEST_F(SessionEngineTest, NoStatsWhileIdle) {
    engine.begin();
    EXPECT_EQ(engine.apply(tick(5 * STATS_INTERVAL_MS)), 0);
}

// ============================================================================
// Fusion Wiring
// ============================================================================

TEST(SessionFusion, FixesStampedWithLeanWhenImuPresent) {
    Memory_Storage storage;
    Increment_Log inc_log(storage);
    SessionConfig cfg;
    cfg.orientation_available = true;
    Session_Engine engine(inc_log, cfg);
    engine.begin();

    engine.apply(make_start_event(0, T0));
    EXPECT_EQ(engine.fusion_phase(), FusionPhase::Calibrating);
    engine.apply(make_orientation_event(10, identity_at(1000000)));
    EXPECT_EQ(engine.fusion_phase(), FusionPhase::Active);
    engine.apply(make_orientation_event(30, identity_at(1020000)));
    engine.apply(make_fix_event(40, fix_at(0)));

    engine.apply(make_session_event(SessionEventType::Pause, 50));
    EXPECT_EQ(engine.fusion_phase(), FusionPhase::Inactive);

    std::vector<std::string> files;
    std::vector<TrackPoint> pts;
    ASSERT_TRUE(inc_log.list_segments(TOKEN, files));
    inc_log.read_segments(files, pts);
    ASSERT_EQ(pts.size(), 1U);
    EXPECT_NEAR(pts[0].lean_deg, 0.0, 1e-3);
    // No accelerometer: acceleration stays unknown
    EXPECT_TRUE(std::isnan(pts[0].long_accel_mps2));

    engine.apply(make_start_event(60, T0 + 60));
    EXPECT_EQ(engine.fusion_phase(), FusionPhase::Calibrating);
}
