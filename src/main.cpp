/*
 * RideTrack Recorder Firmware - Main Entry Point
 * Initializes GPS, IMU, power sense and SD card, recovers interrupted
 * sessions, then feeds the session engine from the main loop
 */

#include "config.h"
#include "types.h"

#include "drivers/fatfs_storage.hpp"
#include "drivers/gps_wrapper.hpp"
#include "drivers/imu_wrapper.hpp"
#include "drivers/power_monitor.hpp"
#include "drivers/status_led.hpp"
#include "logic/increment_log.hpp"
#include "logic/session_engine.hpp"
#include "logic/trigger_source.hpp"
#include "logic/utc_clock.hpp"
#include "utils/button_debounce.hpp"
#include "utils/dual_display.hpp"
#include "utils/record_button.hpp"
#include "utils/stdio_display.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"
#include "hardware/watchdog.h"
#include "hardware/clocks.h"
#include "hardware/gpio.h"
#include "hardware/xosc.h"
#include "hardware/pll.h"
#include "hardware/structs/watchdog.h"

#include <cstdio>

/* IMU consecutive poll failures before a hardware reset (~2s at 5ms loop) */
static constexpr uint16_t IMU_RESET_FAILURES = 400;

/*============================================================================
 * Effect Reporting
 *============================================================================*/

static void report_effects(uint16_t fx, const Session_Engine &engine,
                           Display_Interface &display) {
    char msg[STORAGE_PATH_MAX + 48];

    if (fx & SESSION_FX_STARTED) {
        snprintf(msg, sizeof(msg), "Recording %s", engine.token());
        display.show_status("Session", msg);
    }
    if (fx & SESSION_FX_RESUMED) {
        snprintf(msg, sizeof(msg), "Resumed %s", engine.token());
        display.show_status("Session", msg);
    }
    if (fx & SESSION_FX_PAUSED) {
        display.show_status("Session", "Paused");
    }
    if (fx & SESSION_FX_SEGMENT_FAILED) {
        snprintf(msg, sizeof(msg), "Segment write failed, %lu points buffered",
                 static_cast<unsigned long>(engine.buffered_points()));
        display.show_error("SD", msg, DisplaySeverity::Warning);
    }
    if (fx & SESSION_FX_BUFFER_WARNING) {
        display.show_error("Session", "Unsaved points piling up", DisplaySeverity::Warning);
    }
    if (fx & SESSION_FX_FINALIZE_FAILED) {
        display.show_error("Session", "Finalize failed, will retry", DisplaySeverity::Error);
    }
    if (fx & SESSION_FX_FINALIZED) {
        const TrackSummary &s = engine.last_summary();
        snprintf(msg, sizeof(msg), "Saved %s (%lu pts, %.2f km)",
                 engine.last_track_name(),
                 static_cast<unsigned long>(s.point_count),
                 s.distance_m / 1000.0);
        display.show_status("Session", msg);
        display.clear();
    }
    if (fx & SESSION_FX_FINALIZE_EMPTY) {
        display.show_status("Session", "Closed, no points recorded");
        display.clear();
    }
    if (fx & SESSION_FX_STATS_READY) {
        display.show_stats(engine.stats());
    }
}

/*============================================================================
 * Shutdown
 *============================================================================*/

[[noreturn]]
static void perform_shutdown(Session_Engine &engine, FatFS_Storage &storage,
                             Display_Interface &display) {
    printf("[SHUTDOWN] Initiating power-off sequence...\n");
    stdio_flush();

    /* Finalize the running session before the card goes away */
    uint32_t now = to_ms_since_boot(get_absolute_time());
    uint16_t fx = engine.apply(make_session_event(SessionEventType::Stop, now));
    report_effects(fx, engine, display);
    if (engine.is_running()) {
        printf("[SHUTDOWN] Session %s left for recovery at next boot\n", engine.token());
    }

    storage.deinit();
    printf("[SHUTDOWN] SD card unmounted\n");

    watchdog_disable();
    display.clear();
    sleep_ms(200);

    printf("[SHUTDOWN] Entering dormant mode\n");
    stdio_flush();
    watchdog_hw->scratch[0] = POWER_OFF_MAGIC;
    watchdog_reboot(0, 0, 10);

    while (true) {
        tight_loop_contents();
    }
}

[[noreturn]]
static void dormant_until_button() {
    watchdog_hw->scratch[0] = 0U;

    gpio_init(RECORD_BUTTON_PIN);
    gpio_set_dir(RECORD_BUTTON_PIN, GPIO_IN);
    gpio_pull_up(RECORD_BUTTON_PIN);

    /* User may still hold the button from the shutdown press */
    while (!gpio_get(RECORD_BUTTON_PIN)) {
        tight_loop_contents();
    }
    busy_wait_us_32(50000U);

    gpio_init(IMU_RST_PIN);
    gpio_set_dir(IMU_RST_PIN, GPIO_OUT);
    gpio_put(IMU_RST_PIN, false);

    /* Switch clk_sys to clk_ref (XOSC 12MHz) and disable PLLs */
    clock_configure_undivided(clk_sys,
        CLOCKS_CLK_SYS_CTRL_SRC_VALUE_CLK_REF,
        0,
        XOSC_HZ);
    pll_deinit(pll_sys);
    pll_deinit(pll_usb);

    gpio_set_dormant_irq_enabled(RECORD_BUTTON_PIN, GPIO_IRQ_EDGE_FALL, true);
    xosc_dormant();

    /* Woke up, clean reboot */
    gpio_acknowledge_irq(RECORD_BUTTON_PIN, GPIO_IRQ_EDGE_FALL);
    watchdog_enable(1, true);
    while (true) {
        tight_loop_contents();
    }
}

/*============================================================================
 * Main
 *============================================================================*/

int main() {
    if (watchdog_hw->scratch[0] == POWER_OFF_MAGIC) {
        dormant_until_button();
    }

    set_sys_clock_khz(SYS_CLOCK_KHZ, true);
    stdio_init_all();

    // Wait for USB host serial connection (up to 5s), then proceed regardless.
    for (int i = 0; i < 50 && !stdio_usb_connected(); i++) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("RideTrack Recorder Firmware\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("Trigger mode: %u\n", static_cast<unsigned>(RIDETRACK_TRIGGER_MODE));
    printf("========================================\n\n");
    stdio_flush();

    static Stdio_Display stdio_display;
    static Status_LED led;
    led.init();
    static Dual_Display dual(stdio_display, led);
    Display_Interface &display = dual;

    gpio_init(RECORD_BUTTON_PIN);
    gpio_set_dir(RECORD_BUTTON_PIN, GPIO_IN);
    gpio_pull_up(RECORD_BUTTON_PIN);

    // Initialize each peripheral, failures are non-fatal
    static FatFS_Storage storage;
    bool sd_ok = storage.init();
    if (sd_ok) {
        display.show_status("Init", "SD OK");
    } else {
        display.show_error("Init", "SD FAILED, retrying in background", DisplaySeverity::Error);
    }
    stdio_flush();

    static GPS_Wrapper gps;
    gps.init();
    display.show_status("Init", "GPS UART OK");

    static IMU_Wrapper imu;
    bool imu_ok = imu.init();
    if (imu_ok) {
        display.show_status("Init", "IMU OK");
    } else {
        display.show_error("Init", "IMU FAILED, recording without lean", DisplaySeverity::Warning);
    }
    stdio_flush();

    static Power_Monitor power;
    power.init();

    SessionConfig session_config;
    session_config.orientation_available = imu_ok;
    session_config.accel_available = imu_ok;

    static Increment_Log inc_log(storage);
    static Session_Engine engine(inc_log, session_config);

    bool engine_begun = false;
    if (sd_ok) {
        RecoveryReport rep = engine.begin();
        engine_begun = true;
        char summary[80];
        snprintf(summary, sizeof(summary), "found=%lu recovered=%lu empty=%lu failed=%lu",
                 static_cast<unsigned long>(rep.found),
                 static_cast<unsigned long>(rep.recovered),
                 static_cast<unsigned long>(rep.empty),
                 static_cast<unsigned long>(rep.failed));
        display.show_status("Recover", summary);
    }

#if RIDETRACK_TRIGGER_MODE == TRIGGER_MODE_POWER
    static Power_Trigger power_trigger(VBUS_DEBOUNCE_MS);
    Trigger_Source *trigger = &power_trigger;
#elif RIDETRACK_TRIGGER_MODE == TRIGGER_MODE_MOTION
    static Motion_Trigger motion_trigger(MOTION_THRESHOLD_MPS2, MOTION_STILLNESS_MS);
    static Manual_Trigger manual_trigger;
    Trigger_Source *trigger = &motion_trigger;
    if (!imu_ok) {
        display.show_error("Trigger", "Motion needs the IMU, using manual",
                           DisplaySeverity::Warning);
        trigger = &manual_trigger;
    }
#else
    static Manual_Trigger manual_trigger;
    Trigger_Source *trigger = &manual_trigger;
#endif
    {
        char msg[48];
        snprintf(msg, sizeof(msg), "%s trigger", trigger->name());
        display.show_status("Sys", msg);
    }

    if (imu_ok) {
        imu.flush();
    }

    watchdog_enable(WATCHDOG_TIMEOUT_MS, true);
    display.show_status("Sys", "Entering main loop");
    stdio_flush();

    static DebounceState button_debounce = {};
    static RecordButtonState button_state = {};
    static UtcClock utc_clock = {};
    bool start_pending = false;        /* Start requested before the first fix */
    bool sd_suspect = !sd_ok;
    uint32_t last_sd_attempt_ms = 0;
    uint32_t last_heartbeat_ms = 0;

    while (true) {
        watchdog_update();
        uint32_t now = to_ms_since_boot(get_absolute_time());
        uint16_t fx = 0;

        /* ── SD card recovery ─────────────────────────────────────── */
        if (sd_suspect && (now - last_sd_attempt_ms) >= SD_RECOVERY_INTERVAL_MS) {
            last_sd_attempt_ms = now;
            if (storage.try_recovery()) {
                sd_suspect = false;
                if (!engine_begun) {
                    engine.begin();
                    engine_begun = true;
                }
            }
            watchdog_update();
        }

        /* ── Inputs ───────────────────────────────────────────────── */
        if (power.update(now)) {
            trigger->on_power(now, power.present());
        }

        if (imu_ok) {
            if (imu.poll()) {
                OrientationSample orientation;
                if (imu.take_orientation(orientation)) {
                    fx |= engine.apply(make_orientation_event(now, orientation));
                }
                AccelSample accel;
                if (imu.take_accel(accel)) {
                    trigger->on_accel(now, accel.linear_accel);
                    fx |= engine.apply(make_accel_event(now, accel));
                }
            } else if (imu.consecutive_failures >= IMU_RESET_FAILURES) {
                printf("[IMU] No events for %u polls, resetting\n",
                       static_cast<unsigned>(imu.consecutive_failures));
                imu.hardware_reset();
                watchdog_update();
            }
        }

        gps.poll();
        LocationFix fix;
        while (gps.pop_fix(fix)) {
            utc_clock_sync(utc_clock, now, fix.utc_ms);
            if (start_pending) {
                start_pending = false;
                fx |= engine.apply(make_start_event(now, fix.utc_ms));
            }
            fx |= engine.apply(make_fix_event(now, fix));
        }

        /* ── Start / pause requests ───────────────────────────────── */
        TriggerSignal signal = trigger->poll(now);

        bool pressed = !gpio_get(RECORD_BUTTON_PIN);
        debounce_update(now, pressed, BUTTON_DEBOUNCE_MS, button_debounce);
        RecordAction action = record_button_update(now, button_debounce.stable_state,
                                                   BUTTON_FEEDBACK_MS, BUTTON_SHUTDOWN_MS,
                                                   button_state);

        switch (action) {
            case RecordAction::Toggle:
                if (engine.phase() == SessionPhase::Recording) {
                    printf("[BTN] Stop\n");
                    start_pending = false;
                    fx |= engine.apply(make_session_event(SessionEventType::Stop, now));
                } else {
                    printf("[BTN] Start\n");
                    signal = TriggerSignal::Start;
                }
                break;
            case RecordAction::ShowFeedback:
                display.show_status("Power", "Hold to power off...");
                break;
            case RecordAction::HideFeedback:
                display.show_status("Power", "Power off cancelled");
                break;
            case RecordAction::Shutdown:
                report_effects(fx, engine, display);
                perform_shutdown(engine, storage, display);
                break;
            case RecordAction::None:
                break;
        }

        if (signal == TriggerSignal::Start) {
            int64_t utc_ms = 0;
            if (utc_clock_now(utc_clock, now, utc_ms)) {
                fx |= engine.apply(make_start_event(now, utc_ms));
            } else if (!start_pending) {
                start_pending = true;
                display.show_status("Session", "Start waiting for first GPS fix");
            }
        } else if (signal == TriggerSignal::Pause) {
            if (start_pending) {
                start_pending = false;
            } else {
                fx |= engine.apply(make_session_event(SessionEventType::Pause, now));
            }
        }

        /* ── Timers ───────────────────────────────────────────────── */
        fx |= engine.apply(make_session_event(SessionEventType::Tick, now));

        if (fx & (SESSION_FX_SEGMENT_FAILED | SESSION_FX_FINALIZE_FAILED)) {
            sd_suspect = true;
        }
        report_effects(fx, engine, display);

        /* ── Heartbeat ────────────────────────────────────────────── */
        if ((now - last_heartbeat_ms) >= HEARTBEAT_INTERVAL_MS) {
            last_heartbeat_ms = now;
            SessionCounters sc = engine.get_counters();
            NmeaStats ns = gps.get_stats();
            IncrementLogStats ls = inc_log.get_stats();
            StorageStats ss = storage.get_stats();

            printf("[heartbeat] uptime=%lu ms  phase=%u  pts=%lu buf=%lu  "
                   "gps=%lu/%lu fix ck_err=%lu  seg=%lu/%lu fail  "
                   "sd=%s  vbus=%.2fV(%s)  imu=%s\n",
                   static_cast<unsigned long>(now),
                   static_cast<unsigned>(engine.phase()),
                   static_cast<unsigned long>(sc.fixes_recorded),
                   static_cast<unsigned long>(engine.buffered_points()),
                   static_cast<unsigned long>(ns.fixes),
                   static_cast<unsigned long>(ns.sentences),
                   static_cast<unsigned long>(ns.checksum_errors),
                   static_cast<unsigned long>(ls.segments_written),
                   static_cast<unsigned long>(ls.write_failures),
                   ss.mounted ? (sd_suspect ? "ERR" : "OK") : "OFF",
                   static_cast<double>(power.voltage()),
                   power.present() ? "on" : "off",
                   imu_ok ? "OK" : "OFF");
            stdio_flush();
        }

        sleep_ms(MAIN_LOOP_SLEEP_MS);
    }
}
