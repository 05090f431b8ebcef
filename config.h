/*
 * Hardware and Behaviour Configuration for RideTrack Recorder Firmware
 * Pins, timings and thresholds - all compile-time
 */

#ifndef RIDETRACK_CONFIG_H
#define RIDETRACK_CONFIG_H

/*============================================================================
 * I2C1 - BNO08x IMU
 *============================================================================*/
#define IMU_SDA_PIN             2U
#define IMU_SCL_PIN             3U
#define IMU_RST_PIN             5U       /* Active low, hardware reset recovery */
#define IMU_INT_PIN             4U       /* HINTN: sensor asserts LOW when ready */
#define IMU_I2C_FREQ_HZ         100000U  /* 100kHz, clock stretching unreliable at 400kHz */
#define IMU_REPORT_INTERVAL_MS  20U      /* 50Hz game rotation vector + linear accel */

/*============================================================================
 * UART0 - NMEA GPS Receiver
 *============================================================================*/
#define GPS_UART_NUM            0U
#define GPS_TX_PIN              0U       /* MCU TX -> receiver RX */
#define GPS_RX_PIN              1U       /* MCU RX <- receiver TX */
#define GPS_BAUD_RATE           9600U
#define GPS_LINE_MAX            96U      /* NMEA max 82 chars + slack */
#define GPS_UERE_M              5.0f     /* Accuracy estimate = HDOP * UERE */

/*============================================================================
 * SDIO - SD Card (4-bit mode)
 *============================================================================*/
#define SD_CLK_PIN              18U
#define SD_CMD_PIN              19U
#define SD_D0_PIN               20U
#define SD_D1_PIN               21U
#define SD_D2_PIN               22U
#define SD_D3_PIN               23U
/* SDIO constraint: CLK = D0 - 2 (18 = 20 - 2) verified */
#define SD_BAUD_RATE            37500000U /* 37.5MHz for 150MHz sysclk */

/*============================================================================
 * Record Button (active-low with pull-up)
 *============================================================================*/
#define RECORD_BUTTON_PIN       6U
#define BUTTON_DEBOUNCE_MS      50U
#define BUTTON_FEEDBACK_MS      1500U    /* Show "Hold to power off..." */
#define BUTTON_SHUTDOWN_MS      3000U    /* Finalize, unmount, stop */

/*============================================================================
 * External Power Sense (VBUS via 200K/100K divider on ADC0)
 *============================================================================*/
#define VBUS_ADC_PIN            26U
#define VBUS_ADC_CHANNEL        0U
#define VBUS_VOLTAGE_DIVIDER    3.0f
#define VBUS_ADC_VREF           3.3f
#define VBUS_ADC_RESOLUTION     4096U    /* 12-bit ADC */
#define VBUS_EMA_ALPHA          0.3f     /* Fast: plug events must register within ~1s */
#define VBUS_SAMPLE_INTERVAL_MS 100U
#define VBUS_PRESENT_V          4.5f     /* Above = charger / ignition power */
#define VBUS_HYSTERESIS_V       0.2f
#define VBUS_DEBOUNCE_MS        1000U    /* Ignore crank dips and connector bounce */

/*============================================================================
 * System
 *============================================================================*/
#define SYS_CLOCK_KHZ           150000U
#define MAIN_LOOP_SLEEP_MS      5U
#define HEARTBEAT_INTERVAL_MS   5000U
#define WATCHDOG_TIMEOUT_MS     2000U    /* Covers a worst-case SD merge chunk */
#define POWER_OFF_MAGIC         0xCAFED00DU  /* Scratch register sentinel */
#define STATUS_LED_PIN          25U      /* Onboard LED: on = recording, blink = paused */
#define SD_RECOVERY_INTERVAL_MS 5000U    /* Remount attempts while the card is unusable */

/*============================================================================
 * Session Trigger Policy
 *============================================================================*/
#define TRIGGER_MODE_POWER      0U       /* Charger connect = start, disconnect = pause */
#define TRIGGER_MODE_MOTION     1U       /* Accel magnitude = start, stillness = pause */
#define TRIGGER_MODE_MANUAL     2U       /* Always on after boot, button stops */

#ifndef RIDETRACK_TRIGGER_MODE
#define RIDETRACK_TRIGGER_MODE  TRIGGER_MODE_POWER
#endif

#define MOTION_THRESHOLD_MPS2   0.8f     /* Linear accel magnitude = "moving" */
#define MOTION_STILLNESS_MS     5000U    /* Below threshold this long = "stopped" */

/*============================================================================
 * Session Engine Timing
 *============================================================================*/
#define FINALIZE_TIMEOUT_MS     (20U * 60U * 1000U)  /* Pause window before finalize */
#define STATS_INTERVAL_MS       1000U
#define FLUSH_INTERVAL_MS       10000U
#define BUFFER_WARN_POINTS      600U     /* ~2 min at 5Hz of unflushed points */

/*============================================================================
 * Sensor Fusion
 *============================================================================*/
#define FUSION_CUTOFF_HZ        2.0      /* EMA low-pass, removes engine vibration */
#define FUSION_FORWARD_MIN_LEN  1e-3     /* Below = device edge-on, use default forward */

/*============================================================================
 * Motion Analytics
 *============================================================================*/
#define EARTH_RADIUS_KM                 6371.0
#define GRAVITY_MPS2                    9.81
#define ANALYTICS_MAX_GAP_MS            60000    /* Longer intervals are gaps, not riding */
#define ANALYTICS_MOVING_SPEED_MPS      0.556    /* ~2 km/h */
#define ANALYTICS_MIN_LEAN_SPEED_MPS    3.0      /* Below: lean estimate is noise */
#define ANALYTICS_MIN_SEGMENT_M         2.0      /* Below: GPS jitter dominates bearing */
#define ANALYTICS_MIN_TURN_DEG          0.5      /* Below: straight line */
#define ANALYTICS_MAX_LEAN_DEG          65.0     /* Physical limit for road tyres */
#define ANALYTICS_MAX_ACCEL_GAP_MS      10000    /* Longer: speed delta meaningless */

/*============================================================================
 * Storage Layout
 *============================================================================*/
#define INCREMENT_DIR           "increments"
#define TRACK_DIR               "tracks"
#define STORAGE_PATH_MAX        96U
#define SEGMENT_LINE_MAX        160U

#endif /* RIDETRACK_CONFIG_H */
