/*
 * Hardware and Timing Configuration for the Settle Firmware
 * Single-core cooperative event loop - MISRA-aligned conventions
 */

#ifndef SETTLE_CONFIG_H
#define SETTLE_CONFIG_H

/*============================================================================
 * Input Button
 *============================================================================*/
#define INPUT_BUTTON_PIN            6U       /* GP6: active-low with pull-up */
#define STATUS_LED_PIN              25U      /* On-board LED mirrors settled level */

/*============================================================================
 * Contact Settle (trailing-edge debounce of raw GPIO level)
 *============================================================================*/
#define CONTACT_SETTLE_MS           50U      /* Quiet period before level is trusted */

/*============================================================================
 * Tap Action (leading-edge only, repeats inside window are swallowed)
 *============================================================================*/
#define TAP_LOCKOUT_MS              1000U    /* Repeat taps ignored for 1s */

/*============================================================================
 * Telemetry Report (trailing debounce with maxWait ceiling)
 *============================================================================*/
#define TELEMETRY_QUIET_MS          200U     /* Report once edges stop for 200ms */
#define TELEMETRY_MAX_WAIT_MS       1000U    /* ...but at least once per second */

/*============================================================================
 * Event Loop
 *============================================================================*/
#define LOOP_PERIOD_MS              2U       /* Core 0 loop sleep between polls */
#define LOOP_WATCHDOG_TIMEOUT_MS    500U     /* Missed loop budget before reboot */
#define HEARTBEAT_INTERVAL_MS       5000U    /* [HEARTBEAT] stats period */

/*============================================================================
 * LVGL Port
 *============================================================================*/
#define LVGL_TICK_PERIOD_MS         5U       /* lv_tick_inc() cadence */

/*============================================================================
 * Timer Backends
 *============================================================================*/
#define TIMER_DELAY_SLOTS           16U      /* Concurrent one-shot delay timers */
#define TIMER_FRAME_SLOTS           8U       /* Concurrent frame wake-ups */

#endif /* SETTLE_CONFIG_H */
