/*
 * Settle Firmware - Main Entry Point
 * Wires the button input through debounced handlers and runs the event loop
 */

#include "config.h"

#include "drivers/pico_clock.hpp"
#include "logic/call_limit.hpp"
#include "logic/debounce_scheduler.hpp"
#include "logic/debounced.hpp"
#include "utils/lvgl_port.hpp"
#include "utils/timer_backends.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"
#include "hardware/gpio.h"
#include "hardware/watchdog.h"

#include <cstdio>

/* Event-loop statistics, reported by the heartbeat */
struct InputStats {
    uint32_t raw_edges = 0;         /* Raw GPIO level changes */
    uint32_t settled_changes = 0;   /* Level changes that survived the settle window */
    uint32_t taps = 0;              /* Accepted tap actions */
    uint32_t telemetry_reports = 0;
    uint32_t led_refreshes = 0;
};

static InputStats s_stats = {};
static bool s_settled_pressed = false;

static void report_init(const char *name, DebounceError err) {
    if (err == DebounceError::None) {
        printf("[BOOT] %s scheduler ready\n", name);
    } else {
        printf("[BOOT] %s scheduler init FAILED: %s\n", name, debounce_error_label(err));
    }
}

static void announce_loop_cb(void * /* ctx */) {
    printf("[BOOT] Event loop running\n");
    stdio_flush();
}

int main() {
    stdio_init_all();

    // Wait for USB host serial connection (up to 5s), then proceed regardless.
    // Without this, early printf output is buffered and lost.
    for (int i = 0; i < 50 && !stdio_usb_connected(); i++) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("Settle Input Firmware\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("========================================\n\n");
    stdio_flush();

    /* Input button (active-low with pull-up) and status LED */
    gpio_init(INPUT_BUTTON_PIN);
    gpio_set_dir(INPUT_BUTTON_PIN, GPIO_IN);
    gpio_pull_up(INPUT_BUTTON_PIN);

    gpio_init(STATUS_LED_PIN);
    gpio_set_dir(STATUS_LED_PIN, GPIO_OUT);
    gpio_put(STATUS_LED_PIN, false);

    /* Timer backends: delay timers polled here, frame timers driven by LVGL */
    static Pico_Clock clock;
    static Delay_Timer_Backend delay_timers(clock);
    static Frame_Timer_Backend frame_timers;

    bool lvgl_ok = lvgl_port_init(frame_timers);
    Timer_Backend *frames = lvgl_ok ? &frame_timers : nullptr;
    if (lvgl_ok) {
        printf("[BOOT] LVGL frame source OK (%lu ms)\n",
               static_cast<unsigned long>(lvgl_port_frame_period_ms()));
    } else {
        printf("[BOOT] LVGL frame source FAILED, frame handlers fall back to 0ms timers\n");
    }

    /* First accepted tap since boot gets a one-time banner */
    static Once<void()> first_tap;
    DebounceError once_err = first_tap.init([]() {
        printf("[TAP] First tap since boot\n");
    });
    if (once_err != DebounceError::None) {
        printf("[BOOT] First-tap banner init FAILED: %s\n", debounce_error_label(once_err));
    }

    /* Tap action: leading edge only, repeats inside the lockout are swallowed */
    static Debounced<uint32_t(uint32_t)> tap(clock, delay_timers, frames);
    DebounceConfig tap_cfg = {};
    tap_cfg.has_delay = true;
    tap_cfg.delay_ms = TAP_LOCKOUT_MS;
    tap_cfg.leading = true;
    tap_cfg.trailing = false;
    report_init("Tap", tap.init([](uint32_t now_ms) {
        first_tap();
        s_stats.taps++;
        printf("[TAP] #%lu at %lu ms\n", static_cast<unsigned long>(s_stats.taps),
               static_cast<unsigned long>(now_ms));
        return s_stats.taps;
    }, tap_cfg));

    /* LED mirror: frame-aligned, at most one GPIO write per refresh */
    static Debounced<void()> led_refresh(clock, delay_timers, frames);
    report_init("LED", led_refresh.init([]() {
        s_stats.led_refreshes++;
        gpio_put(STATUS_LED_PIN, s_settled_pressed);
    }, DebounceConfig{}));

    /* Contact settle: trust a level only after CONTACT_SETTLE_MS without edges */
    static Debounced<void(bool)> contact(clock, delay_timers, frames);
    DebounceConfig contact_cfg = {};
    contact_cfg.has_delay = true;
    contact_cfg.delay_ms = CONTACT_SETTLE_MS;
    report_init("Contact", contact.init([](bool pressed) {
        if (pressed == s_settled_pressed) {
            return;  /* Bounce returned to the previous level */
        }
        s_settled_pressed = pressed;
        s_stats.settled_changes++;
        led_refresh.invoke();
        if (pressed) {
            tap.invoke(clock.now_ms());
        }
    }, contact_cfg));

    /* Telemetry: report edge activity when quiet, at least once per second */
    static Debounced<void(uint32_t)> telemetry(clock, delay_timers, frames);
    DebounceConfig telemetry_cfg = {};
    telemetry_cfg.has_delay = true;
    telemetry_cfg.delay_ms = TELEMETRY_QUIET_MS;
    telemetry_cfg.has_max_wait = true;
    telemetry_cfg.max_wait_ms = TELEMETRY_MAX_WAIT_MS;
    report_init("Telemetry", telemetry.init([](uint32_t raw_edges) {
        s_stats.telemetry_reports++;
        printf("[BTN] raw_edges=%lu settled=%lu level=%s\n",
               static_cast<unsigned long>(raw_edges),
               static_cast<unsigned long>(s_stats.settled_changes),
               s_settled_pressed ? "DOWN" : "UP");
    }, telemetry_cfg));

    if (defer_call(delay_timers, announce_loop_cb, nullptr) == TIMER_HANDLE_NONE) {
        printf("[BOOT] Delay timer table full\n");
    }
    stdio_flush();

    watchdog_enable(LOOP_WATCHDOG_TIMEOUT_MS, true);

    bool last_raw = false;
    uint32_t last_heartbeat_ms = clock.now_ms();

    while (true) {
        watchdog_update();

        /* Poll input button (non-blocking) */
        bool raw_pressed = !gpio_get(INPUT_BUTTON_PIN);
        if (raw_pressed != last_raw) {
            last_raw = raw_pressed;
            s_stats.raw_edges++;
            contact.invoke(raw_pressed);
            telemetry.invoke(s_stats.raw_edges);
        }

        /* Deliver due delay timers, then LVGL timers (frame wake-ups) */
        delay_timers.poll();
        if (lvgl_ok) {
            lvgl_port_task_handler();
        }

        uint32_t now = clock.now_ms();
        if ((now - last_heartbeat_ms) >= HEARTBEAT_INTERVAL_MS) {
            last_heartbeat_ms = now;
            printf("[HEARTBEAT] uptime=%lu ms  edges=%lu settled=%lu taps=%lu "
                   "reports=%lu led=%lu  timers=%lu/%lu frames=%lu  pending=%c%c%c\n",
                   static_cast<unsigned long>(now),
                   static_cast<unsigned long>(s_stats.raw_edges),
                   static_cast<unsigned long>(s_stats.settled_changes),
                   static_cast<unsigned long>(s_stats.taps),
                   static_cast<unsigned long>(s_stats.telemetry_reports),
                   static_cast<unsigned long>(s_stats.led_refreshes),
                   static_cast<unsigned long>(delay_timers.armed_count()),
                   static_cast<unsigned long>(frame_timers.armed_count()),
                   static_cast<unsigned long>(frame_timers.frame_count()),
                   contact.pending() ? 'C' : '-',
                   tap.pending() ? 'T' : '-',
                   telemetry.pending() ? 'R' : '-');
            stdio_flush();
        }

        sleep_ms(LOOP_PERIOD_MS);
    }
}
