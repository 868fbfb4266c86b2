/*
 * LVGL Port Implementation - Tick timer and refresh-aligned frame timer
 */

#include "utils/lvgl_port.hpp"
#include "utils/timer_backends.hpp"
#include "config.h"

#include "lvgl.h"
#include "pico/stdlib.h"

/* Module-level state */
static struct repeating_timer s_tick_timer;
static lv_timer_t *s_frame_timer = nullptr;

static bool tick_cb(struct repeating_timer * /* t */) {
    lv_tick_inc(LVGL_TICK_PERIOD_MS);
    return true;
}

/* Runs inside lv_task_handler(), on the same loop as the display refresh */
static void frame_cb(lv_timer_t *timer) {
    auto *frames = static_cast<Frame_Timer_Backend *>(timer->user_data);
    frames->on_frame();
}

bool lvgl_port_init(Frame_Timer_Backend &frames) {
    if (s_frame_timer != nullptr) {
        return true;
    }

    if (!lv_is_initialized()) {
        lv_init();
    }

    /* LVGL_TICK_PERIOD_MS repeating timer for LVGL tick (IRQ context, tick only) */
    if (!add_repeating_timer_ms(static_cast<int32_t>(LVGL_TICK_PERIOD_MS), tick_cb,
                                nullptr, &s_tick_timer)) {
        return false;
    }

    /* Same period as the display refresh timer */
    s_frame_timer = lv_timer_create(frame_cb, LV_DISP_DEF_REFR_PERIOD, &frames);
    if (s_frame_timer == nullptr) {
        cancel_repeating_timer(&s_tick_timer);
        return false;
    }

    return true;
}

void lvgl_port_task_handler() {
    lv_task_handler();
}

uint32_t lvgl_port_frame_period_ms() {
    return (s_frame_timer != nullptr) ? static_cast<uint32_t>(LV_DISP_DEF_REFR_PERIOD) : 0U;
}
