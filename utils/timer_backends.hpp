/*
 * Timer Backends - Event-loop driven one-shot timers for Debounce_Scheduler
 * Pure logic, no SDK dependency. The host loop calls poll() / on_frame().
 */

#ifndef TIMER_BACKENDS_HPP
#define TIMER_BACKENDS_HPP

#include "logic/debounce_scheduler.hpp"
#include "config.h"

#include <cstddef>
#include <cstdint>

/*
 * Next handle from a wrapping counter. Skips TIMER_HANDLE_NONE and any
 * handle still held by an armed slot, so two armed timers never share a
 * handle after the counter wraps. Slot needs a `handle` member.
 */
template <typename Slot, std::size_t N>
timer_handle_t allocate_timer_handle(timer_handle_t &next_handle, const Slot (&slots)[N]) {
    for (;;) {
        timer_handle_t h = next_handle++;
        if (h == TIMER_HANDLE_NONE) {
            continue;  /* Counter wrapped */
        }
        bool in_use = false;
        for (std::size_t i = 0; i < N; i++) {
            if (slots[i].handle == h) {
                in_use = true;
                break;
            }
        }
        if (!in_use) {
            return h;
        }
    }
}

/*============================================================================
 * Delay_Timer_Backend
 *============================================================================
 * Fixed-capacity table of one-shot timers. poll() fires every timer whose
 * deadline has passed, most overdue first, ties in scheduling order.
 * Timers armed from inside a callback wait for the next poll(), so a 0ms
 * timer always runs on a later loop iteration than the one that armed it.
 */
class Delay_Timer_Backend final : public Timer_Backend {
public:
    explicit Delay_Timer_Backend(Clock_Source &clock) : clock_(clock) {}

    timer_handle_t schedule(uint32_t delay_ms, timer_callback_t cb, void *ctx) override;
    void cancel(timer_handle_t handle) override;

    /* Returns number of callbacks fired */
    uint32_t poll();

    uint32_t armed_count() const;

    /* false when nothing is armed */
    bool next_deadline(uint32_t *deadline_ms) const;

private:
    struct Slot {
        timer_handle_t handle;
        uint32_t deadline_ms;
        uint32_t seq;              /* Scheduling order */
        timer_callback_t cb;
        void *ctx;
    };

    static constexpr uint32_t SLOT_COUNT = TIMER_DELAY_SLOTS;

    Clock_Source &clock_;
    Slot slots_[SLOT_COUNT] = {};
    timer_handle_t next_handle_ = 1U;
    uint32_t next_seq_ = 0;
};

/*============================================================================
 * Frame_Timer_Backend
 *============================================================================
 * Wake-ups run on the next frame boundary; the requested delay is ignored.
 * The host's frame source (LVGL refresh timer on target) calls on_frame().
 */
class Frame_Timer_Backend final : public Timer_Backend {
public:
    timer_handle_t schedule(uint32_t delay_ms, timer_callback_t cb, void *ctx) override;
    void cancel(timer_handle_t handle) override;

    /* Fires wake-ups armed before this frame began; returns count fired */
    uint32_t on_frame();

    uint32_t armed_count() const;
    uint32_t frame_count() const { return frame_count_; }

private:
    struct Slot {
        timer_handle_t handle;
        uint32_t seq;
        timer_callback_t cb;
        void *ctx;
    };

    static constexpr uint32_t SLOT_COUNT = TIMER_FRAME_SLOTS;

    Slot slots_[SLOT_COUNT] = {};
    timer_handle_t next_handle_ = 1U;
    uint32_t next_seq_ = 0;
    uint32_t frame_count_ = 0;
};

/*============================================================================
 * Deferred Calls
 *============================================================================*/
static constexpr uint32_t DEFAULT_CALL_DELAY_MS = 1U;

/* One-shot call after wait_ms on the given backend */
timer_handle_t delay_call(Timer_Backend &backend, timer_callback_t cb, void *ctx,
                          uint32_t wait_ms = DEFAULT_CALL_DELAY_MS);

/* delay_call() with the minimum delay */
timer_handle_t defer_call(Timer_Backend &backend, timer_callback_t cb, void *ctx);

#endif // TIMER_BACKENDS_HPP
