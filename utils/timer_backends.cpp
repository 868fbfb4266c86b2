/*
 * Timer Backends Implementation
 */

#include "utils/timer_backends.hpp"

/* Signed order of two wrapping counters/timestamps: <0 when a is before b */
static int32_t wrap_diff(uint32_t a, uint32_t b) {
    return static_cast<int32_t>(a - b);
}

/*============================================================================
 * Delay_Timer_Backend
 *============================================================================*/

timer_handle_t Delay_Timer_Backend::schedule(uint32_t delay_ms, timer_callback_t cb, void *ctx) {
    if (cb == nullptr) {
        return TIMER_HANDLE_NONE;
    }

    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        Slot &slot = slots_[i];
        if (slot.handle != TIMER_HANDLE_NONE) {
            continue;
        }
        slot.handle = allocate_timer_handle(next_handle_, slots_);
        slot.deadline_ms = clock_.now_ms() + delay_ms;
        slot.seq = next_seq_++;
        slot.cb = cb;
        slot.ctx = ctx;
        return slot.handle;
    }

    /* Table full */
    return TIMER_HANDLE_NONE;
}

void Delay_Timer_Backend::cancel(timer_handle_t handle) {
    if (handle == TIMER_HANDLE_NONE) {
        return;
    }
    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        if (slots_[i].handle == handle) {
            slots_[i] = {};
            return;
        }
    }
}

uint32_t Delay_Timer_Backend::poll() {
    uint32_t now = clock_.now_ms();
    uint32_t seq_limit = next_seq_;
    uint32_t fired = 0;

    for (;;) {
        int32_t best = -1;
        int32_t best_overdue = 0;

        for (uint32_t i = 0; i < SLOT_COUNT; i++) {
            const Slot &slot = slots_[i];
            if (slot.handle == TIMER_HANDLE_NONE) {
                continue;
            }
            /* Armed by a callback during this poll: next poll */
            if (wrap_diff(slot.seq, seq_limit) >= 0) {
                continue;
            }
            int32_t overdue = wrap_diff(now, slot.deadline_ms);
            if (overdue < 0) {
                continue;
            }
            if (best < 0 || overdue > best_overdue ||
                (overdue == best_overdue &&
                 wrap_diff(slot.seq, slots_[best].seq) < 0)) {
                best = static_cast<int32_t>(i);
                best_overdue = overdue;
            }
        }

        if (best < 0) {
            break;
        }

        /* Disarm before the callback so it may re-arm or cancel freely */
        Slot due = slots_[best];
        slots_[best] = {};
        fired++;
        due.cb(due.ctx);
    }

    return fired;
}

uint32_t Delay_Timer_Backend::armed_count() const {
    uint32_t count = 0;
    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        if (slots_[i].handle != TIMER_HANDLE_NONE) {
            count++;
        }
    }
    return count;
}

bool Delay_Timer_Backend::next_deadline(uint32_t *deadline_ms) const {
    bool found = false;
    uint32_t earliest = 0;
    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        const Slot &slot = slots_[i];
        if (slot.handle == TIMER_HANDLE_NONE) {
            continue;
        }
        if (!found || wrap_diff(slot.deadline_ms, earliest) < 0) {
            earliest = slot.deadline_ms;
            found = true;
        }
    }
    if (found && deadline_ms != nullptr) {
        *deadline_ms = earliest;
    }
    return found;
}

/*============================================================================
 * Frame_Timer_Backend
 *============================================================================*/

timer_handle_t Frame_Timer_Backend::schedule(uint32_t /* delay_ms */, timer_callback_t cb,
                                             void *ctx) {
    if (cb == nullptr) {
        return TIMER_HANDLE_NONE;
    }

    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        Slot &slot = slots_[i];
        if (slot.handle != TIMER_HANDLE_NONE) {
            continue;
        }
        slot.handle = allocate_timer_handle(next_handle_, slots_);
        slot.seq = next_seq_++;
        slot.cb = cb;
        slot.ctx = ctx;
        return slot.handle;
    }
    return TIMER_HANDLE_NONE;
}

void Frame_Timer_Backend::cancel(timer_handle_t handle) {
    if (handle == TIMER_HANDLE_NONE) {
        return;
    }
    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        if (slots_[i].handle == handle) {
            slots_[i] = {};
            return;
        }
    }
}

uint32_t Frame_Timer_Backend::on_frame() {
    uint32_t seq_limit = next_seq_;
    uint32_t fired = 0;
    frame_count_++;

    for (;;) {
        int32_t next = -1;
        for (uint32_t i = 0; i < SLOT_COUNT; i++) {
            const Slot &slot = slots_[i];
            if (slot.handle == TIMER_HANDLE_NONE ||
                wrap_diff(slot.seq, seq_limit) >= 0) {
                continue;
            }
            if (next < 0 || wrap_diff(slot.seq, slots_[next].seq) < 0) {
                next = static_cast<int32_t>(i);
            }
        }

        if (next < 0) {
            break;
        }

        Slot due = slots_[next];
        slots_[next] = {};
        fired++;
        due.cb(due.ctx);
    }

    return fired;
}

uint32_t Frame_Timer_Backend::armed_count() const {
    uint32_t count = 0;
    for (uint32_t i = 0; i < SLOT_COUNT; i++) {
        if (slots_[i].handle != TIMER_HANDLE_NONE) {
            count++;
        }
    }
    return count;
}

/*============================================================================
 * Deferred Calls
 *============================================================================*/

timer_handle_t delay_call(Timer_Backend &backend, timer_callback_t cb, void *ctx,
                          uint32_t wait_ms) {
    return backend.schedule(wait_ms, cb, ctx);
}

timer_handle_t defer_call(Timer_Backend &backend, timer_callback_t cb, void *ctx) {
    return delay_call(backend, cb, ctx, DEFAULT_CALL_DELAY_MS);
}
