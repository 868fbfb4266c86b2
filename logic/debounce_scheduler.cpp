/*
 * Debounce Scheduler Implementation
 * Runs on Core 0 event loop only, no interrupt-context entry points
 */

#include "logic/debounce_scheduler.hpp"

static int64_t elapsed_ms(uint32_t now_ms, uint32_t then_ms) {
    /* Signed difference: wrap-safe, negative when the clock stepped back */
    return static_cast<int64_t>(static_cast<int32_t>(now_ms - then_ms));
}

const char *debounce_error_label(DebounceError err) {
    switch (err) {
        case DebounceError::None:          return "None";
        case DebounceError::InvalidTarget: return "InvalidTarget";
        case DebounceError::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

DebounceError debounce_validate_config(const DebounceConfig &cfg) {
    if (cfg.has_max_wait && cfg.has_delay && cfg.max_wait_ms < cfg.delay_ms) {
        return DebounceError::InvalidConfig;
    }
    return DebounceError::None;
}

Timer_Backend &select_timer_backend(const DebounceConfig &cfg,
                                    Timer_Backend &delay_backend,
                                    Timer_Backend *frame_backend) {
    if (!cfg.has_delay && frame_backend != nullptr) {
        return *frame_backend;
    }
    return delay_backend;
}

bool debounce_should_invoke(const DebounceState &state, const DebounceConfig &cfg,
                            uint32_t wait_ms, uint32_t now_ms) {
    if (!state.has_last_call) {
        return true;
    }

    int64_t since_call = elapsed_ms(now_ms, state.last_call_ms);
    if (since_call < 0 || since_call >= static_cast<int64_t>(wait_ms)) {
        return true;
    }

    return debounce_ceiling_reached(state, cfg, now_ms);
}

bool debounce_ceiling_reached(const DebounceState &state, const DebounceConfig &cfg,
                              uint32_t now_ms) {
    if (!cfg.has_max_wait) {
        return false;
    }
    int64_t since_invoke = elapsed_ms(now_ms, state.last_invoke_ms);
    return since_invoke >= static_cast<int64_t>(cfg.max_wait_ms);
}

uint32_t debounce_remaining_wait(const DebounceState &state, const DebounceConfig &cfg,
                                 uint32_t wait_ms, uint32_t now_ms) {
    int64_t remaining = static_cast<int64_t>(wait_ms) -
                        elapsed_ms(now_ms, state.last_call_ms);

    if (cfg.has_max_wait) {
        int64_t ceiling = static_cast<int64_t>(cfg.max_wait_ms) -
                          elapsed_ms(now_ms, state.last_invoke_ms);
        if (ceiling < remaining) {
            remaining = ceiling;
        }
    }
    return remaining > 0 ? static_cast<uint32_t>(remaining) : 0U;
}

/*============================================================================
 * Debounce_Scheduler
 *============================================================================*/

Debounce_Scheduler::Debounce_Scheduler(Clock_Source &clock, Timer_Backend &delay_backend,
                                       Timer_Backend *frame_backend)
    : clock_(clock), delay_backend_(delay_backend), frame_backend_(frame_backend) {}

Debounce_Scheduler::~Debounce_Scheduler() {
    /* Target may already be gone: only release the timer */
    cancel_timer();
}

DebounceError Debounce_Scheduler::init(const DebounceConfig &cfg, Debounce_Target *target) {
    if (initialized_) {
        return DebounceError::InvalidConfig;
    }
    if (target == nullptr) {
        return DebounceError::InvalidTarget;
    }

    DebounceError err = debounce_validate_config(cfg);
    if (err != DebounceError::None) {
        return err;
    }

    cfg_ = cfg;
    backend_ = &select_timer_backend(cfg, delay_backend_, frame_backend_);
    wait_ms_ = cfg.has_delay ? cfg.delay_ms : 0U;
    target_ = target;
    initialized_ = true;
    return DebounceError::None;
}

bool Debounce_Scheduler::frame_aligned() const {
    return backend_ != nullptr && backend_ == frame_backend_;
}

void Debounce_Scheduler::on_call() {
    if (!initialized_) {
        return;
    }

    uint32_t now = clock_.now_ms();
    bool invoking = debounce_should_invoke(state_, cfg_, wait_ms_, now);
    bool ceiling = debounce_ceiling_reached(state_, cfg_, now);

    state_.has_pending_args = true;
    state_.has_last_call = true;
    state_.last_call_ms = now;

    if (state_.timer == TIMER_HANDLE_NONE) {
        if (invoking) {
            leading_edge(now);
        } else {
            /* Earlier wake-up was refused by the backend: retry */
            start_timer(wait_ms_);
        }
        return;
    }

    if (invoking && ceiling) {
        /* Tight loop: burst never goes quiet, ceiling forces a run */
        start_timer(wait_ms_);
        invoke_now(now);
    }
    /* Otherwise the armed wake-up re-evaluates the burst */
}

bool Debounce_Scheduler::flush() {
    if (!initialized_ || state_.timer == TIMER_HANDLE_NONE) {
        return false;
    }

    cancel_timer();
    bool will_invoke = cfg_.trailing && state_.has_pending_args;
    trailing_edge(clock_.now_ms());
    return will_invoke;
}

void Debounce_Scheduler::cancel() {
    cancel_timer();
    state_.has_last_call = false;
    state_.last_call_ms = 0;
    state_.has_pending_args = false;

    if (target_ != nullptr) {
        target_->discard_args();
    }
}

void Debounce_Scheduler::timer_expired_cb(void *ctx) {
    static_cast<Debounce_Scheduler *>(ctx)->timer_expired();
}

void Debounce_Scheduler::timer_expired() {
    /* The handle that just fired is spent */
    state_.timer = TIMER_HANDLE_NONE;

    uint32_t now = clock_.now_ms();
    if (debounce_should_invoke(state_, cfg_, wait_ms_, now)) {
        trailing_edge(now);
        return;
    }

    start_timer(debounce_remaining_wait(state_, cfg_, wait_ms_, now));
}

void Debounce_Scheduler::leading_edge(uint32_t now_ms) {
    /*
     * Burst start opens the maxWait window, unless the previous run is
     * younger than the quiet period (calls kept coming across a
     * ceiling-forced or flushed trailing edge).
     */
    int64_t since_invoke = elapsed_ms(now_ms, state_.last_invoke_ms);
    if (invoke_count_ == 0U || since_invoke < 0 ||
        since_invoke >= static_cast<int64_t>(wait_ms_)) {
        state_.last_invoke_ms = now_ms;
    }
    start_timer(wait_ms_);

    if (cfg_.leading) {
        invoke_now(now_ms);
    }
}

void Debounce_Scheduler::trailing_edge(uint32_t now_ms) {
    /* Back to Idle before the target runs: burst over */
    state_.timer = TIMER_HANDLE_NONE;
    state_.has_last_call = false;
    state_.last_call_ms = 0;

    if (cfg_.trailing && state_.has_pending_args) {
        invoke_now(now_ms);
        return;
    }

    state_.has_pending_args = false;
    target_->discard_args();
}

void Debounce_Scheduler::invoke_now(uint32_t now_ms) {
    state_.has_pending_args = false;
    state_.last_invoke_ms = now_ms;
    invoke_count_++;

    /* Last statement: target may re-enter or throw */
    target_->invoke_target();
}

void Debounce_Scheduler::start_timer(uint32_t wait_ms) {
    cancel_timer();
    state_.timer = backend_->schedule(wait_ms, &Debounce_Scheduler::timer_expired_cb, this);
}

void Debounce_Scheduler::cancel_timer() {
    if (state_.timer != TIMER_HANDLE_NONE) {
        backend_->cancel(state_.timer);
        state_.timer = TIMER_HANDLE_NONE;
    }
}
