/*
 * Debounce Scheduler - Coalesces bursts of calls into leading/trailing invocations
 * Pure logic module, no hardware dependencies, testable on host
 */

#ifndef DEBOUNCE_SCHEDULER_HPP
#define DEBOUNCE_SCHEDULER_HPP

#include <cstdint>

/*============================================================================
 * Timer Backend
 *============================================================================
 * One-shot wake-up source. Callbacks are delivered from the host event loop
 * that services the backend, never from interrupt context.
 */
typedef uint32_t timer_handle_t;
typedef void (*timer_callback_t)(void *ctx);

static constexpr timer_handle_t TIMER_HANDLE_NONE = 0U;

class Timer_Backend {
public:
    virtual ~Timer_Backend() = default;

    /* Returns TIMER_HANDLE_NONE when no timer could be armed */
    virtual timer_handle_t schedule(uint32_t delay_ms, timer_callback_t cb, void *ctx) = 0;

    /* Unknown, fired and NONE handles are ignored */
    virtual void cancel(timer_handle_t handle) = 0;
};

/*============================================================================
 * Clock Source
 *============================================================================*/
class Clock_Source {
public:
    virtual ~Clock_Source() = default;
    virtual uint32_t now_ms() = 0;
};

/*============================================================================
 * Configuration and Errors
 *============================================================================*/
enum class DebounceError : uint8_t { None, InvalidTarget, InvalidConfig };

const char *debounce_error_label(DebounceError err);

struct DebounceConfig {
    bool has_delay = false;        /* false => frame-aligned backend */
    uint32_t delay_ms = 0;         /* Quiet period (valid when has_delay) */
    bool leading = false;          /* Invoke at the start of a burst */
    bool trailing = true;          /* Invoke at the end of a burst */
    bool has_max_wait = false;
    uint32_t max_wait_ms = 0;      /* Ceiling on deferral, >= delay_ms */
};

/*
 * Reject configurations whose maxWait ceiling is shorter than the delay.
 * A frame-aligned config (no delay) accepts any ceiling.
 */
DebounceError debounce_validate_config(const DebounceConfig &cfg);

/*
 * Backend choice, made once per scheduler:
 *   explicit delay (including 0)  -> delay_backend
 *   no delay, frames available    -> *frame_backend
 *   no delay, no frame source     -> delay_backend (0ms)
 */
Timer_Backend &select_timer_backend(const DebounceConfig &cfg,
                                    Timer_Backend &delay_backend,
                                    Timer_Backend *frame_backend);

/*============================================================================
 * Scheduler State
 *============================================================================
 * Burst bookkeeping. Timestamps are milliseconds since boot; elapsed times
 * are taken as signed 32-bit differences so counter wrap is harmless and a
 * clock that steps backward shows up as a negative interval.
 */
struct DebounceState {
    bool has_last_call = false;         /* false once the burst has ended */
    uint32_t last_call_ms = 0;          /* Most recent invoke() request */
    uint32_t last_invoke_ms = 0;        /* Most recent run (or burst start) */
    bool has_pending_args = false;      /* Arguments waiting for the trailing edge */
    timer_handle_t timer = TIMER_HANDLE_NONE;
};

/*
 * Invoke-now predicate for a call or wake-up at now_ms, evaluated against
 * the state as it was before that call was recorded:
 *   - no previous call in this burst
 *   - quiet period elapsed since the previous call
 *   - clock went backward (treated as a burst boundary)
 *   - maxWait ceiling reached since the last invocation
 */
bool debounce_should_invoke(const DebounceState &state, const DebounceConfig &cfg,
                            uint32_t wait_ms, uint32_t now_ms);

/* maxWait part of the predicate alone: the ceiling has expired at now_ms */
bool debounce_ceiling_reached(const DebounceState &state, const DebounceConfig &cfg,
                              uint32_t now_ms);

/* Time until the next wake-up while a burst is still warm */
uint32_t debounce_remaining_wait(const DebounceState &state, const DebounceConfig &cfg,
                                 uint32_t wait_ms, uint32_t now_ms);

/*============================================================================
 * Debounce Target
 *============================================================================
 * The typed front-end owns the argument bundle and the operation; the
 * scheduler only decides when they run.
 */
class Debounce_Target {
public:
    virtual ~Debounce_Target() = default;

    /* Take the captured arguments and run the operation with them */
    virtual void invoke_target() = 0;

    /* Drop captured arguments without running */
    virtual void discard_args() = 0;
};

/*============================================================================
 * Debounce Scheduler
 *============================================================================
 * States:
 *   IDLE     no wake-up scheduled, no burst in progress
 *   PENDING  wake-up scheduled; burst ongoing or cooling down
 *
 * Every state change completes before the target runs, so the target may
 * call back into on_call(), cancel() or flush() on the same scheduler.
 */
class Debounce_Scheduler {
public:
    Debounce_Scheduler(Clock_Source &clock, Timer_Backend &delay_backend,
                       Timer_Backend *frame_backend = nullptr);
    ~Debounce_Scheduler();

    /* Disable copy/move: the armed timer holds a pointer to this */
    Debounce_Scheduler(const Debounce_Scheduler&) = delete;
    Debounce_Scheduler& operator=(const Debounce_Scheduler&) = delete;
    Debounce_Scheduler(Debounce_Scheduler&&) = delete;
    Debounce_Scheduler& operator=(Debounce_Scheduler&&) = delete;

    /**
     * @brief Validate config, pick the timer backend and bind the target.
     * @return None, InvalidTarget (null target) or InvalidConfig
     *         (maxWait < delay, or already initialized)
     */
    DebounceError init(const DebounceConfig &cfg, Debounce_Target *target);

    /**
     * @brief Record a call whose arguments the target has just captured.
     * Ignored before init().
     */
    void on_call();

    /**
     * @brief Run the pending trailing edge now.
     * @return true if the target was invoked
     */
    bool flush();

    void cancel();

    bool pending() const { return state_.timer != TIMER_HANDLE_NONE; }
    bool is_initialized() const { return initialized_; }
    bool frame_aligned() const;
    uint32_t invoke_count() const { return invoke_count_; }

    const DebounceState &state() const { return state_; }
    const DebounceConfig &config() const { return cfg_; }

private:
    static void timer_expired_cb(void *ctx);

    void timer_expired();
    void leading_edge(uint32_t now_ms);
    void trailing_edge(uint32_t now_ms);
    void invoke_now(uint32_t now_ms);
    void start_timer(uint32_t wait_ms);
    void cancel_timer();

    Clock_Source &clock_;
    Timer_Backend &delay_backend_;
    Timer_Backend *frame_backend_;
    Timer_Backend *backend_ = nullptr;
    Debounce_Target *target_ = nullptr;

    DebounceConfig cfg_ = {};
    uint32_t wait_ms_ = 0;          /* Effective delay: 0 when frame-aligned */
    DebounceState state_ = {};
    uint32_t invoke_count_ = 0;
    bool initialized_ = false;
};

#endif // DEBOUNCE_SCHEDULER_HPP
