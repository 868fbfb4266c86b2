/*
 * Debounced - Typed front-end over Debounce_Scheduler
 * Owns the operation, the latest argument bundle and the last result
 *
 *   static Debounced<void(bool)> contact(clock, delay_timers, &frame_timers);
 *   contact.init(on_settled, cfg);
 *   contact.invoke(raw_level);   // from the event loop
 */

#ifndef DEBOUNCED_HPP
#define DEBOUNCED_HPP

#include "logic/debounce_scheduler.hpp"
#include "logic/result_slot.hpp"

#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

template <typename Signature>
class Debounced;

template <typename R, typename... Args>
class Debounced<R(Args...)> final : private Debounce_Target {
public:
    using Operation = std::function<R(Args...)>;

    Debounced(Clock_Source &clock, Timer_Backend &delay_backend,
              Timer_Backend *frame_backend = nullptr)
        : scheduler_(clock, delay_backend, frame_backend) {}

    Debounced(const Debounced&) = delete;
    Debounced& operator=(const Debounced&) = delete;

    /**
     * @brief Bind the operation and configuration (the create step).
     * @return InvalidTarget for an empty operation, InvalidConfig when
     *         maxWait < delay or already initialized
     */
    DebounceError init(Operation op, const DebounceConfig &cfg) {
        if (!op) {
            return DebounceError::InvalidTarget;
        }
        DebounceError err = scheduler_.init(cfg, this);
        if (err == DebounceError::None) {
            op_ = std::move(op);
        }
        return err;
    }

    /* Never blocks; may run the operation synchronously on a leading edge */
    void invoke(Args... args) {
        if (!scheduler_.is_initialized()) {
            return;
        }
        args_.emplace(std::forward<Args>(args)...);
        scheduler_.on_call();
    }

    void cancel() { scheduler_.cancel(); }

    /* Runs the pending trailing call now; returns the latest result */
    const R *flush() {
        scheduler_.flush();
        return result_.get();
    }

    bool pending() const { return scheduler_.pending(); }

    /* Null until the operation has produced a value (always null for void) */
    const R *last_result() const { return result_.get(); }

    const Debounce_Scheduler &scheduler() const { return scheduler_; }

private:
    using Arg_Bundle = std::tuple<std::decay_t<Args>...>;

    void invoke_target() override {
        /* Move out first: the operation may call invoke() again */
        Arg_Bundle args = std::move(*args_);
        args_.reset();
        result_.apply(op_, args);
    }

    void discard_args() override { args_.reset(); }

    Debounce_Scheduler scheduler_;
    Operation op_;
    std::optional<Arg_Bundle> args_;
    Result_Slot<R> result_;
};

#endif // DEBOUNCED_HPP
