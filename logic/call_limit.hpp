/*
 * Call Limiters - Run an operation for the first N-1 calls only
 * Later calls return the result of the last real run
 */

#ifndef CALL_LIMIT_HPP
#define CALL_LIMIT_HPP

#include "logic/debounce_scheduler.hpp"
#include "logic/result_slot.hpp"

#include <cstdint>
#include <functional>
#include <utility>

template <typename Signature>
class Before;

template <typename R, typename... Args>
class Before<R(Args...)> {
public:
    using Operation = std::function<R(Args...)>;

    /**
     * @brief Arm the limiter.
     * @param n  Call count at which the operation stops running (n-1 runs)
     * @return InvalidTarget for an empty operation
     */
    DebounceError init(uint32_t n, Operation op) {
        if (!op) {
            return DebounceError::InvalidTarget;
        }
        remaining_ = n;
        op_ = std::move(op);
        return DebounceError::None;
    }

    const R *operator()(Args... args) {
        if (remaining_ > 0U) {
            remaining_--;
        }
        if (remaining_ == 0U || !op_) {
            op_ = nullptr;
            return result_.get();
        }

        if (remaining_ == 1U) {
            /* Last run: captured state is released when it returns */
            Operation last = std::move(op_);
            op_ = nullptr;
            result_.call(last, std::forward<Args>(args)...);
        } else {
            result_.call(op_, std::forward<Args>(args)...);
        }
        return result_.get();
    }

    bool exhausted() const { return !op_; }
    const R *last_result() const { return result_.get(); }

private:
    uint32_t remaining_ = 0;
    Operation op_;
    Result_Slot<R> result_;
};

/* Single-shot limiter: the operation runs on the first call only */
template <typename Signature>
class Once : public Before<Signature> {
public:
    DebounceError init(typename Before<Signature>::Operation op) {
        return Before<Signature>::init(2U, std::move(op));
    }
};

#endif // CALL_LIMIT_HPP
