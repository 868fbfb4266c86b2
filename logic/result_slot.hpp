/*
 * Result_Slot - Last return value of a rate-limited operation
 * void operations store nothing and report a null result
 */

#ifndef RESULT_SLOT_HPP
#define RESULT_SLOT_HPP

#include <optional>
#include <tuple>
#include <utility>

template <typename R>
class Result_Slot {
public:
    template <typename Fn, typename Tuple>
    void apply(Fn &fn, Tuple &args) {
        value_ = std::apply(fn, args);
    }

    template <typename Fn, typename... A>
    void call(Fn &fn, A &&...args) {
        value_ = fn(std::forward<A>(args)...);
    }

    const R *get() const { return value_ ? &*value_ : nullptr; }

private:
    std::optional<R> value_;
};

template <>
class Result_Slot<void> {
public:
    template <typename Fn, typename Tuple>
    void apply(Fn &fn, Tuple &args) {
        std::apply(fn, args);
    }

    template <typename Fn, typename... A>
    void call(Fn &fn, A &&...args) {
        fn(std::forward<A>(args)...);
    }

    const void *get() const { return nullptr; }
};

#endif // RESULT_SLOT_HPP
