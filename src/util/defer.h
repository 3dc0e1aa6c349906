#pragma once

#include <type_traits>
#include <utility>

namespace util {

template <class T>
concept nothrow_move_constructible =
    std::is_nothrow_move_constructible<T>::value;

// Call a function when leaving scope, e.g. to remove local copies of images
// or to release a curl handle, whichever way the scope is exited.
template <nothrow_move_constructible F> class defer_wrap {
    F on_exit;
    bool trigger = true;

  public:
    template <typename F2>
        requires std::is_nothrow_constructible_v<F, F2>
    explicit defer_wrap(F2&& f) noexcept : on_exit(std::forward<F2>(f)) {
    }

    defer_wrap(defer_wrap&& other) noexcept
        : on_exit(std::move(other.on_exit)), trigger(other.trigger) {
        other.release();
    }

    defer_wrap(const defer_wrap&) = delete;
    defer_wrap& operator=(const defer_wrap&) = delete;

    // disarm: the function will not be called
    void release() noexcept {
        trigger = false;
    }

    ~defer_wrap() noexcept(noexcept(on_exit())) {
        if (trigger)
            on_exit();
    }
};

template <typename F> auto defer(F&& f) {
    return defer_wrap<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace util
