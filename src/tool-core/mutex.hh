#pragma once

#include <tool-core/fwd.hh>
#include <tool-core/utility.hh>

#include <mutex>

/// Thread-safe wrapper for data T protected by a mutex
/// Rust-style mutex that encapsulates both the data and the mutex protecting it
/// Access to the protected data is only possible through scoped lock operations
/// This is how once_function and memoized_function guard their private state
template <class T>
struct tc::mutex
{
    /// Acquire lock, invoke function with protected value, and return result
    /// The mutex is held for the duration of the function call and released on exceptions
    /// Returns: The result of invoking f with the protected value (auto to prevent reference leaks)
    /// Usage:
    ///   tc::mutex<int> counter;
    ///   counter.lock([](int& val) { val++; });
    ///   int current = counter.lock([](int const& val) { return val; });
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard lock(_mutex);
        return tc::invoke(tc::forward<F>(f), _value);
    }

    /// Default constructor - default-constructs the protected value
    mutex() = default;

    /// Construct with initial value
    template <class... Args>
    explicit mutex(Args&&... args) : _value(tc::forward<Args>(args)...)
    {
    }

    // pinned: the protected value never moves
    mutex(mutex&&) = delete;
    mutex(mutex const&) = delete;
    mutex& operator=(mutex&&) = delete;
    mutex& operator=(mutex const&) = delete;

private:
    T _value;
    std::mutex _mutex;
};
