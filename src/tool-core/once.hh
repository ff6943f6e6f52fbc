#pragma once

#include <tool-core/assert.hh>
#include <tool-core/fwd.hh>
#include <tool-core/mutex.hh>
#include <tool-core/optional.hh>
#include <tool-core/utility.hh>

#include <atomic>
#include <memory>
#include <thread>
#include <type_traits>

/// Zero-argument wrapper that invokes its function at most once
///
/// The first call invokes the wrapped function and caches its result.
/// Every later call returns a copy of the cached result without invoking the function again.
/// If the wrapped function throws, the exception propagates unchanged and the wrapper stays armed,
/// so the next call tries again (same rule as std::call_once).
///
/// The armed/fired flag and the cached result live behind a tc::mutex owned by this wrapper only.
/// Concurrent callers serialize on it: one of them runs the function, the others wait and
/// then read the cached result.
///
/// Move-only. A moved-from wrapper must not be called.
/// The wrapped function must not call its own wrapper: the wrapper remembers which thread is
/// currently running the function and such a re-entrant call trips TC_ASSERT instead of relocking.
///
/// Usage:
///   auto init = tc::once([&] { return load_table(); });
///   auto a = init(); // loads
///   auto b = init(); // cached copy, no second load
template <class F>
struct tc::once_function
{
public:
    using result_t = std::invoke_result_t<F&>;
    using value_t = std::remove_cvref_t<result_t>;

    static_assert(std::is_void_v<result_t> || std::is_copy_constructible_v<value_t>,
                  "once_function hands out copies of the cached result, so it must be copyable");

    // invocation
public:
    /// Returns the result of the first successful invocation of the wrapped function
    /// Precondition: is_valid()
    value_t operator()() const
    {
        TC_ASSERT(is_valid(), "cannot call a moved-from tc::once_function");
        TC_ASSERT(_state->runner.load() != std::this_thread::get_id(),
                  "tc::once_function called from inside its own wrapped function");

        auto& runner = _state->runner;
        return _state->guarded.lock(
            [&runner](state& s) -> value_t
            {
                if (s.fired)
                {
                    if constexpr (!std::is_void_v<result_t>)
                        return s.result.value();
                    else
                        return;
                }

                runner_scope const scope(runner);

                // a throwing func leaves "fired" untouched
                if constexpr (std::is_void_v<result_t>)
                {
                    tc::invoke(s.func);
                    s.fired = true;
                }
                else
                {
                    s.result.emplace(tc::invoke(s.func));
                    s.fired = true;
                    return s.result.value();
                }
            });
    }

    // queries
public:
    /// true iff the wrapped function has completed once
    [[nodiscard]] bool is_fired() const
    {
        TC_ASSERT(is_valid(), "cannot query a moved-from tc::once_function");
        return _state->guarded.lock([](state const& s) { return s.fired; });
    }

    [[nodiscard]] bool is_valid() const { return _state != nullptr; }

    // ctors
public:
    explicit once_function(F func)
    {
        TC_ASSERT(tc::has_callable_target(func), "tc::once requires a callable target");
        _state = std::make_unique<shared>(tc::move(func));
    }

    once_function(once_function&&) = default;
    once_function& operator=(once_function&&) = default;
    once_function(once_function const&) = delete;
    once_function& operator=(once_function const&) = delete;
    ~once_function() = default;

    // member
private:
    struct empty_result
    {
    };

    struct state
    {
        F func;
        bool fired = false;
        [[no_unique_address]] std::conditional_t<std::is_void_v<result_t>, empty_result, tc::optional<value_t>> result;

        explicit state(F f) : func(tc::move(f)) {}
    };

    // marks the calling thread as the one running func until the scope ends (also on throw)
    struct runner_scope
    {
        std::atomic<std::thread::id>& runner;

        explicit runner_scope(std::atomic<std::thread::id>& r) : runner(r) { runner.store(std::this_thread::get_id()); }
        ~runner_scope() { runner.store(std::thread::id()); }

        runner_scope(runner_scope const&) = delete;
        runner_scope& operator=(runner_scope const&) = delete;
    };

    struct shared
    {
        tc::mutex<state> guarded;
        // thread currently inside func, default id when nobody is
        std::atomic<std::thread::id> runner;

        explicit shared(F f) : guarded(tc::move(f)) {}
    };

    std::unique_ptr<shared> _state;
};

namespace tc
{
/// Wraps f into a once_function: f is invoked on the first call only, later calls return the cached result
/// Each call to tc::once creates independent state, even when wrapping the same function twice
template <class F>
[[nodiscard]] once_function<std::decay_t<F>> once(F&& f)
{
    return once_function<std::decay_t<F>>(tc::forward<F>(f));
}
} // namespace tc
