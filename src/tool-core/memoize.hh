#pragma once

#include <tool-core/assert.hh>
#include <tool-core/fwd.hh>
#include <tool-core/mutex.hh>
#include <tool-core/optional.hh>
#include <tool-core/utility.hh>

#include <concepts>
#include <functional>
#include <memory>
#include <type_traits>
#include <unordered_map>

namespace tc
{
/// Keys of a memo table: primitive-like values that can be hashed and compared directly
/// e.g. integers, floats, chars, enums, std::string
template <class Key>
concept memo_key = std::equality_comparable<Key> && std::copy_constructible<Key> && requires(Key const& k) {
    { std::hash<Key>{}(k) } -> std::convertible_to<std::size_t>;
};

namespace impl
{
// parameter type of a non-generic unary callable (lambda, functor, function pointer)
template <class F>
struct unary_arg
{
};
template <class R, class A>
struct unary_arg<R (*)(A)>
{
    using type = A;
};
template <class R, class A>
struct unary_arg<R (*)(A) noexcept>
{
    using type = A;
};
template <class R, class C, class A>
struct unary_arg<R (C::*)(A) const>
{
    using type = A;
};
template <class R, class C, class A>
struct unary_arg<R (C::*)(A) const noexcept>
{
    using type = A;
};
template <class F>
    requires requires { &F::operator(); }
struct unary_arg<F> : unary_arg<decltype(&F::operator())>
{
};
} // namespace impl
} // namespace tc

/// Single-argument wrapper that caches the result of its (pure) function per argument
///
/// On a call with a key seen before, the stored result is returned and the function is not invoked.
/// Otherwise the function is invoked, its result stored under the key, and returned.
///
/// The memo table is private to this wrapper and only ever grows: no eviction, no expiry, no capacity.
/// Memory therefore grows with the number of distinct keys; bounding that is the caller's responsibility.
///
/// Thread safety:
///   lookups and stores happen under a tc::mutex, the function itself runs outside of it.
///   This allows the function to call its own wrapper recursively.
///   Two concurrent first calls for the same key may both compute; the first stored result wins
///   and both callers return the stored value. The table is never observed half-written.
///
/// Exceptions thrown by the function propagate unchanged and nothing is stored for that key.
///
/// Move-only. A moved-from wrapper must not be called.
template <class Key, class F>
struct tc::memoized_function
{
public:
    static_assert(tc::memo_key<Key>, "memoize keys must be hashable and equality comparable (primitive-like)");
    static_assert(std::is_invocable_v<F const&, Key const&>, "F must be callable with a single Key argument");

    using key_t = Key;
    using value_t = std::remove_cvref_t<std::invoke_result_t<F const&, Key const&>>;

    static_assert(!std::is_void_v<value_t>, "memoizing a function without result makes no sense");

    // invocation
public:
    value_t operator()(Key const& key) const
    {
        TC_ASSERT(is_valid(), "cannot call a moved-from tc::memoized_function");

        auto cached = _state->table.lock(
            [&](table_t& table) -> tc::optional<value_t>
            {
                auto const it = table.find(key);
                if (it == table.end())
                    return tc::nullopt;
                return it->second;
            });
        if (cached.has_value())
            return tc::move(cached).value();

        auto computed = value_t(tc::invoke(_state->func, key));

        return _state->table.lock([&](table_t& table) -> value_t
                                  { return table.try_emplace(key, tc::move(computed)).first->second; });
    }

    // queries
public:
    /// number of keys with a stored result
    [[nodiscard]] isize cache_size() const
    {
        TC_ASSERT(is_valid(), "cannot query a moved-from tc::memoized_function");
        return _state->table.lock([](table_t const& table) { return isize(table.size()); });
    }

    [[nodiscard]] bool is_valid() const { return _state != nullptr; }

    // ctors
public:
    explicit memoized_function(F func)
    {
        TC_ASSERT(tc::has_callable_target(func), "tc::memoize requires a callable target");
        _state = std::make_unique<state>(tc::move(func));
    }

    memoized_function(memoized_function&&) = default;
    memoized_function& operator=(memoized_function&&) = default;
    memoized_function(memoized_function const&) = delete;
    memoized_function& operator=(memoized_function const&) = delete;
    ~memoized_function() = default;

    // member
private:
    using table_t = std::unordered_map<Key, value_t>;

    struct state
    {
        F const func;
        tc::mutex<table_t> table;

        explicit state(F f) : func(tc::move(f)) {}
    };

    std::unique_ptr<state> _state;
};

namespace tc
{
/// Wraps the unary function f into a memoized_function with key type Key
/// Usage:
///   auto slow_square = tc::memoize<int>([](int n) { return expensive(n); });
template <class Key, class F>
[[nodiscard]] memoized_function<Key, std::decay_t<F>> memoize(F&& f)
{
    return memoized_function<Key, std::decay_t<F>>(tc::forward<F>(f));
}

/// Same as memoize<Key>(f), with Key deduced from the parameter of a non-generic callable
/// Usage:
///   auto m = tc::memoize([&](int n) { ++calls; return n * 2; });
///   m(3); m(3); m(4); // calls == 2
template <class F>
    requires requires { typename impl::unary_arg<std::decay_t<F>>::type; }
[[nodiscard]] auto memoize(F&& f)
{
    using key_t = std::remove_cvref_t<typename impl::unary_arg<std::decay_t<F>>::type>;
    return memoized_function<key_t, std::decay_t<F>>(tc::forward<F>(f));
}
} // namespace tc
