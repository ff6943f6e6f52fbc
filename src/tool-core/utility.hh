#pragma once

#include <tool-core/assert.hh>
#include <tool-core/fwd.hh>

#include <functional>
#include <iterator>
#include <type_traits>

// =========================================================================================================
// Utility functions shared by all combinators
// =========================================================================================================
//
// Move semantics:
//   move(value)                      - cast value to rvalue reference for moving
//   forward<T>(value)                - perfect forwarding for template arguments
//
// Invocation:
//   invoke(f, args...)               - uniform call syntax (callables, member function/object pointers)
//   is_invocable<F, Args...>         - true if invoke(f, args...) is well-formed
//   is_invocable_r<R, F, Args...>    - same, with result convertible to R
//   invoke_with_optional_idx(i, f, args...) - calls f(i, args...) if possible, otherwise f(args...)
//
// Ranges:
//   range                            - anything with begin/end (containers, arrays, spans, init-lists)
//   element_t<R>                     - decayed element type of a range
//   ssize(r)                         - signed element count of a range
//
// Callable utilities:
//   truthiness_function              - callable that converts its argument to bool
//

namespace tc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] TC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] TC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] TC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Invocation
// =========================================================================================================

/// Invokes f with args, supporting plain callables as well as pointers to member functions and objects
/// Exceptions thrown by f are never caught or translated
/// Usage:
///   tc::invoke([](int x) { return x + 1; }, 41);  // 42
///   tc::invoke(&person::name, p);                 // p.name
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_v<F, Args...>)
{
    return std::invoke(tc::forward<F>(f), tc::forward<Args>(args)...);
}

template <class F, class... Args>
constexpr bool is_invocable = std::is_invocable_v<F, Args...>;

template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

/// Calls f(idx, args...) if that is well-formed, otherwise f(args...)
/// This lets callbacks opt into receiving the element index:
///   tc::each(v, [](auto const& e) { ... });
///   tc::each(v, [](tc::isize i, auto const& e) { ... });
template <class F, class... Args>
constexpr decltype(auto) invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (std::is_invocable_v<F, isize, Args...>)
        return tc::invoke(tc::forward<F>(f), idx, tc::forward<Args>(args)...);
    else
        return tc::invoke(tc::forward<F>(f), tc::forward<Args>(args)...);
}

/// Returns false if f is a callable that is known to be empty
/// (null function or member pointer, or an empty std::function-like wrapper)
/// Lambdas and other functors always count as valid
template <class F>
[[nodiscard]] constexpr bool has_callable_target(F const& f)
{
    if constexpr (std::is_pointer_v<F> || std::is_member_pointer_v<F>)
        return f != nullptr;
    else if constexpr (requires { f.operator bool(); })
        return bool(f);
    else
        return true;
}

// =========================================================================================================
// Ranges
// =========================================================================================================

/// Anything that can be iterated with a range-based for loop
template <class R>
concept range = requires(R& r) {
    std::begin(r);
    std::end(r);
};

/// Decayed element type of a range
/// e.g. "std::vector<int> const&" -> int
template <class R>
using element_t = std::remove_cvref_t<decltype(*std::begin(std::declval<R&>()))>;

/// Signed element count of a range
template <range R>
[[nodiscard]] constexpr isize ssize(R const& r)
{
    if constexpr (requires { std::size(r); })
        return isize(std::size(r));
    else
        return isize(std::distance(std::begin(r), std::end(r)));
}

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that converts its argument to bool
/// Default predicate of every/some
struct truthiness_function
{
    template <class T>
    constexpr bool operator()(T const& v) const
    {
        return bool(v);
    }
};
} // namespace tc
