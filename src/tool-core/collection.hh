#pragma once

#include <tool-core/assert.hh>
#include <tool-core/fwd.hh>
#include <tool-core/optional.hh>
#include <tool-core/utility.hh>

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <vector>

// =========================================================================================================
// Single-pass collection helpers
// =========================================================================================================
//
// Element access:
//   first(r) / first(r, n)               - first element (optional) / first min(n, size) elements
//   last(r) / last(r, n)                 - last element (optional) / last min(n, size) elements
//   index_of(r, target)                  - position of the first element == target, or -1
//
// Iteration:
//   each(r, f)                           - f(elem) or f(idx, elem) for every element
//   each(map, f)                         - f(key, value) for every entry of an associative container
//
// Transformation (all return a new std::vector, the input is only read):
//   filter(r, pred)                      - elements with pred(elem)
//   reject(r, pred)                      - elements without pred(elem)
//   map(r, f)                            - f(elem) for every element
//   pluck(r, key)                        - value under key for every map-like element that has it
//   pluck(r, &S::member)                 - member of every element
//   invoke_each(r, f, args...)           - tc::invoke(f, elem, args...) for every element
//
// Queries:
//   contains(r, target)                  - any element == target
//   every(r, pred) / every(r)            - all elements satisfy pred / are truthy (true for empty ranges)
//   some(r, pred) / some(r)              - any element satisfies pred / is truthy (false for empty ranges)
//
// Callbacks taking an element may also take a leading tc::isize index (see tc::invoke_with_optional_idx).
//

namespace tc
{
// =========================================================================================================
// Element access
// =========================================================================================================

template <range Range>
[[nodiscard]] tc::optional<element_t<Range const>> first(Range const& values)
{
    auto it = std::begin(values);
    if (it == std::end(values))
        return tc::nullopt;
    return *it;
}

/// Precondition: n >= 0
template <range Range>
[[nodiscard]] std::vector<element_t<Range const>> first(Range const& values, isize n)
{
    TC_ASSERT(n >= 0, "first: element count must be non-negative");

    std::vector<element_t<Range const>> result;
    for (auto const& v : values)
    {
        if (tc::ssize(result) >= n)
            break;
        result.push_back(v);
    }
    return result;
}

template <range Range>
[[nodiscard]] tc::optional<element_t<Range const>> last(Range const& values)
{
    tc::optional<element_t<Range const>> result;
    for (auto const& v : values)
        result = v;
    return result;
}

/// Precondition: n >= 0
/// When n exceeds the size, all elements are returned
template <range Range>
[[nodiscard]] std::vector<element_t<Range const>> last(Range const& values, isize n)
{
    TC_ASSERT(n >= 0, "last: element count must be non-negative");

    auto const skip = std::max(isize(0), tc::ssize(values) - n);

    std::vector<element_t<Range const>> result;
    isize idx = 0;
    for (auto const& v : values)
        if (idx++ >= skip)
            result.push_back(v);
    return result;
}

template <range Range, class T>
[[nodiscard]] isize index_of(Range const& values, T const& target)
{
    isize idx = 0;
    for (auto const& v : values)
    {
        if (v == target)
            return idx;
        ++idx;
    }
    return -1;
}

// =========================================================================================================
// Iteration
// =========================================================================================================

namespace impl
{
template <class R>
concept associative_range = tc::range<R> && requires {
    typename R::key_type;
    typename R::mapped_type;
};
} // namespace impl

/// Calls f for every element, in order
/// For associative containers, f receives (key, value) instead
template <range Range, class F>
void each(Range&& values, F&& f)
{
    if constexpr (impl::associative_range<std::remove_cvref_t<Range>>)
    {
        for (auto&& [key, value] : values)
            tc::invoke(f, key, value);
    }
    else
    {
        isize idx = 0;
        for (auto&& v : values)
            tc::invoke_with_optional_idx(idx++, f, v);
    }
}

// =========================================================================================================
// Transformation
// =========================================================================================================

template <range Range, class Pred>
[[nodiscard]] std::vector<element_t<Range const>> filter(Range const& values, Pred&& pred)
{
    std::vector<element_t<Range const>> result;
    isize idx = 0;
    for (auto const& v : values)
        if (tc::invoke_with_optional_idx(idx++, pred, v))
            result.push_back(v);
    return result;
}

template <range Range, class Pred>
[[nodiscard]] std::vector<element_t<Range const>> reject(Range const& values, Pred&& pred)
{
    std::vector<element_t<Range const>> result;
    isize idx = 0;
    for (auto const& v : values)
        if (!tc::invoke_with_optional_idx(idx++, pred, v))
            result.push_back(v);
    return result;
}

template <range Range, class F>
[[nodiscard]] auto map(Range const& values, F&& f)
{
    using result_t = std::remove_cvref_t<decltype(tc::invoke_with_optional_idx(isize(0), f, *std::begin(values)))>;
    static_assert(!std::is_void_v<result_t>, "map requires f to return a value, use tc::each for side effects");

    std::vector<result_t> result;
    if constexpr (requires { std::size(values); })
        result.reserve(std::size(values));

    isize idx = 0;
    for (auto const& v : values)
        result.push_back(tc::invoke_with_optional_idx(idx++, f, v));
    return result;
}

/// Values stored under key in every map-like element (elements without the key are skipped)
/// Usage:
///   std::vector<std::map<std::string, int>> people = {{{"age", 30}}, {{"age", 40}}};
///   tc::pluck(people, "age"); // {30, 40}
template <range Range, class Key>
    requires impl::associative_range<element_t<Range const>>
[[nodiscard]] auto pluck(Range const& objects, Key const& key)
{
    std::vector<typename element_t<Range const>::mapped_type> result;
    for (auto const& obj : objects)
    {
        auto const it = obj.find(key);
        if (it != obj.end())
            result.push_back(it->second);
    }
    return result;
}

/// The given data member of every element
/// Usage:
///   tc::pluck(people, &person::age);
template <range Range, class Member, class Class>
    requires(!std::is_function_v<Member>)
[[nodiscard]] std::vector<std::remove_cvref_t<Member>> pluck(Range const& objects, Member Class::* member)
{
    std::vector<std::remove_cvref_t<Member>> result;
    for (auto const& obj : objects)
        result.push_back(tc::invoke(member, obj));
    return result;
}

/// tc::invoke(f, elem, args...) for every element, results collected in order
/// f may be a pointer to member function, which calls that method on each element
/// Usage:
///   tc::invoke_each(names, &std::string::size);        // lengths
///   tc::invoke_each(names, &std::string::substr, 0, 1); // first letters
template <range Range, class F, class... Args>
[[nodiscard]] auto invoke_each(Range const& values, F&& f, Args const&... args)
{
    using result_t = std::remove_cvref_t<decltype(tc::invoke(f, *std::begin(values), args...))>;
    static_assert(!std::is_void_v<result_t>, "invoke_each requires f to return a value, use tc::each for side effects");

    std::vector<result_t> result;
    for (auto const& v : values)
        result.push_back(tc::invoke(f, v, args...));
    return result;
}

// =========================================================================================================
// Queries
// =========================================================================================================

template <range Range, class T>
[[nodiscard]] bool contains(Range const& values, T const& target)
{
    return tc::index_of(values, target) >= 0;
}

/// true iff pred holds for all elements (vacuously true for empty ranges)
template <range Range, class Pred = truthiness_function>
[[nodiscard]] bool every(Range const& values, Pred&& pred = {})
{
    isize idx = 0;
    for (auto const& v : values)
        if (!tc::invoke_with_optional_idx(idx++, pred, v))
            return false;
    return true;
}

/// true iff pred holds for at least one element (false for empty ranges)
template <range Range, class Pred = truthiness_function>
[[nodiscard]] bool some(Range const& values, Pred&& pred = {})
{
    isize idx = 0;
    for (auto const& v : values)
        if (tc::invoke_with_optional_idx(idx++, pred, v))
            return true;
    return false;
}
} // namespace tc
