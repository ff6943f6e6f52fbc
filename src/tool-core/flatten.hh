#pragma once

#include <tool-core/fwd.hh>
#include <tool-core/nested.hh>
#include <tool-core/utility.hh>

#include <string_view>
#include <type_traits>
#include <vector>

namespace tc
{
/// Collects every leaf of a nested sequence into a flat vector, in depth-first left-to-right order
///
/// A leaf node flattens to a single-element vector, an empty list to an empty vector.
/// Uses an explicit work stack instead of recursion, so arbitrarily deep nesting does not exhaust the call stack.
/// The input is only read.
///
/// Usage:
///   tc::nested<int> n = {1, {2, 3, {4}}, 5};
///   tc::flatten(n); // {1, 2, 3, 4, 5}
template <class T>
[[nodiscard]] std::vector<T> flatten(nested<T> const& root)
{
    std::vector<T> result;

    // nodes still to visit, the next one on top
    // children are pushed in reverse so that the leftmost one is popped first
    std::vector<nested<T> const*> pending;
    pending.push_back(&root);

    while (!pending.empty())
    {
        auto const* node = pending.back();
        pending.pop_back();

        if (node->is_leaf())
        {
            result.push_back(node->value());
            continue;
        }

        auto const& children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it)
            pending.push_back(&*it);
    }

    return result;
}

namespace impl
{
// innermost non-range element type of a statically nested range
// e.g. "vector<vector<int>>" -> int
// strings count as leaves, not as ranges of char
template <class T>
struct innermost_element
{
    using type = T;
};
template <class T>
    requires tc::range<T> && (!std::is_same_v<element_t<T>, T>) && (!std::is_convertible_v<T const&, std::string_view>)
struct innermost_element<T>
{
    using type = typename innermost_element<element_t<T>>::type;
};

template <class T>
void flatten_into(std::vector<typename innermost_element<T>::type>& out, T const& value)
{
    if constexpr (std::is_same_v<typename innermost_element<T>::type, T>)
        out.push_back(value);
    else
        for (auto const& v : value)
            impl::flatten_into(out, v);
}
} // namespace impl

/// Collapses all levels of a statically nested range into a flat vector of its innermost elements
/// The nesting depth is part of the type, so the recursion depth is fixed at compile time.
/// Strings are leaves: a vector<vector<std::string>> flattens to a vector<std::string>.
/// Usage:
///   std::vector<std::vector<std::vector<int>>> v = {{{1}, {2, 3}}, {{4}}};
///   tc::flatten(v); // {1, 2, 3, 4}
template <range Range>
[[nodiscard]] auto flatten(Range const& values)
{
    std::vector<typename impl::innermost_element<Range>::type> result;
    impl::flatten_into(result, values);
    return result;
}
} // namespace tc
