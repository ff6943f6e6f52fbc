#pragma once

#include <tool-core/fwd.hh>
#include <tool-core/optional.hh>
#include <tool-core/utility.hh>

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>
#include <vector>

namespace tc
{
namespace impl
{
template <class It, class End>
auto zip_take(It& it, End const& end) -> tc::optional<std::remove_cvref_t<decltype(*it)>>
{
    if (it == end)
        return tc::nullopt;

    tc::optional<std::remove_cvref_t<decltype(*it)>> v = *it;
    ++it;
    return v;
}

template <std::size_t... I, class... Ranges>
auto zip_rows(std::index_sequence<I...>, Ranges const&... ranges)
{
    using row_t = std::tuple<tc::optional<element_t<Ranges const>>...>;

    isize const longest = std::max({tc::ssize(ranges)...});

    std::vector<row_t> rows;
    rows.reserve(std::size_t(longest));

    auto cursors = std::make_tuple(std::begin(ranges)...);
    auto const ends = std::make_tuple(std::end(ranges)...);

    for (isize r = 0; r < longest; ++r)
        rows.emplace_back(impl::zip_take(std::get<I>(cursors), std::get<I>(ends))...);

    return rows;
}
} // namespace impl

/// Combines ranges position by position into rows of optionals
///
/// Row i holds the i-th element of every range, in argument order.
/// The result has as many rows as the LONGEST range has elements;
/// positions past the end of a shorter range hold tc::nullopt (the absent marker), never a default value.
/// Zero ranges give zero rows.
///
/// Usage:
///   auto rows = tc::zip(std::vector<char>{'a', 'b', 'c', 'd'}, std::vector<int>{1, 2, 3});
///   // rows.size() == 4
///   // std::get<0>(rows[3]) == 'd', std::get<1>(rows[3]) == tc::nullopt
template <range... Ranges>
[[nodiscard]] auto zip(Ranges const&... ranges)
{
    if constexpr (sizeof...(Ranges) == 0)
        return std::vector<std::tuple<>>();
    else
        return impl::zip_rows(std::index_sequence_for<Ranges...>{}, ranges...);
}

/// Homogeneous variant of zip taking the ranges as one range of ranges
/// Row i holds the i-th element of every inner range (or tc::nullopt), in the order of the outer range.
/// Usage:
///   std::vector<std::vector<int>> columns = {{1, 2, 3}, {4}};
///   tc::zip_all(columns); // {{1, 4}, {2, nullopt}, {3, nullopt}}
template <range Outer>
[[nodiscard]] auto zip_all(Outer const& sequences)
{
    using value_t = element_t<element_t<Outer const> const>;

    isize longest = 0;
    for (auto const& s : sequences)
        longest = std::max(longest, tc::ssize(s));

    auto rows = std::vector<std::vector<tc::optional<value_t>>>(std::size_t(longest));
    for (auto& row : rows)
        row.reserve(std::size_t(tc::ssize(sequences)));

    for (auto const& s : sequences)
    {
        std::size_t r = 0;
        for (auto const& v : s)
            rows[r++].push_back(v);
        for (; r < rows.size(); ++r)
            rows[r].push_back(tc::nullopt);
    }

    return rows;
}
} // namespace tc
