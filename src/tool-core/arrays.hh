#pragma once

#include <tool-core/collection.hh>
#include <tool-core/fwd.hh>
#include <tool-core/utility.hh>

#include <algorithm>
#include <random>
#include <type_traits>
#include <vector>

// Set-like and ordering transforms over ranges.
// All of them return a new std::vector and leave their inputs untouched.
// Element comparisons only need operator== (uniq, intersection, difference) or operator< on the sort key (sort_by),
// so they are quadratic in the worst case and meant for small to medium ranges.

namespace tc
{
/// First occurrence of every distinct element, in original order
template <range Range>
[[nodiscard]] std::vector<element_t<Range const>> uniq(Range const& values)
{
    std::vector<element_t<Range const>> result;
    for (auto const& v : values)
        if (!tc::contains(result, v))
            result.push_back(v);
    return result;
}

/// Distinct elements of the first range that are contained in every other range, in first-range order
template <range Range, range... Others>
[[nodiscard]] std::vector<element_t<Range const>> intersection(Range const& values, Others const&... others)
{
    std::vector<element_t<Range const>> result;
    for (auto const& v : values)
        if ((tc::contains(others, v) && ...) && !tc::contains(result, v))
            result.push_back(v);
    return result;
}

/// Elements of the first range that are contained in none of the other ranges, in first-range order
/// Duplicates within the first range are kept.
template <range Range, range... Others>
[[nodiscard]] std::vector<element_t<Range const>> difference(Range const& values, Others const&... others)
{
    std::vector<element_t<Range const>> result;
    for (auto const& v : values)
        if (!(tc::contains(others, v) || ...))
            result.push_back(v);
    return result;
}

/// Uniformly random permutation of the elements (Fisher-Yates), drawn from the given engine
/// Usage:
///   std::mt19937 rng(1234);
///   auto deck = tc::shuffle(cards, rng);
template <range Range, class Engine>
[[nodiscard]] std::vector<element_t<Range const>> shuffle(Range const& values, Engine& engine)
{
    std::vector<element_t<Range const>> result(std::begin(values), std::end(values));

    for (auto i = tc::ssize(result) - 1; i > 0; --i)
    {
        auto dist = std::uniform_int_distribution<isize>(0, i);
        auto const j = dist(engine);
        std::swap(result[std::size_t(i)], result[std::size_t(j)]);
    }

    return result;
}

/// Same as shuffle(values, engine) with a freshly seeded engine
template <range Range>
[[nodiscard]] std::vector<element_t<Range const>> shuffle(Range const& values)
{
    std::random_device seed;
    std::mt19937_64 engine(seed());
    return tc::shuffle(values, engine);
}

/// Elements sorted ascending by criterion(elem), stable for equal keys
/// criterion may be a callable or a pointer to data member
/// Usage:
///   tc::sort_by(people, &person::name);
///   tc::sort_by(words, [](std::string const& w) { return w.size(); });
template <range Range, class Criterion>
[[nodiscard]] std::vector<element_t<Range const>> sort_by(Range const& values, Criterion&& criterion)
{
    std::vector<element_t<Range const>> result(std::begin(values), std::end(values));
    std::stable_sort(result.begin(), result.end(),
                     [&](auto const& a, auto const& b) { return tc::invoke(criterion, a) < tc::invoke(criterion, b); });
    return result;
}
} // namespace tc
