#pragma once

#include <tool-core/fwd.hh>
#include <tool-core/utility.hh>

#include <type_traits>

namespace tc
{
/// Folds a range left to right into a single value
///
/// Calls step(element, accumulator) for each element in order and uses the result as the next accumulator.
/// The first element combines with init, the second with that result, and so on.
/// An empty range returns init unchanged.
///
/// The accumulator has the (decayed) type of init, so the result of step must be convertible to it.
/// An explicitly passed falsy init ("", 0, false) is used as-is.
///
/// Implemented as a plain loop: stack usage does not depend on the range length.
/// The range is only read. Exceptions from step propagate unchanged.
///
/// Usage:
///   auto sum = tc::reduce(values, [](int v, int acc) { return acc + v; }, 0);
///   auto trace = tc::reduce(values, [](int v, std::string acc) { return acc + "-" + std::to_string(v); }, std::string());
template <range Range, class Acc, class StepF>
[[nodiscard]] constexpr std::decay_t<Acc> reduce(Range const& values, StepF&& step, Acc&& init)
{
    using acc_t = std::decay_t<Acc>;
    static_assert(tc::is_invocable<StepF&, element_t<Range const> const&, acc_t&&>,
                  "step must be callable as step(element, accumulator)");

    acc_t acc = tc::forward<Acc>(init);
    for (auto const& v : values)
        acc = acc_t(tc::invoke(step, v, tc::move(acc)));
    return acc;
}

/// Same as reduce(values, step, init) with no initial value supplied, the accumulator starts at zero:
///   - arithmetic elements start from a zero of the element type
///   - other elements start from int 0 if step accepts an int accumulator (e.g. summing string lengths)
///   - otherwise the accumulator is a value-initialized element ("" for strings)
/// Steps taking the accumulator as auto should pass init explicitly.
/// Usage:
///   tc::reduce(std::vector<int>{}, plus); // 0
///   tc::reduce(std::vector<int>{1, 2, 3}, plus); // 6
///   tc::reduce(words, [](std::string const& w, int acc) { return acc + int(w.size()); }); // total length
template <range Range, class StepF>
[[nodiscard]] constexpr auto reduce(Range const& values, StepF&& step)
{
    using elem_t = element_t<Range const>;

    if constexpr (std::is_arithmetic_v<elem_t>)
        return tc::reduce(values, tc::forward<StepF>(step), elem_t(0));
    else if constexpr (tc::is_invocable<StepF&, elem_t const&, int&&>)
        return tc::reduce(values, tc::forward<StepF>(step), 0);
    else
        return tc::reduce(values, tc::forward<StepF>(step), elem_t{});
}
} // namespace tc
