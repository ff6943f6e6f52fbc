#include <tool-core/reduce.hh>

#include <nexus/test.hh>

#include <list>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace
{
struct step_failure : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

auto const plus = [](int v, int acc) { return acc + v; };
} // namespace

TEST("reduce - empty range returns the initial value")
{
    SECTION("explicit numeric init")
    {
        CHECK(tc::reduce(std::vector<int>{}, plus, 17) == 17);
    }

    SECTION("explicit non-numeric init")
    {
        auto const r = tc::reduce(
            std::vector<int>{}, [](int, std::string acc) { return acc; }, std::string("seed"));
        CHECK(r == "seed");
    }

    SECTION("omitted init falls back to zero")
    {
        CHECK(tc::reduce(std::vector<int>{}, plus) == 0);
        CHECK(tc::reduce(std::vector<double>{}, [](double v, double acc) { return acc + v; }) == 0.0);
    }
}

TEST("reduce - omitted init with non-numeric elements")
{
    std::vector<std::string> const words = {"ab", "cde", "f"};
    auto const length = [](std::string const& w, int acc) { return acc + int(w.size()); };

    SECTION("int accumulators start from zero")
    {
        auto const total = tc::reduce(words, length);
        static_assert(std::is_same_v<std::remove_const_t<decltype(total)>, int>);
        CHECK(total == 6);
        CHECK(tc::reduce(std::vector<std::string>{}, length) == 0);
    }

    SECTION("element accumulators start empty")
    {
        auto const joined = tc::reduce(words, [](std::string const& w, std::string acc) { return acc + w; });
        CHECK(joined == "abcdef");
    }
}

TEST("reduce - falsy initial values are used as-is")
{
    SECTION("zero")
    {
        CHECK(tc::reduce(std::vector<int>{4, 5}, plus, 0) == 9);
    }

    SECTION("empty string stays a string accumulation")
    {
        auto const r = tc::reduce(
            std::vector<int>{1, 2}, [](int v, std::string acc) { return acc + std::to_string(v); }, std::string());
        CHECK(r == "12");
    }

    SECTION("false")
    {
        auto const any_negative = tc::reduce(
            std::vector<int>{3, -1, 2}, [](int v, bool acc) { return acc || v < 0; }, false);
        CHECK(any_negative);
    }
}

TEST("reduce - accumulates strictly left to right")
{
    std::vector<std::string> seen;
    auto const trace = tc::reduce(
        std::vector<int>{1, 2, 3},
        [&](int v, std::string acc)
        {
            seen.push_back(acc);
            return acc + "-" + std::to_string(v);
        },
        std::string());

    CHECK(trace == "-1-2-3");
    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == "");
    CHECK(seen[1] == "-1");
    CHECK(seen[2] == "-1-2");
}

TEST("reduce - element and accumulator order of the step function")
{
    // non-commutative step: the element comes first, the accumulator second
    auto const r = tc::reduce(std::vector<int>{10, 3}, [](int v, int acc) { return v - acc; }, 1);
    // 10 - 1 = 9, then 3 - 9 = -6
    CHECK(r == -6);
}

TEST("reduce - works on any range and leaves it untouched")
{
    SECTION("std::list")
    {
        std::list<int> const values = {1, 2, 3, 4};
        CHECK(tc::reduce(values, plus) == 10);
    }

    SECTION("c array")
    {
        int const values[] = {5, 6, 7};
        CHECK(tc::reduce(values, plus, 1) == 19);
    }

    SECTION("input unchanged")
    {
        std::vector<int> values = {1, 2, 3};
        auto const copy = values;
        (void)tc::reduce(values, [](int v, int acc) { return acc * 10 + v; }, 0);
        CHECK(values == copy);
    }
}

TEST("reduce - long ranges do not grow the stack")
{
    std::vector<int> values(1'000'000, 1);
    auto const sum = tc::reduce(values, [](int v, tc::i64 acc) { return acc + v; }, tc::i64(0));
    CHECK(sum == 1'000'000);
}

TEST("reduce - exceptions from the step function propagate unchanged")
{
    int steps = 0;
    bool caught = false;
    try
    {
        (void)tc::reduce(std::vector<int>{1, 2, 3},
                         [&](int v, int acc)
                         {
                             ++steps;
                             if (v == 2)
                                 throw step_failure("bad element");
                             return acc + v;
                         },
                         0);
    }
    catch (step_failure const& e)
    {
        caught = std::string(e.what()) == "bad element";
    }

    CHECK(caught);
    CHECK(steps == 2);
}
