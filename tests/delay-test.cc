#include <tool-core/delay.hh>

#include <nexus/test.hh>

#include <chrono>
#include <string>

TEST("delay - waits, then calls with the given arguments")
{
    auto const start = std::chrono::steady_clock::now();
    auto const joined
        = tc::delay([](std::string const& a, std::string const& b) { return a + b; }, std::chrono::milliseconds(20), "a", "b");
    auto const elapsed = std::chrono::steady_clock::now() - start;

    CHECK(joined == "ab");
    CHECK(elapsed >= std::chrono::milliseconds(20));
}

TEST("delay - zero wait and void functions")
{
    int calls = 0;
    tc::delay([&] { ++calls; }, std::chrono::milliseconds(0));
    CHECK(calls == 1);
}
