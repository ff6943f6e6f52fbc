#include <tool-core/assert-handler.hh>
#include <tool-core/once.hh>

#include <nexus/test.hh>

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{
struct load_failure : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

int forty_two() { return 42; }
} // namespace

TEST("once - invokes its function at most once")
{
    SECTION("cached result")
    {
        int calls = 0;
        auto init = tc::once(
            [&]
            {
                ++calls;
                return 42;
            });

        CHECK(!init.is_fired());
        CHECK(init() == 42);
        CHECK(init.is_fired());
        CHECK(init() == 42);
        CHECK(init() == 42);
        CHECK(calls == 1);
    }

    SECTION("result is stable even if the captured state changes")
    {
        int counter = 10;
        auto snapshot = tc::once([&] { return counter; });

        CHECK(snapshot() == 10);
        counter = 20;
        CHECK(snapshot() == 10);
    }

    SECTION("non-trivial result type")
    {
        int calls = 0;
        auto greeting = tc::once(
            [&]
            {
                ++calls;
                return std::string("hello");
            });

        CHECK(greeting() == "hello");
        CHECK(greeting() == "hello");
        CHECK(calls == 1);
    }

    SECTION("function pointer")
    {
        auto answer = tc::once(&forty_two);
        CHECK(answer() == 42);
        CHECK(answer() == 42);
    }
}

TEST("once - functions without result")
{
    int calls = 0;
    auto setup = tc::once([&] { ++calls; });

    setup();
    setup();
    setup();

    CHECK(calls == 1);
    CHECK(setup.is_fired());
}

TEST("once - every wrapper has its own state")
{
    int calls = 0;
    auto const count = [&]
    {
        ++calls;
        return calls;
    };

    auto a = tc::once(count);
    auto b = tc::once(count);

    CHECK(a() == 1);
    CHECK(b() == 2);
    CHECK(a() == 1);
    CHECK(b() == 2);
    CHECK(calls == 2);
}

TEST("once - a throwing function leaves the wrapper armed")
{
    int calls = 0;
    auto flaky = tc::once(
        [&]
        {
            ++calls;
            if (calls == 1)
                throw load_failure("first attempt fails");
            return calls;
        });

    bool caught = false;
    try
    {
        (void)flaky();
    }
    catch (load_failure const&)
    {
        caught = true;
    }

    CHECK(caught);
    CHECK(!flaky.is_fired());

    CHECK(flaky() == 2);
    CHECK(flaky() == 2);
    CHECK(calls == 2);
    CHECK(flaky.is_fired());
}

TEST("once - concurrent callers observe a single invocation")
{
    std::atomic<int> calls = 0;
    auto init = tc::once(
        [&]
        {
            ++calls;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return 7;
        });

    int const thread_count = 8;
    std::vector<int> results(thread_count, 0);
    std::vector<std::thread> threads;
    for (auto i = 0; i < thread_count; ++i)
        threads.emplace_back([&, i] { results[i] = init(); });
    for (auto& t : threads)
        t.join();

    CHECK(calls.load() == 1);
    for (auto r : results)
        CHECK(r == 7);
}

TEST("once - move transfers the state")
{
    int calls = 0;
    auto a = tc::once(
        [&]
        {
            ++calls;
            return 3;
        });
    CHECK(a() == 3);

    auto b = tc::move(a);
    CHECK(!a.is_valid()); // NOLINT(bugprone-use-after-move)
    CHECK(b.is_valid());
    CHECK(b.is_fired());
    CHECK(b() == 3);
    CHECK(calls == 1);
}

#if TC_ASSERT_ENABLED
TEST("once - wrapping a null function is a contract violation")
{
    bool violated = false;
    {
        auto handler = tc::impl::scoped_assertion_handler([&](tc::impl::assertion_info const&) { throw 0; });
        try
        {
            int (*fn)() = nullptr;
            (void)tc::once(fn);
        }
        catch (int)
        {
            violated = true;
        }
    }
    CHECK(violated);
}

TEST("once - calling the wrapper from inside its own function is a contract violation")
{
    int violations = 0;
    auto handler = tc::impl::scoped_assertion_handler(
        [&](tc::impl::assertion_info const&)
        {
            ++violations;
            throw 0;
        });

    bool recurse = true;
    std::function<int()> body;
    auto init = tc::once([&] { return body(); });
    body = [&]
    {
        if (recurse)
        {
            recurse = false;
            return init() + 1;
        }
        return 5;
    };

    bool caught = false;
    try
    {
        (void)init();
    }
    catch (int)
    {
        caught = true;
    }

    CHECK(caught);
    CHECK(violations == 1);
    CHECK(!init.is_fired());

    // the failed attempt released the wrapper, other calls proceed normally
    CHECK(init() == 5);
    CHECK(init.is_fired());
}
#endif
