#include <tool-core/assert-handler.hh>
#include <tool-core/assert.hh>
#include <tool-core/collection.hh>
#include <tool-core/delay.hh>
#include <tool-core/memoize.hh>
#include <tool-core/nested.hh>
#include <tool-core/optional.hh>

#include <nexus/test.hh>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace
{
// runs f and reports whether it raised an assertion (observed through a throwing handler)
template <class F>
bool raises_violation(F&& f, std::vector<tc::impl::assertion_info>& reports)
{
    auto handler = tc::impl::scoped_assertion_handler(
        [&](tc::impl::assertion_info const& info)
        {
            reports.push_back(info);
            throw 0;
        });

    try
    {
        f();
    }
    catch (int)
    {
        return true;
    }
    return false;
}
} // namespace

TEST("assertions - report carries expression, message, location and thread")
{
    std::vector<tc::impl::assertion_info> reports;
    int const line = __LINE__ + 1;
    CHECK(raises_violation([] { TC_ASSERT_ALWAYS(1 > 2, "ordering is broken"); }, reports));

    REQUIRE(reports.size() == 1);
    CHECK(reports[0].expression.find("1 > 2") != std::string::npos);
    CHECK(reports[0].message == "ordering is broken");
    CHECK(std::string(reports[0].location.file_name()).ends_with("assert-test.cc"));
    CHECK(int(reports[0].location.line()) == line);
    CHECK(reports[0].thread == std::this_thread::get_id());
}

TEST("assertions - passing checks and the handler count")
{
    std::vector<tc::impl::assertion_info> reports;
    CHECK(!raises_violation([] { TC_ASSERT_ALWAYS(true, "holds"); }, reports));
    CHECK(reports.empty());

    CHECK(tc::impl::assertion_handler_count() == 0);
    {
        auto outer = tc::impl::scoped_assertion_handler([](tc::impl::assertion_info const&) { throw 0; });
        auto inner = tc::impl::scoped_assertion_handler([](tc::impl::assertion_info const&) { throw 1; });
        CHECK(tc::impl::assertion_handler_count() == 2);

        int thrown = -1;
        try
        {
            TC_ASSERT_ALWAYS(false, "innermost handler wins");
        }
        catch (int v)
        {
            thrown = v;
        }
        CHECK(thrown == 1);
    }
    CHECK(tc::impl::assertion_handler_count() == 0);
}

TEST("assertions - handler stacks are per thread")
{
    int main_thread_reports = 0;
    auto handler = tc::impl::scoped_assertion_handler(
        [&](tc::impl::assertion_info const&)
        {
            ++main_thread_reports;
            throw 0;
        });

    std::vector<tc::impl::assertion_info> worker_reports;
    bool worker_saw_no_handlers = false;
    bool worker_violated = false;
    std::thread worker(
        [&]
        {
            worker_saw_no_handlers = tc::impl::assertion_handler_count() == 0;
            worker_violated = raises_violation([] { TC_ASSERT_ALWAYS(false, "raised on the worker"); }, worker_reports);
        });
    worker.join();

    CHECK(worker_saw_no_handlers);
    CHECK(worker_violated);
    REQUIRE(worker_reports.size() == 1);
    CHECK(worker_reports[0].message == "raised on the worker");
    CHECK(worker_reports[0].thread != std::this_thread::get_id());
    CHECK(main_thread_reports == 0);
    CHECK(tc::impl::assertion_handler_count() == 1);
}

#if TC_ASSERT_ENABLED
TEST("assertions - contract violations of the combinators")
{
    std::vector<tc::impl::assertion_info> reports;

    SECTION("negative element counts")
    {
        std::vector<int> const v = {1, 2};
        CHECK(raises_violation([&] { (void)tc::first(v, -1); }, reports));
        CHECK(raises_violation([&] { (void)tc::last(v, -1); }, reports));
        REQUIRE(reports.size() == 2);
        CHECK(std::string(reports[0].location.file_name()).ends_with("collection.hh"));
        CHECK(reports[0].message == "first: element count must be non-negative");
    }

    SECTION("reading an empty optional")
    {
        auto const opt = tc::optional<int>{};
        CHECK(raises_violation([&] { (void)opt.value(); }, reports));
    }

    SECTION("wrong kind of nested node")
    {
        auto const leaf = tc::nested<int>(1);
        auto const list = tc::nested<int>{1, 2};
        CHECK(raises_violation([&] { (void)leaf.children(); }, reports));
        CHECK(raises_violation([&] { (void)list.value(); }, reports));
        CHECK(raises_violation([&] { tc::nested<int>(1).push_back(2); }, reports));
    }

    SECTION("negative delay")
    {
        int calls = 0;
        CHECK(raises_violation([&] { tc::delay([&] { ++calls; }, std::chrono::milliseconds(-5)); }, reports));
        CHECK(calls == 0);
    }

    SECTION("moved-from wrappers")
    {
        auto m = tc::memoize([](int n) { return n; });
        auto other = tc::move(m);
        CHECK(other(1) == 1);
        CHECK(raises_violation([&] { (void)m(1); }, reports)); // NOLINT(bugprone-use-after-move)
    }

    SECTION("violations on worker threads reach the worker's handler")
    {
        auto m = tc::memoize([](int n) { return n * 2; });
        auto moved = tc::move(m);

        bool violated = false;
        std::thread worker([&] { violated = raises_violation([&] { (void)m(3); }, reports); }); // NOLINT
        worker.join();

        CHECK(violated);
        CHECK(moved(3) == 6);
    }
}
#endif
