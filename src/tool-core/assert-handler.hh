#pragma once

#include <tool-core/macros.hh>

#include <functional>
#include <source_location>
#include <string>
#include <thread>

// Assertion handlers decide what happens when a TC_ASSERT fails.
//
// Every thread owns its own handler stack. once_function and memoized_function are called
// from many threads at once and assert on each call, so a handler installed on one thread
// never sees (or races with) failures raised on another. A thread with an empty stack uses
// the default report to std::cerr.
//
// A handler may throw to unwind the failing call; otherwise the program aborts after it returns.
//
//   auto handler = tc::impl::scoped_assertion_handler([](tc::impl::assertion_info const& info) {
//       throw contract_violation(info.message);
//   });
//   auto head = tc::first(values, count); // a negative count now throws instead of aborting

namespace tc::impl
{
/// Everything known about a failed assertion
struct assertion_info
{
    std::string expression;
    std::string message;
    std::source_location location;
    std::thread::id thread;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Installs handler on top of the calling thread's stack
void push_assertion_handler(assertion_handler handler);

/// Removes the top handler of the calling thread's stack, no-op if it is empty
void pop_assertion_handler();

/// Number of handlers installed on the calling thread
[[nodiscard]] int assertion_handler_count();

/// Installs a handler for the lifetime of this object (calling thread only)
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace tc::impl
