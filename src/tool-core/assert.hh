#pragma once

// Lean header with minimal dependencies, included by every other tool-core header.
#include <tool-core/macros.hh>

#include <source_location>

// =========================================================================================================
// TC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// Active in debug and release-with-debug-info builds (see TC_ASSERT_ENABLED in macros.hh).
//
// What assertions are for:
//   Caller contract violations: preconditions of the combinators and their wrappers,
//   e.g. a negative element count, reading an absent optional, calling an empty wrapper.
//
// What assertions are NOT for:
//   - NOT for failures of caller-supplied functions (those propagate as exceptions, untouched)
//   - NOT for expected absence (use tc::optional or the -1 sentinel of index_of)
//
// Usage:
//   TC_ASSERT(n >= 0, "element count must be non-negative");
//   TC_ASSERT(is_leaf(), "value() requires a leaf node");
//
#define TC_ASSERT(cond, msg) TC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// TC_ASSERT_ALWAYS - Always-active assertion
//
// Like TC_ASSERT but remains active in all build configurations, including release builds.
//
#define TC_ASSERT_ALWAYS(cond, msg) TC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// TC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define TC_DEBUG_BREAK() TC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// TC_BREAK_AND_ABORT - Debug break followed by program termination
//
#define TC_BREAK_AND_ABORT() (TC_DEBUG_BREAK(), ::tc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace tc::impl
{
// Called when an assertion fails
// Forwards to the topmost assertion handler of the calling thread or prints diagnostic information to stderr
// Note: does not abort, caller must follow with TC_BREAK_AND_ABORT()
TC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, std::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace tc::impl

#ifdef TC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define TC_IMPL_DEBUG_BREAK() (::tc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(TC_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here so that no posix header leaks into every translation unit
extern "C" int raise(int) noexcept;
#define TC_IMPL_DEBUG_BREAK() (::tc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define TC_IMPL_DEBUG_BREAK() void(0)

#endif

#define TC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::tc::impl::handle_assert_failure(#cond, msg, std::source_location::current()); \
            TC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if TC_ASSERT_ENABLED

#define TC_IMPL_ASSERT(cond, msg) TC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define TC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        TC_UNUSED(cond);          \
        TC_UNUSED(msg);           \
    } while (false)

#endif
