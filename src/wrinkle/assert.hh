#pragma once

// Lean header with minimal dependencies, safe to include from every container header.
// For formatted messages use <wrinkle/assertf.hh>.
#include <wrinkle/macros.hh>

#include <source_location>

namespace wr
{
using source_location = std::source_location;
}

// =========================================================================================================
// WR_ASSERT - Runtime assertion with string literal message
//
// Validates a condition and, on failure, reports through the assertion handler stack
// (see <wrinkle/assert-handler.hh>), breaks into an attached debugger and aborts.
//
// Error handling strategy in this library:
//   - Assertions         -> bugs inside the library: corrupted links, invalid node ids,
//                           broken wrinkle ordering
//   - wr::sequence_error -> caller contract violations: bad indices, stale or exhausted cursors
//
// Assertions are active in WR_DEBUG and WR_RELWITHDEBINFO builds and in WR_RELEASE builds
// only with WR_ENABLE_ASSERT_IN_RELEASE.
// NEVER assert on caller input: that is what wr::sequence_error is for.
//
// Usage:
//   WR_ASSERT(id != node_id::none, "dereferencing the empty node marker");
//
#define WR_ASSERT(cond, msg) WR_IMPL_ASSERT(cond, msg)

// WR_ASSERT_ALWAYS - like WR_ASSERT but active in all build configurations
#define WR_ASSERT_ALWAYS(cond, msg) WR_IMPL_ASSERT_ALWAYS(cond, msg)

// WR_DEBUG_BREAK - breaks into the debugger if one is attached, no-op otherwise
#define WR_DEBUG_BREAK() WR_IMPL_DEBUG_BREAK()

// WR_BREAK_AND_ABORT - debug break (if attached) followed by program termination
#define WR_BREAK_AND_ABORT() (WR_DEBUG_BREAK(), ::wr::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace wr::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr if there is none)
// Note: does not abort, caller must follow with WR_BREAK_AND_ABORT()
WR_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, wr::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace wr::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef WR_COMPILER_MSVC

#define WR_IMPL_DEBUG_BREAK() (::wr::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(WR_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// we don't want to pull in any posix header here, so we simply declare raise
extern "C" int raise(int) noexcept;
#define WR_IMPL_DEBUG_BREAK() (::wr::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define WR_IMPL_DEBUG_BREAK() void(0)

#endif

#define WR_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::wr::impl::handle_assert_failure(#cond, msg, ::wr::source_location::current()); \
            WR_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if WR_ASSERT_ENABLED

#define WR_IMPL_ASSERT(cond, msg) WR_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg must still compile
#define WR_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        WR_UNUSED(cond);          \
        WR_UNUSED(msg);           \
    } while (false)

#endif
