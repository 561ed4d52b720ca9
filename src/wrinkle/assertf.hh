#pragma once

#include <wrinkle/assert.hh>

#include <format>

// =========================================================================================================
// WR_ASSERTF - Runtime assertion with std::format message
//
// Same semantics as WR_ASSERT (see <wrinkle/assert.hh>), but the message is a format string
// with arguments. Arguments are only evaluated when the assertion fails.
//
// Usage:
//   WR_ASSERTF(count == _size, "chain holds {} nodes but size is {}", count, _size);
//
#define WR_ASSERTF(cond, msg, ...) WR_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// WR_ASSERTF_ALWAYS - like WR_ASSERTF but active in all build configurations
#define WR_ASSERTF_ALWAYS(cond, msg, ...) WR_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define WR_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::wr::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::wr::source_location::current());                          \
            WR_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if WR_ASSERT_ENABLED

#define WR_IMPL_ASSERTF(cond, msg, ...) WR_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

#define WR_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        WR_UNUSED(cond);                                        \
        WR_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
