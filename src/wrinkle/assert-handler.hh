#pragma once

#include <wrinkle/assert.hh>

#include <functional>
#include <string>

namespace wr::impl
{
// Customizable assertion handler stack
// NOTE: handlers are global state and must be externally synchronized
//
// Usage:
//   {
//       auto handler = wr::impl::scoped_assertion_handler([](wr::impl::assertion_info const& info) {
//           std::cerr << info.message << '\n';
//           throw recovery_point{};
//       });
//
//       chain.value(node_id::none); // asserts, handler throws
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    wr::source_location location;
};

// Push a handler that is called for all assertion failures until it is popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler
// prefer scoped_assertion_handler, which also pops when a handler throws
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace wr::impl
