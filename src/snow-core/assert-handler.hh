#pragma once

#include <snow-core/macros.hh>
#include <snow-core/source_location.hh>

#include <functional>
#include <string>

namespace sk::impl
{
// Customizable assertion handler stack
// NOTE: the stack is global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = sk::impl::scoped_assertion_handler([](sk::impl::assertion_info const& info) {
//           report(info);
//           throw contract_violation{info.message};
//       });
//
//       // assertions in this scope go through the custom handler
//       auto buffer = sk::ringbuffer<int>(capacity_from_somewhere);
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    sk::source_location location;
};

// Push a handler that receives all assertion failures until it is popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler; no-op if the stack is empty
void pop_assertion_handler();

// RAII push/pop of an assertion handler
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace sk::impl
