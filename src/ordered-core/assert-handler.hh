#pragma once

#include <ordered-core/source_location.hh>

#include <functional>
#include <string>

// Replaceable reaction to failed OC_ASSERT / OC_ASSERT_ALWAYS.
//
// Handlers live on a process-global stack, the innermost one receives every failure.
// Installation is not synchronized: push and pop from one thread, typically test setup.
//
// A handler that returns lets the program abort as usual.
// A handler that throws unwinds out of the failed assertion instead:
//
//   {
//       auto guard = oc::impl::scoped_assertion_handler([](oc::impl::assertion_info const& info) {
//           throw contract_violation{info.message};
//       });
//       auto it = m.iter();
//       m.insert(k, v);
//       it.next(); // throws contract_violation
//   }

namespace oc::impl
{
/// Everything known about one failed assertion.
struct assertion_info
{
    std::string expression; ///< condition as written in the source
    std::string message;
    oc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// Removes the innermost handler. Does nothing if none is installed.
void pop_assertion_handler();

[[nodiscard]] int assertion_handler_count();

/// Installs a handler for the lifetime of this object.
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace oc::impl
