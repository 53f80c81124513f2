#pragma once

#include <ordered-core/assert-handler.hh>
#include <ordered-core/assert.hh>

#include <string>

namespace oc_test
{
// Runs f with a throwing assertion handler installed.
// Returns the message of the first failed assertion, or an empty string if nothing fired.
template <class F>
std::string capture_assertion(F&& f)
{
    std::string message;
    auto handler = oc::impl::scoped_assertion_handler(
        [&](oc::impl::assertion_info const& info)
        {
            message = info.message;
            throw 0; // unwind instead of aborting
        });

    try
    {
        f();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    return message;
}

template <class F>
bool asserts(F&& f)
{
    return !capture_assertion(static_cast<F&&>(f)).empty();
}
} // namespace oc_test
