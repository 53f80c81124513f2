#pragma once

// Included by every container header, so it stays free of <string>, <functional> and friends.
#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
//   OC_ASSERT(cond, "msg")          checked iff OC_ASSERT_ENABLED (see macros.hh)
//   OC_ASSERT_ALWAYS(cond, "msg")   checked in every build
//
// `msg` must be a string literal.
//
// A failed assertion
//   1. builds an oc::impl::assertion_info (stringified cond, msg, call site),
//   2. hands it to the innermost handler from assert-handler.hh, or prints it to stderr if there is none,
//   3. raises SIGTRAP / __debugbreak if a debugger is attached,
//   4. aborts.
// A handler that throws skips 3 and 4. Tests use that to observe assertions.
//
// Assertions guard caller contracts: indices in range, value() on an engaged optional,
// no cursor use after its ordered_map was modified.
// Expected outcomes such as a missing key are never assertions, they are oc::optional or nullptr results.
//
// Usage:
//   OC_ASSERT(0 <= i && i < size(), "index out of bounds");
//   OC_ASSERT_ALWAYS(p != nullptr, "system allocation failed");

#define OC_ASSERT(cond, msg) OC_IMPL_ASSERT(cond, msg)
#define OC_ASSERT_ALWAYS(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)

// Breaks into an attached debugger, no-op otherwise.
#define OC_DEBUG_BREAK() OC_IMPL_DEBUG_BREAK()

// Final step of a failed assertion.
#define OC_BREAK_AND_ABORT() (OC_DEBUG_BREAK(), ::oc::impl::perform_abort())

namespace oc::impl
{
// Routes a failure to the current handler. Returns normally unless the handler throws.
OC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, oc::source_location location);

[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace oc::impl

// ---------------------------------------------------------------------------------------------------------
// implementation
// ---------------------------------------------------------------------------------------------------------

// the break has to be expanded at the call site, otherwise the debugger stops inside assert.cc
#if defined(OC_COMPILER_MSVC)
#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// declared by hand to keep <csignal> out of the headers, 5 is SIGTRAP on every POSIX system we target
extern "C" int raise(int) noexcept;
#define OC_IMPL_DEBUG_BREAK() (::oc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

#define OC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::oc::impl::handle_assert_failure(#cond, msg, ::oc::source_location::current()); \
            OC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if OC_ASSERT_ENABLED
#define OC_IMPL_ASSERT(cond, msg) OC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
// disabled, but cond and msg are still type-checked
#define OC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        OC_UNUSED(cond);          \
        OC_UNUSED(msg);           \
    } while (false)
#endif
