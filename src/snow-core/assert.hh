#pragma once

// Lean header with minimal dependencies, safe to include from every container header.
#include <snow-core/macros.hh>
#include <snow-core/source_location.hh>

// =========================================================================================================
// SK_ASSERT - Runtime assertion with string literal message
//
// Validates a condition and, on failure, reports through the active assertion handler,
// breaks into an attached debugger and aborts.
//
// Active when SK_ASSERT_ENABLED is 1 (debug and release-with-debug-info builds,
// or release builds configured with SK_ENABLE_ASSERT_IN_RELEASE).
//
// Assertions guard PRECONDITIONS and INVARIANTS, i.e. programmer errors:
//   - a ringbuffer constructed with a capacity <= 0
//   - reading the value of an empty optional
//   - cursor arithmetic that left read > write
//
// They are NOT for expected outcomes. A full ringbuffer rejecting put(), or an empty one
// returning nullopt from get(), is reported through the return value.
//
// Error handling strategy:
//   - Assertions          -> programmer errors, violated invariants/preconditions
//   - bool / optional<T>  -> expected, recoverable outcomes
//   - Exceptions          -> failures carried across threads (work_queue::sync)
//
// Usage:
//   SK_ASSERT(ptr != nullptr, "pointer must not be null");
//   SK_ASSERT(_read <= _write, "read cursor overtook write cursor");
//
#define SK_ASSERT(cond, msg) SK_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SK_ASSERT_ALWAYS - Always-active assertion
//
// Like SK_ASSERT but stays active in all build configurations.
// Used for construction-time contracts that must never be silently ignored.
//
// Usage:
//   SK_ASSERT_ALWAYS(capacity > 0, "ringbuffer capacity must be positive");
//
#define SK_ASSERT_ALWAYS(cond, msg) SK_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// SK_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define SK_DEBUG_BREAK() SK_IMPL_DEBUG_BREAK()

// =========================================================================================================
// SK_BREAK_AND_ABORT - Debug break followed by program termination
//
#define SK_BREAK_AND_ABORT() (SK_DEBUG_BREAK(), ::sk::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sk::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler, or prints to stderr if none is installed
// Note: does not abort, caller must follow with SK_BREAK_AND_ABORT()
SK_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, sk::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sk::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef SK_COMPILER_MSVC

#define SK_IMPL_DEBUG_BREAK() (::sk::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SK_COMPILER_POSIX)

// raise(SIGTRAP) instead of __builtin_trap() so an attached debugger can continue
// NOTE: SIGTRAP is 5, declared here to avoid pulling a posix header into every container
extern "C" int raise(int) noexcept;
#define SK_IMPL_DEBUG_BREAK() (::sk::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SK_IMPL_DEBUG_BREAK() void(0)

#endif

#define SK_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::sk::impl::handle_assert_failure(#cond, msg, ::sk::source_location::current()); \
            SK_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if SK_ASSERT_ENABLED

#define SK_IMPL_ASSERT(cond, msg) SK_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define SK_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SK_UNUSED(cond);          \
        SK_UNUSED(msg);           \
    } while (false)

#endif
