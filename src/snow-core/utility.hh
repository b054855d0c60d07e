#pragma once

#include <snow-core/assert.hh>
#include <snow-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Callables:
//   invoke(f, args...)          - call f with args (plain callables, no member pointers)
//
// Object lifetime:
//   placement_new               - tag for header-light placement new: new (sk::placement_new, ptr) T(...)
//   storage_for<T>              - uninitialized, properly aligned storage for a single T
//
// Scope utilities:
//   SK_DEFER { code }           - execute code at scope-exit
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace sk
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   buffer.put(sk::move(obj));
template <class T>
[[nodiscard]] constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Usage:
///   template <class... Args>
///   bool emplace_put(Args&&... args) { ... T(sk::forward<Args>(args)...) ... }
template <class T>
[[nodiscard]] constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto old_write = sk::exchange(_write, 0);
template <class T, class U = T>
constexpr T exchange(T& obj, U&& new_val)
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Callables
// =========================================================================================================

/// Invokes a callable with the given arguments, preserving value categories
/// Restricted to plain callables (functions, lambdas, function objects)
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return forward<F>(f)(forward<Args>(args)...);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the header-free placement new below
struct placement_new_t
{
};
constexpr placement_new_t placement_new{};

namespace impl
{
template <class T, bool = std::is_trivially_destructible_v<T>>
union storage_for_t
{
    constexpr storage_for_t() {}
    T value;
};

template <class T>
union storage_for_t<T, false>
{
    constexpr storage_for_t() {}
    ~storage_for_t() {}
    T value;
};
} // namespace impl

/// Uninitialized storage with size and alignment of T
/// The lifetime of .value is managed manually (placement new + explicit destructor call)
/// Trivially destructible when T is
template <class T>
using storage_for = impl::storage_for_t<T>;

// =========================================================================================================
// Scope utilities
// =========================================================================================================

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(sk::forward<F>(f));
}
} // namespace impl

/// Execute code at scope-exit (RAII-style cleanup)
/// Captures by reference - be careful with lifetime
/// Usage:
///   state.running += 1;
///   SK_DEFER { state.running -= 1; };
#define SK_DEFER auto const SK_MACRO_JOIN(_sk_deferred_, __COUNTER__) = ::sk::impl::deferred_tag{} + [&]

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Used for ranges whose end is a state rather than a position (e.g. "buffer drained")
struct sentinel
{
};

} // namespace sk

/// Placement new without including <new>
inline void* operator new(decltype(sizeof(0)), sk::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, sk::placement_new_t, void*) noexcept {}
