#pragma once

#include <snow-core/fwd.hh>
#include <snow-core/utility.hh>

#include <cstring>

// Helpers for containers that manage object lifetime inside raw storage themselves.
// All functions work on half-open ranges and advance a T*& "end" cursor one object at a time,
// so that on exception [start, end) still describes exactly the constructed objects.

namespace sk::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges and nullptr are valid and result in a no-op.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs count objects from a single value at *dest_end.
/// Assumes [dest_end, dest_end + count) is uninitialized memory.
/// If a copy throws, dest_end points to the slot that threw.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (sk::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end) at *dest_end.
/// Assumes the destination is uninitialized memory.
/// Trivially copyable types are copied with memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (sk::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace sk::impl
