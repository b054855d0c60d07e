#pragma once

#include <cstddef>
#include <cstdint>


namespace sk
{

//
// Primitives
//

// Explicitly-sized primitive types
// Use these wherever the range matters for correctness or memory layout.
// Plain "int" is fine for loop counters and small counts.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, counts and stream positions are signed:
// * "count - 1" and "write - read" must not silently wrap when a value is 0
// * mixed signed/unsigned arithmetic is a steady source of conversion bugs
// * cursor overflow is handled explicitly (see ringbuffer), so the extra unsigned range buys nothing
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class CursorT = isize>
struct ringbuffer;

//
// Concurrency
//

template <class T>
struct mutex;

struct work_queue;

} // namespace sk
