#pragma once

#include <cstddef>
#include <cstdint>


namespace tc
{

//
// Primitives
//

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

// floating point
using f32 = float;
using f64 = double;

// signed size type
// Sizes and indices are signed so that "size - 1" and "-1 means not found" behave like integers.
// Containers hand out size_t, so we convert once at the boundary (see tc::ssize).
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Values
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct nested;

//
// Synchronization
//

template <class T>
struct mutex;

//
// Function wrappers
//

template <class F>
struct once_function;

template <class Key, class F>
struct memoized_function;

} // namespace tc
