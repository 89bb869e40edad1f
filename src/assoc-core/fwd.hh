#pragma once

#include <cstddef>
#include <cstdint>

// Forward declarations and primitive aliases of assoc-core.
// Include this instead of the full headers when only the names are needed.

namespace ac
{
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using byte = std::byte;

// sizes and indices are signed:
// reverse loops like `for (auto i = size() - 1; i >= 0; --i)` are correct on empty containers
using isize = i64;

using nullptr_t = std::nullptr_t;

// support types
template <class Signature>
struct function_ref;
template <class T>
struct span;
template <class T, class U>
struct pair;
struct unit;
template <class T>
struct vector;

// structural equality capability, see <assoc-core/equality.hh>
template <class T>
struct equality_traits;

// association-list containers
template <class K, class V>
struct assoc_dict;
template <class K>
struct assoc_set;
} // namespace ac
