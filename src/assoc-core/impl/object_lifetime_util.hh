#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <cstring>
#include <new>
#include <type_traits>

// Raw storage helpers for ac::vector.
// The *_create_objects_to functions advance dest_end after every constructed object:
// if a constructor throws, [dest_start, dest_end) is exactly the range that has to be destroyed.
// object_block<T> owns such a range together with its allocation and cleans up both on unwind.

namespace ac
{
// tag for the placement new overload below, so we don't rely on <new>'s placement form being visible
struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new{};
} // namespace ac

inline void* operator new(std::size_t, ac::placement_new_tag, void* p) noexcept
{
    return p;
}
inline void operator delete(void*, ac::placement_new_tag, void*) noexcept {}

namespace ac::impl
{
// last to first, mirrors construction order
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "element type must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            std::memcpy(dest_end, src_start, count * sizeof(T));
            dest_end += count;
        }
    }
    else
    {
        for (; src_start != src_end; ++src_start, ++dest_end)
            new (ac::placement_new, dest_end) T(*src_start);
    }
}

// the sources are left moved-from, destroying them is up to the caller
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "element type must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            std::memcpy(dest_end, src_start, count * sizeof(T));
            dest_end += count;
        }
    }
    else
    {
        for (; src_start != src_end; ++src_start, ++dest_end)
            new (ac::placement_new, dest_end) T(ac::move(*src_start));
    }
}

/// Owning block of `capacity` slots of T, with the live objects in [start, end).
/// The destructor destroys the live range and frees the block,
/// so filling it with *_create_objects_to(b.end, ...) cannot leak if a constructor throws.
/// release() hands the block over to the caller (ac::vector) and leaves this one empty.
template <class T>
struct object_block
{
    T* start = nullptr;
    T* end = nullptr;
    isize capacity = 0;

    object_block() = default;
    explicit object_block(isize count) : capacity(count)
    {
        if (count > 0)
            start = static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t(alignof(T))));
        end = start;
    }

    object_block(object_block const&) = delete;
    object_block& operator=(object_block const&) = delete;

    ~object_block()
    {
        destroy_objects_in_reverse(start, end);
        if (start != nullptr)
            ::operator delete(start, capacity * sizeof(T), std::align_val_t(alignof(T)));
    }

    [[nodiscard]] T* cap_end() const { return start + capacity; }

    void release()
    {
        start = end = nullptr;
        capacity = 0;
    }
};

// move-assigns [src_start, src_end) down to dest, used to close the gap of an erased element
// every slot in [dest, src_end) must hold a live object, the vacated tail stays alive (moved-from)
template <class T>
constexpr void compact_move_objects_backward(T* dest, T* src_start, T* src_end)
{
    static_assert(std::is_move_assignable_v<T>, "element type must be move assignable");

    for (; src_start != src_end; ++src_start, ++dest)
        *dest = ac::move(*src_start);
}
} // namespace ac::impl
