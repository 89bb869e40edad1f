#pragma once

#include <assoc-core/assertf.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/impl/object_lifetime_util.hh>
#include <assoc-core/span.hh>
#include <assoc-core/utility.hh>

#include <concepts>
#include <initializer_list>
#include <new>


/// Dynamically allocated vector of T elements with value semantics.
/// Storage for the entries of ac::assoc_dict and the result type of keys() / to_list().
///
/// Layout is the classic (start, end, capacity end) triple:
/// - [_start, _end) is the live object range
/// - [_end, _cap_end) is uninitialized capacity
///
/// Any reallocation invalidates pointers, references, and iterators.
/// Reallocation always uses move construction. Constructing from an existing element
/// (e.g. `v.push_back(v[0])`) is safe during growth because the new element is constructed
/// before the old elements are moved.
template <class T>
struct ac::vector
{
    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        AC_ASSERTF(0 <= i && i < size(), "index {} out of bounds (size: {})", i, size());
        return _start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        AC_ASSERTF(0 <= i && i < size(), "index {} out of bounds (size: {})", i, size());
        return _start[i];
    }

    /// May be nullptr if the vector never allocated.
    [[nodiscard]] constexpr T* data() { return _start; }
    [[nodiscard]] constexpr T const* data() const { return _start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _start; }
    [[nodiscard]] constexpr T* end() { return _end; }
    [[nodiscard]] constexpr T const* begin() const { return _start; }
    [[nodiscard]] constexpr T const* end() const { return _end; }

    // queries
public:
    // nullptr - nullptr == 0, so the default state is well-defined
    [[nodiscard]] constexpr isize size() const { return _end - _start; }
    [[nodiscard]] constexpr bool empty() const { return _start == _end; }
    [[nodiscard]] constexpr isize capacity() const { return _cap_end - _start; }

    // factories
public:
    /// Empty vector that can take at least `capacity` elements without reallocation.
    [[nodiscard]] static vector create_with_capacity(isize capacity)
    {
        AC_ASSERT(capacity >= 0, "capacity must be non-negative");
        vector v;
        v.reallocate_to(capacity);
        return v;
    }

    // modifiers
public:
    /// Constructs a new element at the back, reallocating if necessary.
    /// Amortized O(1).
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(requires { T(ac::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                                   "the provided argument types");

        if (_end != _cap_end) [[likely]]
        {
            auto const p = new (ac::placement_new, _end) T(ac::forward<Args>(args)...);
            ++_end; // _after_ so exceptions in T(...) leave state valid
            return *p;
        }

        return emplace_back_grow(ac::forward<Args>(args)...);
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(ac::move(value)); }

    /// Removes the element at idx, keeping the relative order of the others.
    /// Precondition: 0 <= idx < size().
    /// O(n) due to compaction.
    void remove_at(isize idx)
    {
        AC_ASSERTF(0 <= idx && idx < size(), "index {} out of bounds (size: {})", idx, size());
        auto const p_obj = _start + idx;
        impl::compact_move_objects_backward(p_obj, p_obj + 1, _end);
        --_end;
        _end->~T();
    }

    /// Ensures capacity() >= new_capacity.
    void reserve(isize new_capacity)
    {
        if (new_capacity > capacity())
            reallocate_to(new_capacity);
    }

    // equality
public:
    /// Element-wise, order-sensitive comparison.
    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& a, T const& b) {
            { a == b } -> std::convertible_to<bool>;
        }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs._start[i] == rhs._start[i]))
                return false;
        return true;
    }

    // lifetime
public:
    vector() = default;

    vector(std::initializer_list<T> init)
    {
        auto block = impl::object_block<T>(static_cast<isize>(init.size()));
        impl::copy_create_objects_to(block.end, init.begin(), init.end());
        adopt(block);
    }

    ~vector() { release(); }

    vector(vector&& rhs) noexcept
      : _start(ac::exchange(rhs._start, nullptr)),
        _end(ac::exchange(rhs._end, nullptr)),
        _cap_end(ac::exchange(rhs._cap_end, nullptr))
    {
    }
    vector& operator=(vector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            _start = ac::exchange(rhs._start, nullptr);
            _end = ac::exchange(rhs._end, nullptr);
            _cap_end = ac::exchange(rhs._cap_end, nullptr);
        }
        return *this;
    }

    // deep copy, capacity is trimmed to size
    vector(vector const& rhs)
    {
        auto block = impl::object_block<T>(rhs.size());
        impl::copy_create_objects_to(block.end, rhs._start, rhs._end);
        adopt(block);
    }
    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
        {
            auto copy = vector(rhs);
            *this = ac::move(copy);
        }
        return *this;
    }

private:
    void release()
    {
        // hand the current storage to a block, its destructor does the cleanup
        auto old = impl::object_block<T>();
        old.start = _start;
        old.end = _end;
        old.capacity = capacity();
        _start = _end = _cap_end = nullptr;
    }

    // takes over a fully constructed block, the previous storage is released
    void adopt(impl::object_block<T>& block)
    {
        release();
        _start = block.start;
        _end = block.end;
        _cap_end = block.cap_end();
        block.release();
    }

    // moves the live range into a fresh block of exactly new_capacity slots
    void reallocate_to(isize new_capacity)
    {
        AC_ASSERT(new_capacity >= size(), "cannot shrink below the live range");
        auto block = impl::object_block<T>(new_capacity);
        impl::move_create_objects_to(block.end, _start, _end);
        adopt(block);
    }

    // slow path of emplace_back: doubles capacity
    template <class... Args>
    AC_COLD_FUNC T& emplace_back_grow(Args&&... args)
    {
        auto const old_size = size();
        auto block = impl::object_block<T>(ac::max(old_size * 2, isize(4)));

        // construct the new element first, args may reference our own elements
        auto const p = new (ac::placement_new, block.start + old_size) T(ac::forward<Args>(args)...);

        // p lies outside the block's live range until the old elements are in place
        try
        {
            impl::move_create_objects_to(block.end, _start, _end);
        }
        catch (...)
        {
            p->~T();
            throw;
        }
        ++block.end;

        adopt(block);
        return *p;
    }

    T* _start = nullptr;
    T* _end = nullptr;
    T* _cap_end = nullptr;
};
