#pragma once

#include <snow-core/assert.hh>
#include <snow-core/fwd.hh>
#include <snow-core/impl/object_lifetime_util.hh>
#include <snow-core/optional.hh>
#include <snow-core/utility.hh>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <limits>
#include <new>
#include <type_traits>

namespace sk
{
/// A queue with a fixed capacity that can be written to.
/// put() only succeeds while is_full() is false; nothing unread is ever dropped.
template <class Q>
concept fixed_write_queue = requires(Q& q, typename Q::value_type v) {
    { q.put(static_cast<typename Q::value_type&&>(v)) } -> std::convertible_to<bool>;
    { q.is_full() } -> std::convertible_to<bool>;
};

/// A queue with a fixed capacity that can be read from.
/// get() returns nullopt exactly when is_empty() is true.
template <class Q>
concept fixed_read_queue = requires(Q& q) {
    { q.get() } -> std::same_as<sk::optional<typename Q::value_type>>;
    { q.is_empty() } -> std::convertible_to<bool>;
};

template <class Q>
concept fixed_read_write_queue = fixed_write_queue<Q> && fixed_read_queue<Q>;
} // namespace sk

/// Bounded FIFO of T with independent read and write cursors and single-step rewind.
///
/// The cursors are absolute stream positions: the n-th element ever put has position n.
/// Storage is indexed by (position % capacity), so a read element stays physically present
/// until a later put() lands on its slot. That is what makes rewind() O(1): it simply moves
/// the read cursor back by one, as long as the slot it moves onto has not been overwritten.
///
/// Invariants:
///   0 <= read <= write
///   count() == write - read <= capacity()
///   storage holds min(capacity, elements ever put since the last discard) live objects
///   (all capacity slots are alive from the start if constructed with a fill value)
///
/// Cursor overflow:
///   Cursors only grow, so a long-lived buffer eventually hits the limit of CursorT.
///   When put() finds write == max, both cursors are rebased to
///     read'  = capacity + read % capacity
///     write' = read' + count
///   which keeps count(), the storage slot of every position and the rewind range intact.
///   read' stays >= capacity so rewinding right after a rebase still works.
///   CursorT is a template parameter so the rebase is reachable with small cursor types.
///
/// Not synchronized: use from one thread, or guard every call (e.g. with sk::mutex).
///
/// Usage:
///   auto buffer = sk::ringbuffer<int>(16);
///   if (!buffer.put(42))
///       ; // full, consumer needs to catch up
///   if (auto v = buffer.get(); v.has_value())
///       use(v.value());
///   buffer.rewind(); // un-read the 42
///   for (int v : buffer) // drains the buffer
///       use(v);
template <class T, class CursorT>
struct sk::ringbuffer
{
    static_assert(std::is_integral_v<CursorT> && std::is_signed_v<CursorT>, "cursor type must be a signed integer");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable (slots are overwritten on wrap-around)");

public:
    using value_type = T;
    using cursor_t = CursorT;

    static constexpr isize default_capacity = 1024;

    /// Largest accepted capacity for T and CursorT.
    /// After a rebase, write can be as large as 3 * capacity - 2 and must still have room to grow,
    /// hence a quarter of the cursor range. The storage block must also stay addressable.
    [[nodiscard]] static constexpr isize max_capacity() { return std::min(max_cursor_capacity(), max_storage_capacity()); }

    // construction
public:
    ringbuffer() : ringbuffer(default_capacity) {}

    /// Creates an empty buffer; storage is allocated on the first put().
    /// Precondition: 0 < capacity <= max_capacity()
    explicit ringbuffer(isize capacity) : _capacity(capacity)
    {
        SK_ASSERT_ALWAYS(capacity > 0, "ringbuffer capacity must be positive");
        SK_ASSERT_ALWAYS(capacity <= max_cursor_capacity(), "ringbuffer capacity exceeds the cursor overflow headroom");
        SK_ASSERT_ALWAYS(capacity <= max_storage_capacity(), "ringbuffer storage size exceeds the address space");
    }

    /// Creates an empty buffer whose slots are all pre-populated with fill_value.
    /// The fill values are not readable (count() == 0); they are only ever overwritten.
    ringbuffer(isize capacity, T const& fill_value) : ringbuffer(capacity)
    {
        allocate_storage();
        auto end = _data;
        SK_DEFER { _stored = end - _data; };
        impl::fill_create_objects_to(end, _capacity, fill_value);
    }

    ringbuffer(ringbuffer&& rhs) noexcept
      : _data(sk::exchange(rhs._data, nullptr)),
        _capacity(rhs._capacity),
        _stored(sk::exchange(rhs._stored, 0)),
        _write(sk::exchange(rhs._write, 0)),
        _read(sk::exchange(rhs._read, 0))
    {
    }

    ringbuffer& operator=(ringbuffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release_storage();
            _data = sk::exchange(rhs._data, nullptr);
            _capacity = rhs._capacity;
            _stored = sk::exchange(rhs._stored, 0);
            _write = sk::exchange(rhs._write, 0);
            _read = sk::exchange(rhs._read, 0);
        }
        return *this;
    }

    ringbuffer(ringbuffer const& rhs)
        requires std::is_copy_constructible_v<T>
      : ringbuffer(rhs._capacity)
    {
        if (rhs._data != nullptr)
        {
            allocate_storage();
            auto end = _data;
            SK_DEFER { _stored = end - _data; };
            impl::copy_create_objects_to(end, static_cast<T const*>(rhs._data), static_cast<T const*>(rhs._data + rhs._stored));
        }
        _write = rhs._write;
        _read = rhs._read;
    }

    ringbuffer& operator=(ringbuffer const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            *this = ringbuffer(rhs);
        return *this;
    }

    ~ringbuffer() { release_storage(); }

    // writing
public:
    /// Appends a copy of value at the write cursor.
    /// Returns false and leaves the buffer unchanged if it is full.
    [[nodiscard]] bool put(T const& value)
        requires std::is_copy_constructible_v<T>
    {
        return emplace_put(value);
    }

    /// Appends value at the write cursor.
    /// Returns false and leaves the buffer (and value) unchanged if it is full.
    [[nodiscard]] bool put(T&& value) { return emplace_put(sk::move(value)); }

    /// Constructs an element from args at the write cursor.
    /// Returns false if the buffer is full; args are not consumed in that case.
    template <class... Args>
    [[nodiscard]] bool emplace_put(Args&&... args)
    {
        SK_ASSERT(_read <= _write, "read cursor overtook write cursor");

        if (is_full())
            return false;

        if (_write == std::numeric_limits<CursorT>::max())
            rebase_cursors();

        if (_data == nullptr)
            allocate_storage();

        auto const slot = slot_of(_write);
        if (_stored == _capacity)
        {
            if constexpr (sizeof...(Args) == 1 && (std::is_same_v<std::remove_cvref_t<Args>, T> && ...))
                ((_data[slot] = sk::forward<Args>(args)), ...);
            else
                _data[slot] = T(sk::forward<Args>(args)...);
        }
        else
        {
            // storage only grows before the first wrap-around
            SK_ASSERT(slot == _stored, "ringbuffer storage grew out of order");
            new (sk::placement_new, _data + _stored) T(sk::forward<Args>(args)...);
            ++_stored;
        }

        ++_write;
        return true;
    }

    // reading
public:
    /// Returns the element at the read cursor and advances past it.
    /// Copyable T is copied out: the element stays in storage and is read again after rewind().
    /// Move-only T is moved out; such buffers cannot be rewound.
    /// Returns nullopt if the buffer is empty.
    [[nodiscard]] sk::optional<T> get()
    {
        SK_ASSERT(_read <= _write, "read cursor overtook write cursor");

        if (is_empty())
            return sk::nullopt;

        auto const slot = slot_of(_read);
        SK_ASSERT(slot < _stored, "read cursor points past the stored elements");

        sk::optional<T> value;
        if constexpr (std::is_copy_constructible_v<T>)
            value.emplace(_data[slot]);
        else
            value.emplace(sk::move(_data[slot]));

        ++_read;
        return value;
    }

    /// Returns a copy of the element at the read cursor without advancing.
    /// Returns nullopt if the buffer is empty.
    [[nodiscard]] sk::optional<T> peek() const
        requires std::is_copy_constructible_v<T>
    {
        SK_ASSERT(_read <= _write, "read cursor overtook write cursor");

        if (is_empty())
            return sk::nullopt;

        auto const slot = slot_of(_read);
        SK_ASSERT(slot < _stored, "read cursor points past the stored elements");
        return sk::optional<T>(_data[slot]);
    }

    /// Moves the read cursor back by one so the last read element becomes readable again.
    /// Returns false (and does nothing) if that slot may already be overwritten or the
    /// read cursor is at the start of the stream.
    [[nodiscard]] bool rewind()
        requires std::is_copy_constructible_v<T>
    {
        if (!can_rewind())
            return false;

        --_read;
        return true;
    }

    /// Drops all elements and resets both cursors.
    /// Stored objects are destroyed immediately; the allocation is kept for reuse.
    void discard()
    {
        if (_data != nullptr)
            impl::destroy_objects_in_reverse(_data, _data + _stored);
        _stored = 0;
        _write = 0;
        _read = 0;
    }

    // queries
public:
    [[nodiscard]] isize capacity() const { return _capacity; }

    /// Number of elements that can currently be read.
    [[nodiscard]] isize count() const { return isize(_write) - isize(_read); }

    [[nodiscard]] bool is_empty() const { return _write == _read; }
    [[nodiscard]] bool is_full() const { return count() == _capacity; }

    /// True iff rewind() would succeed.
    /// Once count() == capacity() the slot before the read cursor holds the newest write.
    [[nodiscard]] bool can_rewind() const
        requires std::is_copy_constructible_v<T>
    {
        return count() < _capacity && _read > 0;
    }

    // consuming iteration
public:
    /// Single-pass input iterator that get()s its way through the buffer.
    /// The element is owned by the iterator, so *it may be moved from.
    struct drain_iterator
    {
        using iterator_concept = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;

        drain_iterator() = default;

        T& operator*() const { return _current.value(); }

        drain_iterator& operator++()
        {
            _current = _buffer->get();
            return *this;
        }
        void operator++(int) { ++*this; }

        bool operator==(sk::sentinel) const { return !_current.has_value(); }

    private:
        explicit drain_iterator(ringbuffer* buffer) : _buffer(buffer), _current(buffer->get()) {}

        ringbuffer* _buffer = nullptr;
        mutable sk::optional<T> _current;

        friend ringbuffer;
    };

    /// Iterating consumes: every element visited has been get() from the buffer.
    /// A second loop over the same buffer visits only elements put in between.
    /// NOTE: begin() already reads the first element.
    [[nodiscard]] drain_iterator begin() { return drain_iterator(this); }
    [[nodiscard]] sk::sentinel end() const { return {}; }

    // helper
private:
    [[nodiscard]] static constexpr isize max_cursor_capacity() { return isize(std::numeric_limits<CursorT>::max()) / 4; }
    [[nodiscard]] static constexpr isize max_storage_capacity()
    {
        return isize(std::numeric_limits<std::ptrdiff_t>::max() / std::ptrdiff_t(sizeof(T)));
    }

    [[nodiscard]] isize slot_of(CursorT cursor) const { return isize(cursor) % _capacity; }

    void rebase_cursors()
    {
        auto const n = count();
        auto const read = _capacity + slot_of(_read);
        auto const write = read + n;
        SK_ASSERT(write < isize(std::numeric_limits<CursorT>::max()), "no cursor headroom left after rebase");

        _read = CursorT(read);
        _write = CursorT(write);
    }

    void allocate_storage()
    {
        _data = static_cast<T*>(::operator new(sizeof(T) * size_t(_capacity), std::align_val_t(alignof(T))));
        _stored = 0;
    }

    void release_storage()
    {
        if (_data == nullptr)
            return;

        impl::destroy_objects_in_reverse(_data, _data + _stored);
        ::operator delete(_data, sizeof(T) * size_t(_capacity), std::align_val_t(alignof(T)));
        _data = nullptr;
        _stored = 0;
    }

    // members
private:
    /// [_data, _data + _stored) are live objects, the rest up to _capacity is raw storage
    T* _data = nullptr;
    isize _capacity = 0;
    isize _stored = 0;

    CursorT _write = 0;
    CursorT _read = 0;
};
