#pragma once

#include <snow-core/assert.hh>
#include <snow-core/fwd.hh>
#include <snow-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct sk::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace sk
{
/// The canonical instance of nullopt_t.
/// Usage: optional<int> opt = nullopt; or if (buffer.peek() == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace sk

/// Either a value of type T or nothing, similar to std::optional.
/// This is what ringbuffer::get() and ringbuffer::peek() hand out.
/// No operator* or operator->: access goes through value(), value_or() and friends,
/// which makes the "nothing available" case hard to ignore.
template <class T>
struct sk::optional
{
    // construction
public:
    optional() = default;

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (sk::placement_new, &_storage.value) T(sk::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (sk::placement_new, &_storage.value) T(sk::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (sk::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value (matches std::optional).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = sk::move(rhs._storage.value);
            else
                new (sk::placement_new, &_storage.value) T(sk::move(rhs._storage.value));

            _has_value = true;
        }
        else
        {
            reset();
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (sk::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else
            {
                reset();
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        SK_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        SK_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        SK_ASSERT(_has_value, "attempted to access value of empty optional");
        return sk::move(_storage.value);
    }

    /// Returns the held value, or fallback if empty.
    /// Usage:
    ///   int next = buffer.get().value_or(-1);
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(sk::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? sk::move(_storage.value) : static_cast<T>(sk::forward<U>(fallback));
    }

    /// Returns the held value, or the result of f() if empty.
    /// f is only invoked when the optional is empty.
    template <class F>
    [[nodiscard]] T value_or_else(F&& f) const&
    {
        if (_has_value)
            return _storage.value;
        return sk::invoke(sk::forward<F>(f));
    }
    template <class F>
    [[nodiscard]] T value_or_else(F&& f) &&
    {
        if (_has_value)
            return sk::move(_storage.value);
        return sk::invoke(sk::forward<F>(f));
    }

    /// If empty, stores the result of f(). Never invokes f otherwise.
    /// Returns the held value either way.
    template <class F>
    T& fill_if_empty(F&& f)
    {
        if (!_has_value)
            emplace(sk::invoke(sk::forward<F>(f)));
        return _storage.value;
    }

    // modifiers
public:
    /// Destroys any held value, then constructs a new one in place.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        new (sk::placement_new, &_storage.value) T(sk::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    void reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted for non-bool T so that optional<int> == true does not compile.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    sk::storage_for<T> _storage;

    bool _has_value = false;
};
