#pragma once

#include <genseq/assert.hh>
#include <genseq/fwd.hh>
#include <genseq/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// A successor function returns gs::nullopt to end the sequence.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct gs::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace gs
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
/// Usage: return x < 5 ? gs::optional<int>(x + 1) : gs::nullopt;
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace gs

/// Sum type representing either a value of type T or no value (T | none).
/// This is the step type of generating sequences: Value(T) continues, nullopt terminates.
/// No operator* or operator-> to avoid unchecked access; value() asserts.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
template <class T>
struct gs::optional
{
    static_assert(!std::is_reference_v<T>, "optional<T&> is not supported, use optional<T*>");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    /// Never competes with copy/move construction or nullopt.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (gs::placement_new, &_storage.value) T(gs::forward<U>(value));
    }

    /// Constructs an empty optional from gs::nullopt.
    constexpr optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
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

    // non-trivial copy/move/destroy - custom implementation when T requires special handling
public:
    /// Move constructor for non-trivial T: move-constructs value, then destroys rhs and marks it empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (gs::placement_new, &_storage.value) T(gs::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (gs::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment for non-trivial T: moves or constructs from rhs, handling all state combinations.
    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = gs::move(rhs._storage.value);
            else
                new (gs::placement_new, &_storage.value) T(gs::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
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
                    new (gs::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
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

    // modification
public:
    /// Destroys the held value (if any) and constructs a new one in place.
    /// Unlike assignment, this never requires T to be assignable.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        new (gs::placement_new, &_storage.value) T(gs::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    /// Destroys the held value (if any), afterwards has_value() == false.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value, preserving the value category of the optional itself.
    /// Precondition: has_value() == true.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        GS_ASSERT(self.has_value(), "attempted to access value of empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns the held value or the fallback if empty.
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _storage.value;
        return static_cast<T>(gs::forward<U>(fallback));
    }

    // comparison
public:
    /// Equality comparison: two optionals are equal if both empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// Equality comparison with a value: optional is equal to the value if it holds an equal value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Prevents optional<int> from comparing with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    gs::storage_for<T> _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};

namespace gs::impl
{
template <class T>
constexpr bool is_optional = false;
template <class T>
constexpr bool is_optional<gs::optional<T>> = true;
} // namespace gs::impl
