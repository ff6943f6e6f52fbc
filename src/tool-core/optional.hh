#pragma once

#include <tool-core/assert.hh>
#include <tool-core/fwd.hh>
#include <tool-core/utility.hh>

#include <memory>
#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as tc::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct tc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace tc
{
/// The canonical instance of nullopt_t, also the "absent" marker of tc::zip rows.
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace tc

/// Sum type representing either a value of type T or no value (T | none), similar to std::optional.
/// Provides a safer subset of std::optional's API: no operator* or operator-> to avoid misuse.
/// Equality comparison available; other relational operators deliberately omitted.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
template <class T>
struct tc::optional
{
    static_assert(!std::is_reference_v<T>, "optional of references is not supported");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    constexpr optional() {}

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        std::construct_at(&_storage.value, tc::forward<U>(value));
    }

    /// Constructs an empty optional from tc::nullopt.
    constexpr optional(nullopt_t) {}

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
    /// Move constructor for non-trivial T: rhs keeps its engaged state with a moved-from value.
    optional(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            std::construct_at(&_storage.value, tc::move(rhs._storage.value));
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            std::construct_at(&_storage.value, rhs._storage.value);
    }

    optional& operator=(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = tc::move(rhs._storage.value);
            else
                std::construct_at(&_storage.value, tc::move(rhs._storage.value));

            _has_value = true;
        }
        else
            reset();

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rhs._storage.value;
            else
                std::construct_at(&_storage.value, rhs._storage.value);

            _has_value = true;
        }
        else
            reset();

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // modifiers
public:
    /// Destroys the held value (if any), leaving the optional empty.
    void reset()
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
            if (_has_value)
                std::destroy_at(&_storage.value);
        _has_value = false;
    }

    /// Replaces the content with a value constructed in-place from args.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        std::construct_at(&_storage.value, tc::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Returns a reference to the held value.
    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() &
    {
        TC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        TC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        TC_ASSERT(_has_value, "attempted to access value of empty optional");
        return tc::move(_storage.value);
    }

    /// Returns the held value or the given fallback when empty.
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(tc::forward<U>(fallback));
    }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional equals a value if it holds an equal value.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// An optional equals nullopt iff it is empty.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Prevents optional<int> from silently comparing with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    union storage
    {
        constexpr storage() {}
        ~storage()
            requires std::is_trivially_destructible_v<T>
        = default;
        ~storage()
            requires(!std::is_trivially_destructible_v<T>)
        {
        }

        char dummy;
        T value;
    };

    /// Value is constructed in-place when the optional is engaged.
    storage _storage;

    bool _has_value = false;
};
