#pragma once

#include <tool-core/assert.hh>
#include <tool-core/fwd.hh>
#include <tool-core/optional.hh>
#include <tool-core/utility.hh>

#include <initializer_list>
#include <vector>

/// Arbitrarily nested sequence of T values
///
/// Each node is either a leaf holding a single T or a list of child nodes (possibly empty).
/// Children are owned by value, so a nested<T> is always a finite tree and can never contain a cycle.
///
/// Construction:
///   tc::nested<int> n = {1, {2, 3, {4}}, 5};  // list with a leaf, a sub-list, and a leaf
///   auto leaf = tc::nested<int>(7);           // single leaf
///   auto list = tc::nested<int>::list({});    // empty list
///
/// Sharp edge: braces always build lists.
///   tc::nested<int>{7} is a list containing one leaf, tc::nested<int>(7) is the leaf itself.
template <class T>
struct tc::nested
{
    // factories
public:
    [[nodiscard]] static nested leaf(T value) { return nested(tc::move(value)); }

    [[nodiscard]] static nested list(std::vector<nested> children)
    {
        nested n;
        n._children = tc::move(children);
        return n;
    }

    // construction
public:
    /// an empty list
    nested() = default;

    /// a leaf
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, nested> && std::is_constructible_v<T, U &&>)
    nested(U&& value) : _leaf(T(tc::forward<U>(value))) // NOLINT(google-explicit-constructor)
    {
    }

    /// a list of the given nodes, in order
    nested(std::initializer_list<nested> children) : _children(children) {}

    // queries and access
public:
    [[nodiscard]] bool is_leaf() const { return _leaf.has_value(); }
    [[nodiscard]] bool is_list() const { return !_leaf.has_value(); }

    /// Precondition: is_leaf()
    [[nodiscard]] T const& value() const
    {
        TC_ASSERT(is_leaf(), "value() requires a leaf node");
        return _leaf.value();
    }

    /// Precondition: is_list()
    [[nodiscard]] std::vector<nested> const& children() const
    {
        TC_ASSERT(is_list(), "children() requires a list node");
        return _children;
    }

    /// Appends a child node to a list node
    /// Precondition: is_list()
    nested& push_back(nested child)
    {
        TC_ASSERT(is_list(), "push_back() requires a list node");
        _children.push_back(tc::move(child));
        return *this;
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(nested const& lhs, nested const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.is_leaf() != rhs.is_leaf())
            return false;
        if (lhs.is_leaf())
            return lhs._leaf.value() == rhs._leaf.value();
        return lhs._children == rhs._children;
    }

    // members
private:
    // engaged iff this node is a leaf
    tc::optional<T> _leaf;
    std::vector<nested> _children;
};
