#pragma once

#include <tool-core/fwd.hh>
#include <tool-core/utility.hh>

namespace tc
{
/// Map-like containers that can be merged: std::map, std::unordered_map and friends
template <class M>
concept mergeable_map = requires(M& m, typename M::key_type const& k, typename M::mapped_type const& v) {
    m.insert_or_assign(k, v);
    m.try_emplace(k, v);
};

/// Copies every entry of every source into obj, overwriting existing keys
/// Sources are applied left to right, so later sources win.
/// Returns obj.
/// Usage:
///   std::map<std::string, int> cfg = {{"a", 1}};
///   tc::extend(cfg, overrides, more_overrides);
template <mergeable_map Map, class... Sources>
Map& extend(Map& obj, Sources const&... sources)
{
    auto const merge = [&](auto const& source)
    {
        for (auto const& [key, value] : source)
            obj.insert_or_assign(key, value);
    };
    (merge(sources), ...);
    return obj;
}

/// Copies entries from the sources into obj, but only for keys obj does not have yet
/// Existing keys are never overwritten, and among the sources the first one providing a key wins.
/// Returns obj.
template <mergeable_map Map, class... Sources>
Map& defaults(Map& obj, Sources const&... sources)
{
    auto const merge = [&](auto const& source)
    {
        for (auto const& [key, value] : source)
            obj.try_emplace(key, value);
    };
    (merge(sources), ...);
    return obj;
}
} // namespace tc
