#pragma once

#include <ankerl/unordered_dense.h>

namespace vcadmin::core {

// Container aliases backed by ankerl::unordered_dense
// Dense storage, iterator invalidation like std::vector (invalidates on insertion)
//
// Usage:
//   vcadmin::core::fast_map<std::string, TimingStats> timings;
//   vcadmin::core::fast_set<std::string> enabled_paths;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace vcadmin::core
