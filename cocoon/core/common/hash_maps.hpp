// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <absl/container/btree_map.h>
#include <absl/container/btree_set.h>
#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>

namespace cocoon {

/*
Alias templates to fast hash maps and sets, such as Abseil "Swiss tables", and to ordered B-tree containers

The following aliases are defined:

FlatHashMap – a hash map that might not have pointer stability.
FlatHashSet – a hash set that might not have pointer stability.
OrderedMap – a sorted map, iteration order is deterministic across nodes.
OrderedSet – a sorted set, iteration order is deterministic across nodes.

Anything that ends up in an execution output must use the ordered containers.

See https://abseil.io/docs/cpp/guides/container#hash-tables
and https://abseil.io/docs/cpp/guides/container#b-tree-ordered-containers
*/

template <class K, class V>
using FlatHashMap = absl::flat_hash_map<K, V>;

template <class T>
using FlatHashSet = absl::flat_hash_set<T>;

template <class K, class V>
using OrderedMap = absl::btree_map<K, V>;

template <class T>
using OrderedSet = absl::btree_set<T>;

}  // namespace cocoon
