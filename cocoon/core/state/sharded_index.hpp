// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#include <absl/hash/hash.h>

#include <cocoon/core/common/hash_maps.hpp>

namespace cocoon {

//! \brief Hash index split into 2^kShardBits shards which are shared between copies.
//! \details Copying a ShardedIndex copies shard pointers only. A shard is duplicated the first time it is modified
//! while still referenced by another copy, so the cost of a write is bounded by the size of one shard.
template <class K, class V, unsigned kShardBits = 6>
class ShardedIndex {
  public:
    static constexpr size_t kShardCount{size_t{1} << kShardBits};

    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    const V* find(const K& key) const {
        const auto& shard{shards_[shard_of(key)]};
        if (!shard) return nullptr;
        const auto it{shard->find(key)};
        return it == shard->end() ? nullptr : &it->second;
    }

    bool contains(const K& key) const { return find(key) != nullptr; }

    //! \return true if the key was not present
    bool emplace(const K& key, V value) {
        auto& shard{mutable_shard(key)};
        const bool inserted{shard.try_emplace(key, std::move(value)).second};
        if (inserted) ++size_;
        return inserted;
    }

    void insert_or_assign(const K& key, V value) {
        auto& shard{mutable_shard(key)};
        if (shard.insert_or_assign(key, std::move(value)).second) ++size_;
    }

    //! \return true if the key was present
    bool erase(const K& key) {
        if (!contains(key)) return false;
        mutable_shard(key).erase(key);
        --size_;
        return true;
    }

    //! Number of shards physically shared with other
    size_t shared_shard_count(const ShardedIndex& other) const noexcept {
        size_t count{0};
        for (size_t i{0}; i < kShardCount; ++i) {
            if (shards_[i] && shards_[i] == other.shards_[i]) ++count;
        }
        return count;
    }

  private:
    using Shard = FlatHashMap<K, V>;

    static size_t shard_of(const K& key) {
        // High bits: the low ones also drive the probing of the shard itself
        return static_cast<size_t>(static_cast<uint64_t>(absl::Hash<K>{}(key)) >> (64 - kShardBits));
    }

    Shard& mutable_shard(const K& key) {
        auto& shard{shards_[shard_of(key)]};
        if (!shard) {
            shard = std::make_shared<Shard>();
        } else if (shard.use_count() > 1) {
            shard = std::make_shared<Shard>(*shard);
        }
        return *shard;
    }

    std::array<std::shared_ptr<Shard>, kShardCount> shards_;
    size_t size_{0};
};

}  // namespace cocoon
