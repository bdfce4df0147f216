// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "storage.hpp"

#include <utility>

namespace cocoon {

namespace {

    template <class Map, class Id>
    void release(Map& map, const Id& id) {
        const auto it{map.find(id)};
        if (it == map.end()) return;
        if (--it->second.ref_count == 0) {
            map.erase(it);
        }
    }

    template <class Map, class Id>
    auto lookup(const Map& map, const Id& id) -> decltype(map.begin()->second.value) {
        const auto it{map.find(id)};
        if (it == map.end()) return nullptr;
        return it->second.value;
    }

}  // namespace

Storage::Storage() : registry_{std::make_shared<Registry>()} {}

Storage::Storage(std::shared_ptr<Registry> registry) : registry_{std::move(registry)} {}

Storage::~Storage() {
    if (registry_) {
        drop_all_refs();
    }
}

Storage::Storage(const Storage& other)
    : registry_{other.registry_},
      local_blocks_{other.local_blocks_},
      local_operations_{other.local_operations_},
      local_endorsements_{other.local_endorsements_} {
    if (registry_) {
        claim_local_refs();
    }
}

Storage& Storage::operator=(const Storage& other) {
    if (this == &other) return *this;
    Storage copy{other};
    *this = std::move(copy);
    return *this;
}

Storage& Storage::operator=(Storage&& other) noexcept {
    if (this == &other) return *this;
    if (registry_) {
        drop_all_refs();
    }
    registry_ = std::move(other.registry_);
    local_blocks_ = std::move(other.local_blocks_);
    local_operations_ = std::move(other.local_operations_);
    local_endorsements_ = std::move(other.local_endorsements_);
    return *this;
}

Storage Storage::clone_without_refs() const {
    return Storage{registry_};
}

void Storage::claim_local_refs() {
    std::unique_lock lock{registry_->mutex};
    for (const auto& id : local_blocks_) {
        ++registry_->blocks.at(id).ref_count;
    }
    for (const auto& id : local_operations_) {
        ++registry_->operations.at(id).ref_count;
    }
    for (const auto& id : local_endorsements_) {
        ++registry_->endorsements.at(id).ref_count;
    }
}

void Storage::store_block(Block block) {
    const BlockId id{block.id};
    std::unique_lock lock{registry_->mutex};
    auto& item{registry_->blocks[id]};
    if (!item.value) {
        item.value = std::make_shared<const Block>(std::move(block));
    }
    if (local_blocks_.insert(id).second) {
        ++item.ref_count;
    }
}

void Storage::store_operations(std::vector<Operation> operations) {
    std::unique_lock lock{registry_->mutex};
    for (auto& operation : operations) {
        const OperationId id{operation.id};
        auto& item{registry_->operations[id]};
        if (!item.value) {
            item.value = std::make_shared<const Operation>(std::move(operation));
        }
        if (local_operations_.insert(id).second) {
            ++item.ref_count;
        }
    }
}

void Storage::store_endorsements(std::vector<Endorsement> endorsements) {
    std::unique_lock lock{registry_->mutex};
    for (auto& endorsement : endorsements) {
        const EndorsementId id{endorsement.id};
        auto& item{registry_->endorsements[id]};
        if (!item.value) {
            item.value = std::make_shared<const Endorsement>(std::move(endorsement));
        }
        if (local_endorsements_.insert(id).second) {
            ++item.ref_count;
        }
    }
}

bool Storage::claim_block_refs(const std::vector<BlockId>& ids) {
    std::unique_lock lock{registry_->mutex};
    for (const auto& id : ids) {
        if (!registry_->blocks.contains(id)) return false;
    }
    for (const auto& id : ids) {
        if (local_blocks_.insert(id).second) {
            ++registry_->blocks[id].ref_count;
        }
    }
    return true;
}

bool Storage::claim_operation_refs(const std::vector<OperationId>& ids) {
    std::unique_lock lock{registry_->mutex};
    for (const auto& id : ids) {
        if (!registry_->operations.contains(id)) return false;
    }
    for (const auto& id : ids) {
        if (local_operations_.insert(id).second) {
            ++registry_->operations[id].ref_count;
        }
    }
    return true;
}

void Storage::drop_block_refs(const std::vector<BlockId>& ids) {
    std::unique_lock lock{registry_->mutex};
    for (const auto& id : ids) {
        if (local_blocks_.erase(id) > 0) {
            release(registry_->blocks, id);
        }
    }
}

void Storage::drop_operation_refs(const std::vector<OperationId>& ids) {
    std::unique_lock lock{registry_->mutex};
    for (const auto& id : ids) {
        if (local_operations_.erase(id) > 0) {
            release(registry_->operations, id);
        }
    }
}

void Storage::drop_all_refs() {
    std::unique_lock lock{registry_->mutex};
    for (const auto& id : local_blocks_) {
        release(registry_->blocks, id);
    }
    for (const auto& id : local_operations_) {
        release(registry_->operations, id);
    }
    for (const auto& id : local_endorsements_) {
        release(registry_->endorsements, id);
    }
    local_blocks_.clear();
    local_operations_.clear();
    local_endorsements_.clear();
}

std::shared_ptr<const Block> Storage::get_block(const BlockId& id) const {
    std::shared_lock lock{registry_->mutex};
    return lookup(registry_->blocks, id);
}

std::shared_ptr<const Operation> Storage::get_operation(const OperationId& id) const {
    std::shared_lock lock{registry_->mutex};
    return lookup(registry_->operations, id);
}

std::shared_ptr<const Endorsement> Storage::get_endorsement(const EndorsementId& id) const {
    std::shared_lock lock{registry_->mutex};
    return lookup(registry_->endorsements, id);
}

size_t Storage::registry_block_count() const {
    std::shared_lock lock{registry_->mutex};
    return registry_->blocks.size();
}

size_t Storage::registry_operation_count() const {
    std::shared_lock lock{registry_->mutex};
    return registry_->operations.size();
}

}  // namespace cocoon
