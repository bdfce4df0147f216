// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/types/block.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/operation.hpp>

namespace cocoon {

//! \brief Reference-counted in-memory store of block, operation and endorsement payloads.
//! \details Every Storage instance is a handle onto a registry shared by all its clones. A handle owns references
//! to the items it stored or claimed: an item stays in the registry as long as at least one handle references it.
//! Copying a handle claims the same references again, destroying it releases them.
//! Payloads are immutable once stored and are handed out as shared pointers to const, so readers never copy them.
class Storage {
  public:
    //! Create a handle onto a new, empty registry
    Storage();
    ~Storage();

    Storage(const Storage& other);
    Storage& operator=(const Storage& other);
    Storage(Storage&& other) noexcept = default;
    Storage& operator=(Storage&& other) noexcept;

    //! \brief A handle onto the same registry owning no reference
    Storage clone_without_refs() const;

    void store_block(Block block);
    void store_operations(std::vector<Operation> operations);
    void store_endorsements(std::vector<Endorsement> endorsements);

    //! \brief Claim references to items already present in the registry
    //! \return false if any of the items is unknown, in which case no reference is claimed
    bool claim_block_refs(const std::vector<BlockId>& ids);
    bool claim_operation_refs(const std::vector<OperationId>& ids);

    //! \brief Release the references owned by this handle, evicting items no longer referenced
    void drop_block_refs(const std::vector<BlockId>& ids);
    void drop_operation_refs(const std::vector<OperationId>& ids);
    void drop_all_refs();

    std::shared_ptr<const Block> get_block(const BlockId& id) const;
    std::shared_ptr<const Operation> get_operation(const OperationId& id) const;
    std::shared_ptr<const Endorsement> get_endorsement(const EndorsementId& id) const;

    size_t owned_block_count() const noexcept { return local_blocks_.size(); }
    size_t owned_operation_count() const noexcept { return local_operations_.size(); }

    //! Number of distinct blocks held by the shared registry
    size_t registry_block_count() const;
    size_t registry_operation_count() const;

  private:
    template <class T>
    struct Counted {
        std::shared_ptr<const T> value;
        size_t ref_count{0};
    };

    struct Registry {
        mutable std::shared_mutex mutex;
        FlatHashMap<BlockId, Counted<Block>> blocks;
        FlatHashMap<OperationId, Counted<Operation>> operations;
        FlatHashMap<EndorsementId, Counted<Endorsement>> endorsements;
    };

    explicit Storage(std::shared_ptr<Registry> registry);

    void claim_local_refs();

    std::shared_ptr<Registry> registry_;
    FlatHashSet<BlockId> local_blocks_;
    FlatHashSet<OperationId> local_operations_;
    FlatHashSet<EndorsementId> local_endorsements_;
};

}  // namespace cocoon
