// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/state/ledger_entry.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/core/types/hash.hpp>

namespace cocoon {

//! Changes to one ledger entry. Absent fields are left untouched, an absent datastore value deletes the key.
//! Updating an address unknown to the ledger creates its entry.
struct LedgerEntryUpdate {
    std::optional<Amount> parallel_balance;
    std::optional<Amount> sequential_balance;
    std::optional<Bytes> bytecode;
    OrderedMap<Bytes, std::optional<Bytes>> datastore;

    //! Compose with a later update: fields set by other override ours
    void merge(const LedgerEntryUpdate& other);

    void apply_to(LedgerEntry& entry) const;

    friend bool operator==(const LedgerEntryUpdate&, const LedgerEntryUpdate&) = default;
};

//! \brief Diff produced by the execution of one slot.
//! \details All containers are ordered so that two nodes executing the same slot produce identical diffs.
//! Applying a then b is equivalent to applying a.merge(b).
struct StateChanges {
    OrderedMap<Address, LedgerEntryUpdate> ledger_changes;
    //! New absolute roll counts
    OrderedMap<Address, RollCount> roll_changes;
    //! Operations executed in the slot with their expire period
    OrderedMap<OperationId, Period> executed_ops;

    void merge(const StateChanges& other);

    bool empty() const noexcept { return ledger_changes.empty() && roll_changes.empty() && executed_ops.empty(); }

    friend bool operator==(const StateChanges&, const StateChanges&) = default;
};

}  // namespace cocoon
