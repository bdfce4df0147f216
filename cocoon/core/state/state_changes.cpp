// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_changes.hpp"

namespace cocoon {

void LedgerEntryUpdate::merge(const LedgerEntryUpdate& other) {
    if (other.parallel_balance) {
        parallel_balance = other.parallel_balance;
    }
    if (other.sequential_balance) {
        sequential_balance = other.sequential_balance;
    }
    if (other.bytecode) {
        bytecode = other.bytecode;
    }
    for (const auto& [key, value] : other.datastore) {
        datastore.insert_or_assign(key, value);
    }
}

void LedgerEntryUpdate::apply_to(LedgerEntry& entry) const {
    if (parallel_balance) {
        entry.parallel_balance = *parallel_balance;
    }
    if (sequential_balance) {
        entry.sequential_balance = *sequential_balance;
    }
    if (bytecode) {
        entry.bytecode = *bytecode;
    }
    for (const auto& [key, value] : datastore) {
        if (value) {
            entry.datastore.insert_or_assign(key, *value);
        } else {
            entry.datastore.erase(key);
        }
    }
}

void StateChanges::merge(const StateChanges& other) {
    for (const auto& [address, update] : other.ledger_changes) {
        ledger_changes[address].merge(update);
    }
    for (const auto& [address, rolls] : other.roll_changes) {
        roll_changes.insert_or_assign(address, rolls);
    }
    for (const auto& [id, expire_period] : other.executed_ops) {
        executed_ops.insert_or_assign(id, expire_period);
    }
}

}  // namespace cocoon
