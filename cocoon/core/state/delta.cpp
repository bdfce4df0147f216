// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "delta.hpp"

#include <utility>

#include <cocoon/core/state/slot_state.hpp>

namespace cocoon::state {

CreateDelta::CreateDelta(const Address& address) noexcept : address_{address} {}

void CreateDelta::revert(SlotState& state) noexcept { state.changes_.ledger_changes.erase(address_); }

ParallelBalanceDelta::ParallelBalanceDelta(const Address& address, std::optional<Amount> previous) noexcept
    : address_{address}, previous_{previous} {}

void ParallelBalanceDelta::revert(SlotState& state) noexcept {
    state.changes_.ledger_changes[address_].parallel_balance = previous_;
}

SequentialBalanceDelta::SequentialBalanceDelta(const Address& address, std::optional<Amount> previous) noexcept
    : address_{address}, previous_{previous} {}

void SequentialBalanceDelta::revert(SlotState& state) noexcept {
    state.changes_.ledger_changes[address_].sequential_balance = previous_;
}

BytecodeDelta::BytecodeDelta(const Address& address, std::optional<Bytes> previous) noexcept
    : address_{address}, previous_{std::move(previous)} {}

void BytecodeDelta::revert(SlotState& state) noexcept {
    state.changes_.ledger_changes[address_].bytecode = std::move(previous_);
}

DatastoreDelta::DatastoreDelta(const Address& address, Bytes key,
                               std::optional<std::optional<Bytes>> previous) noexcept
    : address_{address}, key_{std::move(key)}, previous_{std::move(previous)} {}

void DatastoreDelta::revert(SlotState& state) noexcept {
    auto& datastore{state.changes_.ledger_changes[address_].datastore};
    if (previous_) {
        datastore.insert_or_assign(key_, std::move(*previous_));
    } else {
        datastore.erase(key_);
    }
}

RollDelta::RollDelta(const Address& address, std::optional<RollCount> previous) noexcept
    : address_{address}, previous_{previous} {}

void RollDelta::revert(SlotState& state) noexcept {
    if (previous_) {
        state.changes_.roll_changes.insert_or_assign(address_, *previous_);
    } else {
        state.changes_.roll_changes.erase(address_);
    }
}

ExecutedOpDelta::ExecutedOpDelta(const OperationId& id) noexcept : id_{id} {}

void ExecutedOpDelta::revert(SlotState& state) noexcept { state.changes_.executed_ops.erase(id_); }

}  // namespace cocoon::state
