// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "slot_state.hpp"

#include <utility>

namespace cocoon {

bool SlotState::exists(const Address& address) const {
    return changes_.ledger_changes.contains(address) || base_.exists(address);
}

std::optional<Amount> SlotState::get_parallel_balance(const Address& address) const {
    const auto it{changes_.ledger_changes.find(address)};
    if (it != changes_.ledger_changes.end() && it->second.parallel_balance) {
        return it->second.parallel_balance;
    }
    const auto value{base_.get_parallel_balance(address)};
    if (!value && it != changes_.ledger_changes.end()) {
        return Amount{};
    }
    return value;
}

std::optional<Amount> SlotState::get_sequential_balance(const Address& address) const {
    const auto it{changes_.ledger_changes.find(address)};
    if (it != changes_.ledger_changes.end() && it->second.sequential_balance) {
        return it->second.sequential_balance;
    }
    const auto value{base_.get_sequential_balance(address)};
    if (!value && it != changes_.ledger_changes.end()) {
        return Amount{};
    }
    return value;
}

std::optional<Bytes> SlotState::get_bytecode(const Address& address) const {
    const auto it{changes_.ledger_changes.find(address)};
    if (it != changes_.ledger_changes.end() && it->second.bytecode) {
        return it->second.bytecode;
    }
    const auto value{base_.get_bytecode(address)};
    if (!value && it != changes_.ledger_changes.end()) {
        return Bytes{};
    }
    return value;
}

std::optional<Bytes> SlotState::get_data_entry(const Address& address, const Bytes& key) const {
    if (const auto it{changes_.ledger_changes.find(address)}; it != changes_.ledger_changes.end()) {
        const auto& datastore{it->second.datastore};
        if (const auto value{datastore.find(key)}; value != datastore.end()) {
            return value->second;
        }
    }
    return base_.get_data_entry(address, key);
}

OrderedSet<Bytes> SlotState::get_datastore_keys(const Address& address) const {
    auto keys{base_.get_datastore_keys(address)};
    if (const auto it{changes_.ledger_changes.find(address)}; it != changes_.ledger_changes.end()) {
        for (const auto& [key, value] : it->second.datastore) {
            if (value) {
                keys.insert(key);
            } else {
                keys.erase(key);
            }
        }
    }
    return keys;
}

RollCount SlotState::get_rolls(const Address& address) const {
    if (const auto it{changes_.roll_changes.find(address)}; it != changes_.roll_changes.end()) {
        return it->second;
    }
    return base_.get_rolls(address);
}

bool SlotState::is_op_executed(const OperationId& id) const {
    return changes_.executed_ops.contains(id) || base_.is_op_executed(id);
}

LedgerEntryUpdate& SlotState::touch(const Address& address) {
    auto [it, inserted] = changes_.ledger_changes.try_emplace(address);
    if (inserted) {
        journal_.emplace_back(std::make_unique<state::CreateDelta>(address));
    }
    return it->second;
}

void SlotState::create_entry(const Address& address) {
    if (!exists(address)) {
        touch(address);
    }
}

void SlotState::set_parallel_balance(const Address& address, Amount value) {
    auto& update{touch(address)};
    journal_.emplace_back(std::make_unique<state::ParallelBalanceDelta>(address, update.parallel_balance));
    update.parallel_balance = value;
}

void SlotState::set_sequential_balance(const Address& address, Amount value) {
    auto& update{touch(address)};
    journal_.emplace_back(std::make_unique<state::SequentialBalanceDelta>(address, update.sequential_balance));
    update.sequential_balance = value;
}

bool SlotState::transfer_parallel(const std::optional<Address>& from, const std::optional<Address>& to,
                                  Amount amount) {
    const auto snapshot{take_snapshot()};
    if (from) {
        const auto balance{get_parallel_balance(*from).value_or(Amount{}).checked_sub(amount)};
        if (!balance) return false;
        set_parallel_balance(*from, *balance);
    }
    if (to) {
        const auto balance{get_parallel_balance(*to).value_or(Amount{}).checked_add(amount)};
        if (!balance) {
            revert_to_snapshot(snapshot);
            return false;
        }
        set_parallel_balance(*to, *balance);
    }
    return true;
}

bool SlotState::transfer_sequential(const std::optional<Address>& from, const std::optional<Address>& to,
                                    Amount amount) {
    const auto snapshot{take_snapshot()};
    if (from) {
        const auto balance{get_sequential_balance(*from).value_or(Amount{}).checked_sub(amount)};
        if (!balance) return false;
        set_sequential_balance(*from, *balance);
    }
    if (to) {
        const auto balance{get_sequential_balance(*to).value_or(Amount{}).checked_add(amount)};
        if (!balance) {
            revert_to_snapshot(snapshot);
            return false;
        }
        set_sequential_balance(*to, *balance);
    }
    return true;
}

void SlotState::set_bytecode(const Address& address, Bytes bytecode) {
    auto& update{touch(address)};
    journal_.emplace_back(std::make_unique<state::BytecodeDelta>(address, update.bytecode));
    update.bytecode = std::move(bytecode);
}

void SlotState::set_data_entry(const Address& address, const Bytes& key, Bytes value) {
    auto& update{touch(address)};
    std::optional<std::optional<Bytes>> previous;
    if (const auto it{update.datastore.find(key)}; it != update.datastore.end()) {
        previous = it->second;
    }
    journal_.emplace_back(std::make_unique<state::DatastoreDelta>(address, key, std::move(previous)));
    update.datastore.insert_or_assign(key, std::move(value));
}

void SlotState::delete_data_entry(const Address& address, const Bytes& key) {
    if (!get_data_entry(address, key)) return;
    auto& update{touch(address)};
    std::optional<std::optional<Bytes>> previous;
    if (const auto it{update.datastore.find(key)}; it != update.datastore.end()) {
        previous = it->second;
    }
    journal_.emplace_back(std::make_unique<state::DatastoreDelta>(address, key, std::move(previous)));
    update.datastore.insert_or_assign(key, std::nullopt);
}

void SlotState::set_rolls(const Address& address, RollCount count) {
    std::optional<RollCount> previous;
    if (const auto it{changes_.roll_changes.find(address)}; it != changes_.roll_changes.end()) {
        previous = it->second;
    }
    journal_.emplace_back(std::make_unique<state::RollDelta>(address, previous));
    changes_.roll_changes.insert_or_assign(address, count);
}

void SlotState::mark_op_executed(const OperationId& id, Period expire_period) {
    if (changes_.executed_ops.emplace(id, expire_period).second) {
        journal_.emplace_back(std::make_unique<state::ExecutedOpDelta>(id));
    }
}

void SlotState::add_event(SCOutputEvent event) {
    event.context.index_in_slot = events_.size();
    events_.push_back(std::move(event));
}

SlotState::Snapshot SlotState::take_snapshot() const noexcept {
    SlotState::Snapshot snapshot;
    snapshot.journal_size_ = journal_.size();
    snapshot.event_size_ = events_.size();
    return snapshot;
}

void SlotState::revert_to_snapshot(const SlotState::Snapshot& snapshot) noexcept {
    for (size_t i = journal_.size(); i > snapshot.journal_size_; --i) {
        journal_[i - 1]->revert(*this);
    }
    journal_.resize(snapshot.journal_size_);
    events_.resize(snapshot.event_size_);
}

ExecutionOutput SlotState::release_output(std::optional<BlockId> block_id, ExecutionUsage usage) {
    ExecutionOutput output{
        .slot = slot_,
        .block_id = std::move(block_id),
        .state_changes = std::move(changes_),
        .events = std::move(events_),
        .usage = usage,
    };
    changes_ = {};
    events_.clear();
    journal_.clear();
    return output;
}

}  // namespace cocoon
