// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_view.hpp"

#include <utility>

namespace cocoon {

StateView::StateView(std::shared_ptr<const FinalState> final_state,
                     std::span<const std::shared_ptr<const ExecutionOutput>> history)
    : final_{std::move(final_state)}, history_{history} {
    COCOON_ASSERT(final_);
}

Slot StateView::slot() const noexcept {
    return history_.empty() ? final_->slot() : history_.back()->slot;
}

bool StateView::exists(const Address& address) const {
    for (const auto& output : history_) {
        if (output->state_changes.ledger_changes.contains(address)) return true;
    }
    return final_->get_entry(address) != nullptr;
}

template <class Field, class FinalGetter>
std::optional<Field> StateView::resolve_field(const Address& address, std::optional<Field> LedgerEntryUpdate::* field,
                                              FinalGetter final_getter) const {
    bool created{false};
    for (auto it{history_.rbegin()}; it != history_.rend(); ++it) {
        const auto& changes{(*it)->state_changes.ledger_changes};
        const auto update{changes.find(address)};
        if (update == changes.end()) continue;
        if (const auto& value{update->second.*field}; value) {
            return *value;
        }
        created = true;
    }
    if (const auto entry{final_->get_entry(address)}) {
        return final_getter(*entry);
    }
    if (created) {
        return Field{};
    }
    return std::nullopt;
}

std::optional<Amount> StateView::get_parallel_balance(const Address& address) const {
    return resolve_field(address, &LedgerEntryUpdate::parallel_balance,
                         [](const LedgerEntry& entry) { return entry.parallel_balance; });
}

std::optional<Amount> StateView::get_sequential_balance(const Address& address) const {
    return resolve_field(address, &LedgerEntryUpdate::sequential_balance,
                         [](const LedgerEntry& entry) { return entry.sequential_balance; });
}

std::optional<Bytes> StateView::get_bytecode(const Address& address) const {
    return resolve_field(address, &LedgerEntryUpdate::bytecode,
                         [](const LedgerEntry& entry) { return entry.bytecode; });
}

std::optional<Bytes> StateView::get_data_entry(const Address& address, const Bytes& key) const {
    for (auto it{history_.rbegin()}; it != history_.rend(); ++it) {
        const auto& changes{(*it)->state_changes.ledger_changes};
        const auto update{changes.find(address)};
        if (update == changes.end()) continue;
        const auto& datastore{update->second.datastore};
        if (const auto value{datastore.find(key)}; value != datastore.end()) {
            return value->second;
        }
    }
    if (const auto entry{final_->get_entry(address)}) {
        if (const auto value{entry->datastore.find(key)}; value != entry->datastore.end()) {
            return value->second;
        }
    }
    return std::nullopt;
}

OrderedSet<Bytes> StateView::get_datastore_keys(const Address& address) const {
    OrderedSet<Bytes> keys;
    if (const auto entry{final_->get_entry(address)}) {
        for (const auto& [key, _] : entry->datastore) {
            keys.insert(key);
        }
    }
    for (const auto& output : history_) {
        const auto& changes{output->state_changes.ledger_changes};
        const auto update{changes.find(address)};
        if (update == changes.end()) continue;
        for (const auto& [key, value] : update->second.datastore) {
            if (value) {
                keys.insert(key);
            } else {
                keys.erase(key);
            }
        }
    }
    return keys;
}

RollCount StateView::get_rolls(const Address& address) const {
    for (auto it{history_.rbegin()}; it != history_.rend(); ++it) {
        const auto& changes{(*it)->state_changes.roll_changes};
        if (const auto rolls{changes.find(address)}; rolls != changes.end()) {
            return rolls->second;
        }
    }
    return final_->get_rolls(address);
}

bool StateView::is_op_executed(const OperationId& id) const {
    for (const auto& output : history_) {
        if (output->state_changes.executed_ops.contains(id)) return true;
    }
    return final_->is_op_executed(id);
}

std::vector<SCOutputEvent> StateView::get_filtered_events(const EventFilter& filter) const {
    auto events{final_->events().query(filter)};
    for (const auto& output : history_) {
        if (!filter.matches_slot(output->slot)) continue;
        for (const auto& event : output->events) {
            if (filter.matches(event)) {
                events.push_back(event);
            }
        }
    }
    return events;
}

}  // namespace cocoon
