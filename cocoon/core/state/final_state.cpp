// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "final_state.hpp"

#include <utility>

#include <cocoon/infra/common/ensure.hpp>

namespace cocoon {

FinalState::FinalState(FinalStateConfig config, const OrderedMap<Address, LedgerEntry>& initial_ledger,
                       RollMap initial_rolls)
    : config_{config}, slot_{Slot::last_genesis_slot(config.thread_count)}, rolls_{std::move(initial_rolls)} {
    ensure_pre_condition(config_.thread_count > 0 && config_.periods_per_cycle > 0,
                         [&]() { return "FinalState: thread_count and periods_per_cycle must be positive"; });
    for (const auto& [address, entry] : initial_ledger) {
        ledger_.insert_or_assign(address, std::make_shared<const LedgerEntry>(entry));
    }
    absl::erase_if(rolls_, [](const auto& item) { return item.second == 0; });
}

std::shared_ptr<const LedgerEntry> FinalState::get_entry(const Address& address) const {
    const auto* entry{ledger_.find(address)};
    return entry ? *entry : nullptr;
}

RollCount FinalState::get_rolls(const Address& address) const {
    const auto it{rolls_.find(address)};
    return it == rolls_.end() ? 0 : it->second;
}

std::shared_ptr<const RollMap> FinalState::get_cycle_rolls(Cycle cycle) const {
    const auto it{cycle_rolls_.find(cycle)};
    if (it == cycle_rolls_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<const FinalState> FinalState::apply(const ExecutionOutput& output) const {
    const Slot expected_slot{slot_.next(config_.thread_count)};
    ensure(output.slot == expected_slot, [&]() {
        return "FinalState: cannot finalize " + output.slot.to_string() + ", expected " + expected_slot.to_string();
    });

    auto next{std::make_shared<FinalState>(*this)};
    const auto& changes{output.state_changes};

    for (const auto& [address, update] : changes.ledger_changes) {
        const auto* current{next->ledger_.find(address)};
        auto entry{current && *current ? LedgerEntry{**current} : LedgerEntry{}};
        update.apply_to(entry);
        next->ledger_.insert_or_assign(address, std::make_shared<const LedgerEntry>(std::move(entry)));
    }

    for (const auto& [address, rolls] : changes.roll_changes) {
        if (rolls == 0) {
            next->rolls_.erase(address);
        } else {
            next->rolls_.insert_or_assign(address, rolls);
        }
    }

    OrderedMap<Period, std::vector<OperationId>> added;
    for (const auto& [id, expire_period] : changes.executed_ops) {
        if (next->executed_ops_.emplace(id, expire_period)) {
            added[expire_period].push_back(id);
        }
    }
    auto& by_expiry{next->executed_ops_by_expiry_};
    for (auto& [expire_period, ids] : added) {
        auto& bucket{by_expiry[expire_period]};
        if (bucket) ids.insert(ids.begin(), bucket->begin(), bucket->end());
        bucket = std::make_shared<const std::vector<OperationId>>(std::move(ids));
    }
    // Operations expired before the final period can no longer be included in any block
    while (!by_expiry.empty() && by_expiry.begin()->first < output.slot.period) {
        for (const auto& id : *by_expiry.begin()->second) {
            next->executed_ops_.erase(id);
        }
        by_expiry.erase(by_expiry.begin());
    }

    std::vector<SCOutputEvent> events{output.events};
    for (auto& event : events) {
        event.context.is_final = true;
    }
    next->events_.record(output.slot, output.block_id, std::move(events));

    if (output.slot.is_last_of_cycle(config_.periods_per_cycle, config_.thread_count)) {
        next->cycle_rolls_.insert_or_assign(output.slot.cycle(config_.periods_per_cycle),
                                            std::make_shared<const RollMap>(next->rolls_));
        while (next->cycle_rolls_.size() > config_.cycle_history_length) {
            next->cycle_rolls_.erase(next->cycle_rolls_.begin());
        }
    }

    next->slot_ = output.slot;
    return next;
}

}  // namespace cocoon
