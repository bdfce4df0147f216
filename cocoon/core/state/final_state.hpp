// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/events/event_store.hpp>
#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/state/ledger_entry.hpp>
#include <cocoon/core/state/sharded_index.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon {

using RollMap = OrderedMap<Address, RollCount>;

struct FinalStateConfig {
    uint8_t thread_count{32};
    uint64_t periods_per_cycle{128};
    //! Number of completed cycle roll snapshots retained
    size_t cycle_history_length{6};
};

//! \brief Irrevocable state resulting from finalized slots.
//! \details A FinalState is never mutated once published: apply() produces the next version, which shares with
//! this one every ledger and executed operation shard the applied slot did not touch as well as the whole final
//! event log. The roll map is copied on every apply as it only holds stakers.
class FinalState {
  public:
    //! Genesis state, positioned at the last slot of period 0
    FinalState(FinalStateConfig config, const OrderedMap<Address, LedgerEntry>& initial_ledger, RollMap initial_rolls);

    FinalState(const FinalState&) = default;
    FinalState& operator=(const FinalState&) = delete;

    const FinalStateConfig& config() const noexcept { return config_; }

    //! Last finalized slot
    const Slot& slot() const noexcept { return slot_; }

    std::shared_ptr<const LedgerEntry> get_entry(const Address& address) const;
    size_t ledger_size() const noexcept { return ledger_.size(); }
    const ShardedIndex<Address, std::shared_ptr<const LedgerEntry>>& ledger() const noexcept { return ledger_; }

    RollCount get_rolls(const Address& address) const;
    const RollMap& rolls() const noexcept { return rolls_; }

    bool is_op_executed(const OperationId& id) const { return executed_ops_.contains(id); }
    size_t executed_op_count() const noexcept { return executed_ops_.size(); }

    //! \brief Roll distribution frozen at the end of a completed cycle
    //! \return nullptr if the cycle is not completed yet or has fallen out of the retained history
    std::shared_ptr<const RollMap> get_cycle_rolls(Cycle cycle) const;

    const EventStore& events() const noexcept { return events_; }

    //! \brief Finalize the slot following slot()
    //! \return the next version of the final state
    //! \throws std::logic_error if output is not about the next slot
    [[nodiscard]] std::shared_ptr<const FinalState> apply(const ExecutionOutput& output) const;

  private:
    FinalStateConfig config_;
    Slot slot_;
    ShardedIndex<Address, std::shared_ptr<const LedgerEntry>> ledger_;
    RollMap rolls_;
    ShardedIndex<OperationId, Period> executed_ops_;
    //! Same content as executed_ops_ bucketed by expiry period, for pruning
    OrderedMap<Period, std::shared_ptr<const std::vector<OperationId>>> executed_ops_by_expiry_;
    OrderedMap<Cycle, std::shared_ptr<const RollMap>> cycle_rolls_;
    EventStore events_;
};

}  // namespace cocoon
