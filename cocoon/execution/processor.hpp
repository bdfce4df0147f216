// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>

#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/state/slot_state.hpp>
#include <cocoon/core/state/state_view.hpp>
#include <cocoon/core/types/block.hpp>
#include <cocoon/core/types/operation.hpp>
#include <cocoon/execution/block_handle.hpp>
#include <cocoon/execution/settings.hpp>
#include <cocoon/execution/vm.hpp>

namespace cocoon::execution {

//! \brief Executes the content of one slot on top of a state view.
//! \details Execution is a pure function of (settings, slot, block payloads, view): the same inputs always yield
//! the same ExecutionOutput. Invalid operations are rejected one by one without failing the slot.
class ExecutionProcessor {
  public:
    ExecutionProcessor(const ExecutionSettings& settings, VirtualMachine& vm);

    // Not copyable nor movable
    ExecutionProcessor(const ExecutionProcessor&) = delete;
    ExecutionProcessor& operator=(const ExecutionProcessor&) = delete;

    //! \param block the block occupying slot, absent for a miss slot
    //! \throws std::logic_error if the block payload is missing from its storage
    ExecutionOutput execute_slot(const Slot& slot, const BlockHandle* block, const StateView& view) const;

  private:
    void credit_block_reward(SlotState& state, const Block& block, const Storage& storage) const;

    //! \return the reason the operation was rejected, nothing if executed
    std::optional<std::string> execute_operation(SlotState& state, const Block& block, const Operation& operation,
                                                 Gas& remaining_gas, uint64_t& created_sc_count) const;

    std::optional<std::string> apply_roll_buy(SlotState& state, const Address& sender, const RollBuy& op) const;
    std::optional<std::string> apply_roll_sell(SlotState& state, const Address& sender, const RollSell& op) const;

    const ExecutionSettings& settings_;
    VirtualMachine& vm_;
};

}  // namespace cocoon::execution
