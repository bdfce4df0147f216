// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "processor.hpp"

#include <limits>
#include <utility>
#include <vector>

#include <cocoon/core/common/overloaded.hpp>
#include <cocoon/core/common/util.hpp>
#include <cocoon/execution/execution_context.hpp>
#include <cocoon/infra/common/ensure.hpp>
#include <cocoon/infra/common/log.hpp>

namespace cocoon::execution {

ExecutionProcessor::ExecutionProcessor(const ExecutionSettings& settings, VirtualMachine& vm)
    : settings_{settings}, vm_{vm} {}

ExecutionOutput ExecutionProcessor::execute_slot(const Slot& slot, const BlockHandle* block_handle,
                                                 const StateView& view) const {
    SlotState state{view, slot};
    if (!block_handle) {
        return state.release_output(std::nullopt, {});
    }

    const auto block{block_handle->storage.get_block(block_handle->id)};
    ensure(block != nullptr, [&]() { return "ExecutionProcessor: missing payload of block " + block_handle->id.to_hex(); });
    ensure(block->slot == slot, [&]() {
        return "ExecutionProcessor: block " + block->id.to_hex() + " of slot " + block->slot.to_string() +
               " executed at slot " + slot.to_string();
    });

    credit_block_reward(state, *block, block_handle->storage);

    ExecutionUsage usage;
    Gas remaining_gas{settings_.max_gas_per_block};
    uint64_t created_sc_count{0};
    for (const auto& operation_id : block->operations) {
        const auto operation{block_handle->storage.get_operation(operation_id)};
        std::optional<std::string> rejection;
        if (!operation) {
            rejection = "missing from storage";
        } else {
            const Gas remaining_before{remaining_gas};
            rejection = execute_operation(state, *block, *operation, remaining_gas, created_sc_count);
            usage.gas_used += remaining_before - remaining_gas;
        }
        if (rejection) {
            ++usage.rejected_ops;
            COCOON_DEBUG_M("ExecutionProcessor", {"slot", slot.to_string(), "operation", abridge(operation_id.to_hex(), 16),
                                                  "rejected", *rejection});
        } else {
            ++usage.executed_ops;
        }
    }

    COCOON_TRACE_M("ExecutionProcessor", {"slot", slot.to_string(), "block", abridge(block->id.to_hex(), 16),
                                          "executed", std::to_string(usage.executed_ops),
                                          "rejected", std::to_string(usage.rejected_ops),
                                          "gas", std::to_string(usage.gas_used)});
    return state.release_output(block->id, usage);
}

void ExecutionProcessor::credit_block_reward(SlotState& state, const Block& block, const Storage& storage) const {
    std::vector<Address> endorsers;
    for (const auto& endorsement_id : block.endorsements) {
        if (const auto endorsement{storage.get_endorsement(endorsement_id)}) {
            endorsers.push_back(endorsement->creator);
        } else {
            COCOON_WARN_M("ExecutionProcessor", {"block", abridge(block.id.to_hex(), 16), "endorsement",
                                                 abridge(endorsement_id.to_hex(), 16), "missing", "true"});
        }
    }

    const uint64_t beneficiaries{endorsers.size() + 1};
    const Amount share{*settings_.block_reward.checked_div(beneficiaries)};
    const Amount remainder{*settings_.block_reward.checked_sub(*share.checked_mul(beneficiaries))};

    auto credit = [&](const Address& address, Amount amount) {
        if (amount.is_zero()) return;
        if (!state.transfer_parallel(std::nullopt, address, amount)) {
            COCOON_WARN_M("ExecutionProcessor", {"block", abridge(block.id.to_hex(), 16), "reward", amount.to_string(),
                                                 "overflow", address.to_hex()});
        }
    };
    credit(block.creator, *share.checked_add(remainder));
    for (const auto& endorser : endorsers) {
        credit(endorser, share);
    }
}

std::optional<std::string> ExecutionProcessor::execute_operation(SlotState& state, const Block& block,
                                                                 const Operation& operation, Gas& remaining_gas,
                                                                 uint64_t& created_sc_count) const {
    const Slot& slot{state.slot()};
    if (state.is_op_executed(operation.id)) {
        return "already executed";
    }
    if (slot.period > operation.expire_period) {
        return "expired at period " + std::to_string(operation.expire_period);
    }
    const Gas max_gas{operation.max_gas()};
    if (max_gas > remaining_gas) {
        return "block gas exhausted";
    }
    const auto gas_cost{operation.gas_price().checked_mul(max_gas)};
    if (!gas_cost) {
        return "gas cost overflow";
    }

    const auto before_fees{state.take_snapshot()};
    if (!operation.fee.is_zero() && !state.transfer_parallel(operation.sender, block.creator, operation.fee)) {
        return "insufficient parallel balance for fee " + operation.fee.to_string();
    }
    if (!gas_cost->is_zero() && !state.transfer_sequential(operation.sender, block.creator, *gas_cost)) {
        state.revert_to_snapshot(before_fees);
        return "insufficient sequential balance for gas " + gas_cost->to_string();
    }

    // Plain payloads are all-or-nothing, fees included
    auto reject = [&](std::string reason) -> std::optional<std::string> {
        state.revert_to_snapshot(before_fees);
        return reason;
    };

    ExecutionContext context{state,
                             vm_,
                             {operation.sender},
                             operation.gas_price(),
                             ExecutionOrigin{.block_id = block.id, .operation_id = operation.id, .read_only = false},
                             created_sc_count};

    std::optional<std::string> failure;
    const auto rejection{std::visit(
        Overloaded{
            [&](const Transaction& op) -> std::optional<std::string> {
                if (!state.transfer_parallel(operation.sender, op.recipient, op.amount)) {
                    return reject("insufficient parallel balance for transfer of " + op.amount.to_string());
                }
                return std::nullopt;
            },
            [&](const RollBuy& op) -> std::optional<std::string> {
                if (auto reason{apply_roll_buy(state, operation.sender, op)}) {
                    return reject(std::move(*reason));
                }
                return std::nullopt;
            },
            [&](const RollSell& op) -> std::optional<std::string> {
                if (auto reason{apply_roll_sell(state, operation.sender, op)}) {
                    return reject(std::move(*reason));
                }
                return std::nullopt;
            },
            [&](const ExecuteSC& op) -> std::optional<std::string> {
                const auto result{context.run_main(op.bytecode, op.max_gas)};
                if (!result.success()) {
                    failure = result.message;
                }
                return std::nullopt;
            },
            [&](const CallSC& op) -> std::optional<std::string> {
                const auto result{context.call_function(op.target, op.function, op.parameter, op.max_gas,
                                                        op.parallel_coins, op.sequential_coins)};
                if (!result.success()) {
                    failure = result.message;
                }
                return std::nullopt;
            },
        },
        operation.payload)};
    if (rejection) {
        return rejection;
    }

    if (failure) {
        // Failed bytecode keeps fee and gas paid: its effects were reverted by the context
        context.emit_error_event(std::string{operation.type_name()} + " " + operation.id.to_hex() + " failed: " +
                                 *failure);
    }
    remaining_gas -= max_gas;
    state.mark_op_executed(operation.id, operation.expire_period);
    return std::nullopt;
}

std::optional<std::string> ExecutionProcessor::apply_roll_buy(SlotState& state, const Address& sender,
                                                              const RollBuy& op) const {
    const auto price{settings_.roll_price.checked_mul(op.roll_count)};
    if (!price) {
        return "roll price overflow";
    }
    const RollCount current{state.get_rolls(sender)};
    if (current > std::numeric_limits<RollCount>::max() - op.roll_count) {
        return "roll count overflow";
    }
    if (!state.transfer_parallel(sender, std::nullopt, *price)) {
        return "insufficient parallel balance for " + std::to_string(op.roll_count) + " rolls";
    }
    state.set_rolls(sender, current + op.roll_count);
    return std::nullopt;
}

std::optional<std::string> ExecutionProcessor::apply_roll_sell(SlotState& state, const Address& sender,
                                                               const RollSell& op) const {
    const RollCount current{state.get_rolls(sender)};
    if (current < op.roll_count) {
        return "cannot sell " + std::to_string(op.roll_count) + " rolls out of " + std::to_string(current);
    }
    const auto price{settings_.roll_price.checked_mul(op.roll_count)};
    if (!price || !state.transfer_parallel(std::nullopt, sender, *price)) {
        return "roll sale credit overflow";
    }
    state.set_rolls(sender, current - op.roll_count);
    return std::nullopt;
}

}  // namespace cocoon::execution
