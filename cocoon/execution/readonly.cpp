// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "readonly.hpp"

#include <cocoon/core/common/overloaded.hpp>
#include <cocoon/core/state/slot_state.hpp>
#include <cocoon/execution/execution_context.hpp>
#include <cocoon/infra/common/log.hpp>

namespace cocoon::execution {

static ExecutionError to_execution_error(const CallResult& result) {
    switch (result.status) {
        case CallStatus::kTargetNotFound:
            return ExecutionError{ExecutionErrorCode::kTargetNotFound, result.message};
        case CallStatus::kOutOfGas:
            return ExecutionError{ExecutionErrorCode::kResourceExhausted, result.message};
        case CallStatus::kTrap:
        case CallStatus::kSuccess:
            break;
    }
    return ExecutionError{ExecutionErrorCode::kRuntimeTrap, result.message};
}

ReadOnlyResult ReadOnlyExecutor::execute(const ReadOnlyExecutionRequest& request,
                                         const ExecutionSnapshot& snapshot) const {
    if (request.max_gas > settings_.max_read_only_gas) {
        return tl::make_unexpected(ExecutionError{
            ExecutionErrorCode::kResourceExhausted,
            "max_gas " + std::to_string(request.max_gas) + " above limit " + std::to_string(settings_.max_read_only_gas)});
    }
    if (request.call_stack.empty()) {
        return tl::make_unexpected(ExecutionError{ExecutionErrorCode::kInvalidRequest, "empty call stack"});
    }

    const StateView view{request.is_final ? snapshot.final_view() : snapshot.candidate_view()};
    const Slot slot{view.slot().next(settings_.thread_count)};
    SlotState state{view, slot};
    uint64_t created_sc_count{0};
    ExecutionContext context{state,
                             vm_,
                             request.call_stack,
                             request.simulated_gas_price,
                             ExecutionOrigin{.block_id = std::nullopt, .operation_id = std::nullopt, .read_only = true},
                             created_sc_count};

    const auto result{std::visit(
        Overloaded{
            [&](const BytecodeExecution& target) { return context.run_main(target.bytecode, request.max_gas); },
            [&](const FunctionCall& target) {
                return context.call_function(target.target, target.function, target.parameter, request.max_gas,
                                             Amount{}, Amount{});
            },
        },
        request.target)};

    if (!result.success()) {
        auto error{to_execution_error(result)};
        COCOON_DEBUG_M("ReadOnlyExecutor", {"slot", slot.to_string(), "error", error.to_string()});
        return tl::make_unexpected(std::move(error));
    }
    return state.release_output(std::nullopt, ExecutionUsage{.gas_used = result.gas_used, .executed_ops = 0,
                                                              .rejected_ops = 0});
}

}  // namespace cocoon::execution
