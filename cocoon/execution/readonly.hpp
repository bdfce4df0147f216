// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/execution/errors.hpp>
#include <cocoon/execution/settings.hpp>
#include <cocoon/execution/snapshot.hpp>
#include <cocoon/execution/vm.hpp>

namespace cocoon::execution {

//! Run the main entrypoint of bytecode not deployed anywhere
struct BytecodeExecution {
    Bytes bytecode;
};

//! Call a function of a deployed smart contract
struct FunctionCall {
    Address target;
    std::string function;
    Bytes parameter;
};

struct ReadOnlyExecutionRequest {
    Gas max_gas{0};
    Amount simulated_gas_price;
    std::variant<BytecodeExecution, FunctionCall> target;
    //! Caller addresses, the last one being the one performing the call
    std::vector<Address> call_stack;
    //! Execute on top of the Final view instead of the Candidate one
    bool is_final{false};
};

using ReadOnlyResult = tl::expected<ExecutionOutput, ExecutionError>;

//! \brief Executes read-only requests on the calling thread against a checked-out snapshot.
//! \details The output describes the changes the request would make at the slot following the chosen view, but
//! nothing is ever written back: the snapshot is immutable.
class ReadOnlyExecutor {
  public:
    ReadOnlyExecutor(const ExecutionSettings& settings, VirtualMachine& vm) : settings_{settings}, vm_{vm} {}

    ReadOnlyResult execute(const ReadOnlyExecutionRequest& request, const ExecutionSnapshot& snapshot) const;

  private:
    const ExecutionSettings& settings_;
    VirtualMachine& vm_;
};

}  // namespace cocoon::execution
