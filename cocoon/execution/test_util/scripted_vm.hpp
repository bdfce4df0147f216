// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <string_view>

#include <cocoon/execution/vm.hpp>

namespace cocoon::execution::test_util {

//! \brief Virtual machine interpreting bytecode as a tiny text script.
//! \details A main script is a list of commands separated by ';'. A contract is a list of functions separated by
//! '|', each written "name:commands". Commands:
//!   emit <text>               emit an event
//!   set <key> <value>         write the datastore of the current address
//!   del <key>                 delete a datastore key of the current address
//!   transfer <address> <n>    send n coins from the current address
//!   gas <n>                   burn n gas on top of the unit cost of each command
//!   trap <message>            fail the call
//!   call <address> <fn>       call a function of another contract
//!   counter                   emit a process-wide call counter, which makes execution non deterministic
//!   deploy <contract>         deploy the rest of the script as a contract and emit its address
class ScriptedVm : public VirtualMachine {
  public:
    CallResult run_main(Host& host, ByteView bytecode, Gas max_gas) override;

    CallResult run_function(Host& host, ByteView bytecode, std::string_view function, ByteView parameter,
                            Gas max_gas) override;

    uint64_t call_count() const noexcept { return call_count_.load(); }

  private:
    CallResult run_script(Host& host, std::string_view script, Gas max_gas);

    std::atomic_uint64_t call_count_{0};
};

}  // namespace cocoon::execution::test_util
