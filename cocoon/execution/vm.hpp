// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon::execution {

enum class CallStatus {
    kSuccess,
    kOutOfGas,
    kTrap,
    //! Raised by the host: the called address holds no bytecode
    kTargetNotFound,
};

struct CallResult {
    CallStatus status{CallStatus::kSuccess};
    Gas gas_used{0};
    //! Diagnostic for failed calls
    std::string message;

    bool success() const noexcept { return status == CallStatus::kSuccess; }
};

//! Execution environment exposed to running bytecode. The current address is the last one of the call stack.
class Host {
  public:
    virtual ~Host() = default;

    virtual Slot current_slot() const = 0;
    virtual const std::vector<Address>& call_stack() const = 0;
    virtual Amount gas_price() const = 0;

    virtual std::optional<Amount> get_balance(const Address& address) const = 0;

    virtual std::optional<Bytes> get_data(const Bytes& key) const = 0;
    virtual void set_data(const Bytes& key, Bytes value) = 0;
    virtual void delete_data(const Bytes& key) = 0;

    //! Move parallel coins from the current address, false on insufficient balance
    virtual bool transfer_coins(const Address& to, Amount amount) = 0;

    //! Deploy bytecode at a fresh address, charging nothing
    virtual Address create_sc(Bytes bytecode) = 0;

    //! Call a function of another smart contract, effects of a failed call are reverted
    virtual CallResult call(const Address& target, std::string_view function, ByteView parameter, Gas max_gas,
                            Amount coins) = 0;

    virtual void emit_event(std::string data) = 0;
};

//! \brief Bytecode interpreter.
//! \remarks Implementations must be callable concurrently from several threads: read-only requests run on the
//! calling threads while the worker executes slots.
class VirtualMachine {
  public:
    virtual ~VirtualMachine() = default;

    virtual CallResult run_main(Host& host, ByteView bytecode, Gas max_gas) = 0;

    virtual CallResult run_function(Host& host, ByteView bytecode, std::string_view function, ByteView parameter,
                                    Gas max_gas) = 0;
};

}  // namespace cocoon::execution
