// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/core/types/hash.hpp>

namespace cocoon {

//! Transfer of parallel coins from the sender to the recipient
struct Transaction {
    Address recipient;
    Amount amount;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

//! Purchase of staking rolls paid with parallel coins
struct RollBuy {
    RollCount roll_count{0};

    friend bool operator==(const RollBuy&, const RollBuy&) = default;
};

//! Sale of staking rolls credited in parallel coins
struct RollSell {
    RollCount roll_count{0};

    friend bool operator==(const RollSell&, const RollSell&) = default;
};

//! Execution of the main entrypoint of a bytecode module on behalf of the sender
struct ExecuteSC {
    Bytes bytecode;
    Gas max_gas{0};
    Amount gas_price;

    friend bool operator==(const ExecuteSC&, const ExecuteSC&) = default;
};

//! Call of a function exported by an existing smart contract
struct CallSC {
    Address target;
    std::string function;
    Bytes parameter;
    Gas max_gas{0};
    Amount sequential_coins;
    Amount parallel_coins;
    Amount gas_price;

    friend bool operator==(const CallSC&, const CallSC&) = default;
};

using OperationPayload = std::variant<Transaction, RollBuy, RollSell, ExecuteSC, CallSC>;

struct Operation {
    OperationId id;
    Address sender;
    Amount fee;
    Period expire_period{0};
    OperationPayload payload;

    //! Gas booked by the operation in its block, zero for operations not running bytecode
    Gas max_gas() const;

    //! Price of one gas unit, zero for operations not running bytecode
    Amount gas_price() const;

    std::string_view type_name() const;

    friend bool operator==(const Operation&, const Operation&) = default;
};

}  // namespace cocoon
