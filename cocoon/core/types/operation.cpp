// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "operation.hpp"

#include <cocoon/core/common/overloaded.hpp>

namespace cocoon {

Gas Operation::max_gas() const {
    return std::visit(Overloaded{
                          [](const ExecuteSC& op) { return op.max_gas; },
                          [](const CallSC& op) { return op.max_gas; },
                          [](const auto&) -> Gas { return 0; },
                      },
                      payload);
}

Amount Operation::gas_price() const {
    return std::visit(Overloaded{
                          [](const ExecuteSC& op) { return op.gas_price; },
                          [](const CallSC& op) { return op.gas_price; },
                          [](const auto&) { return Amount{}; },
                      },
                      payload);
}

std::string_view Operation::type_name() const {
    return std::visit(Overloaded{
                          [](const Transaction&) { return "Transaction"sv; },
                          [](const RollBuy&) { return "RollBuy"sv; },
                          [](const RollSell&) { return "RollSell"sv; },
                          [](const ExecuteSC&) { return "ExecuteSC"sv; },
                          [](const CallSC&) { return "CallSC"sv; },
                      },
                      payload);
}

}  // namespace cocoon
