// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <cocoon/infra/common/ensure.hpp>

namespace cocoon::execution {

void ExecutionSettings::validate() const {
    ensure_pre_condition(thread_count > 0, [&]() { return "thread_count must be positive"; });
    ensure_pre_condition(periods_per_cycle > 0, [&]() { return "periods_per_cycle must be positive"; });
    ensure_pre_condition(cycle_history_length > 0, [&]() { return "cycle_history_length must be positive"; });
    ensure_pre_condition(max_gas_per_block > 0, [&]() { return "max_gas_per_block must be positive"; });
    ensure_pre_condition(max_read_only_gas > 0, [&]() { return "max_read_only_gas must be positive"; });
    ensure_pre_condition(!roll_price.is_zero(), [&]() { return "roll_price must be positive"; });
}

std::string ExecutionSettings::to_string() const {
    return "threads=" + std::to_string(thread_count) +
           " periods_per_cycle=" + std::to_string(periods_per_cycle) +
           " roll_price=" + roll_price.to_string() +
           " block_reward=" + block_reward.to_string() +
           " max_gas_per_block=" + std::to_string(max_gas_per_block) +
           " max_read_only_gas=" + std::to_string(max_read_only_gas) +
           " cycle_history_length=" + std::to_string(cycle_history_length) +
           " verify_determinism=" + (verify_determinism ? "true" : "false") +
           " genesis_accounts=" + std::to_string(initial_ledger.size());
}

}  // namespace cocoon::execution
