// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/state/final_state.hpp>
#include <cocoon/core/state/ledger_entry.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>

namespace cocoon::execution {

struct ExecutionSettings {
    uint8_t thread_count{32};
    uint64_t periods_per_cycle{128};
    //! Price of one roll in parallel coins
    Amount roll_price{Amount::from_raw(100 * kAmountDecimalFactor)};
    //! Coins minted for each produced block
    Amount block_reward{Amount::from_raw(300'000'000)};
    Gas max_gas_per_block{1'000'000'000};
    Gas max_read_only_gas{100'000'000};
    size_t cycle_history_length{6};
    //! Re-execute every speculatively executed slot upon finalization and compare the outputs
    bool verify_determinism{true};
    OrderedMap<Address, LedgerEntry> initial_ledger;
    RollMap initial_rolls;

    //! \throws std::invalid_argument if any setting is out of range
    void validate() const;

    FinalStateConfig final_state_config() const {
        return FinalStateConfig{
            .thread_count = thread_count,
            .periods_per_cycle = periods_per_cycle,
            .cycle_history_length = cycle_history_length,
        };
    }

    std::string to_string() const;
};

}  // namespace cocoon::execution
