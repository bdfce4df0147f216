// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include <cocoon/core/storage/storage.hpp>
#include <cocoon/core/test_util/sample_data.hpp>
#include <cocoon/execution/block_handle.hpp>
#include <cocoon/execution/settings.hpp>

namespace cocoon::execution::test_util {

using namespace cocoon::test_util;

//! Two threads, short cycles, no block reward
inline ExecutionSettings make_test_settings() {
    ExecutionSettings settings;
    settings.thread_count = 2;
    settings.periods_per_cycle = 4;
    settings.block_reward = Amount{};
    settings.max_gas_per_block = 1'000;
    settings.max_read_only_gas = 500;
    settings.cycle_history_length = 3;
    return settings;
}

inline void add_genesis_account(ExecutionSettings& settings, const Address& address, Amount parallel,
                                Amount sequential = {}) {
    auto& entry{settings.initial_ledger[address]};
    entry.parallel_balance = parallel;
    entry.sequential_balance = sequential;
}

//! Store a block and its payloads behind a fresh handle onto storage registry
inline BlockHandle make_block_handle(const Storage& storage, uint64_t seed, Slot slot, const Address& creator,
                                     std::vector<Operation> operations, std::vector<Endorsement> endorsements = {}) {
    Block block{make_block(seed, slot, creator, operations)};
    for (const auto& endorsement : endorsements) {
        block.endorsements.push_back(endorsement.id);
    }
    Storage handle{storage.clone_without_refs()};
    handle.store_operations(std::move(operations));
    handle.store_endorsements(std::move(endorsements));
    const BlockId id{block.id};
    handle.store_block(std::move(block));
    return BlockHandle{id, std::move(handle)};
}

//! Poll condition until it holds or timeout expires
template <class Predicate>
bool wait_until(Predicate condition, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
    const auto deadline{std::chrono::steady_clock::now() + timeout};
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }
    return true;
}

}  // namespace cocoon::execution::test_util
