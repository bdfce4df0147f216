// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>

#include <cocoon/core/common/random_number.hpp>
#include <cocoon/core/storage/storage.hpp>
#include <cocoon/execution/controller.hpp>
#include <cocoon/infra/common/log.hpp>

#include "common.hpp"

using namespace cocoon;
using namespace cocoon::execution;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t kGenesisCoins{1'000'000};

//! Shape of the generated chain
struct ReplaySettings {
    uint64_t periods{20};
    uint64_t accounts{8};
    uint64_t ops_per_block{4};
    //! Number of slots a block stays in the blockclique before being finalized
    uint64_t finality_lag{8};
    //! Replace the latest candidate block every N slots (0 disables reorgs)
    uint64_t reorg_every{5};
    uint64_t miss_percent{10};
    uint64_t seed{42};
};

//! Virtual machine of a workload made of coin transfers only
class NoBytecodeVm : public VirtualMachine {
  public:
    CallResult run_main(Host&, ByteView, Gas) override { return unavailable(); }
    CallResult run_function(Host&, ByteView, std::string_view, ByteView, Gas) override { return unavailable(); }

  private:
    static CallResult unavailable() { return CallResult{CallStatus::kTrap, 0, "bytecode execution not available"}; }
};

template <class T>
T numbered(uint8_t tag, uint64_t number) {
    T id;
    id.bytes[0] = tag;
    for (size_t i{0}; i < sizeof(number); ++i) {
        id.bytes[kHashLength - 1 - i] = static_cast<uint8_t>(number >> (8 * i));
    }
    return id;
}

class Workload {
  public:
    explicit Workload(const ReplaySettings& settings)
        : settings_{settings}, random_{0, std::numeric_limits<uint64_t>::max(), settings.seed} {}

    Address account(uint64_t index) const { return numbered<Address>(0x0a, index); }

    bool miss() { return random_.generate_one() % 100 < settings_.miss_percent; }

    BlockHandle make_block(const Storage& storage, Slot slot) {
        std::vector<Operation> operations;
        for (uint64_t i{0}; i < settings_.ops_per_block; ++i) {
            const uint64_t from{random_.generate_one() % settings_.accounts};
            const uint64_t to{random_.generate_one() % settings_.accounts};
            operations.push_back(Operation{
                .id = numbered<OperationId>(0x0c, ++operation_count_),
                .sender = account(from),
                .fee = Amount{},
                .expire_period = slot.period + 10,
                .payload = Transaction{.recipient = account(to),
                                       .amount = *Amount::from_coins(1 + random_.generate_one() % 5)},
            });
        }

        Block block{
            .id = numbered<BlockId>(0x0b, ++block_count_),
            .slot = slot,
            .creator = account(random_.generate_one() % settings_.accounts),
            .operations = {},
            .endorsements = {},
        };
        last_operations_.clear();
        for (const auto& operation : operations) {
            block.operations.push_back(operation.id);
            last_operations_.insert(operation.id);
        }

        Storage handle{storage.clone_without_refs()};
        handle.store_operations(std::move(operations));
        const BlockId id{block.id};
        handle.store_block(std::move(block));
        return BlockHandle{id, std::move(handle)};
    }

    //! Operations of the most recently generated block
    const OrderedSet<OperationId>& last_operations() const { return last_operations_; }
    uint64_t operation_count() const { return operation_count_; }

  private:
    const ReplaySettings& settings_;
    RandomNumber random_;
    uint64_t operation_count_{0};
    uint64_t block_count_{0};
    OrderedSet<OperationId> last_operations_;
};

template <class Predicate>
bool wait_for(api::ExecutionController& controller, Predicate condition, std::chrono::milliseconds timeout = 10s) {
    const auto deadline{std::chrono::steady_clock::now() + timeout};
    while (!condition()) {
        if (controller.is_faulted() || std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

uint64_t slot_index(const Slot& slot, uint8_t thread_count) {
    return slot.period * thread_count + slot.thread;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Replay a generated chain of coin transfers through the execution worker"};

    log::Settings log_settings;
    ExecutionSettings settings;
    ReplaySettings replay;
    cmd::add_logging_options(app, log_settings);
    cmd::add_execution_options(app, settings);

    app.add_option("--periods", replay.periods, "Number of periods to produce")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--accounts", replay.accounts, "Number of genesis accounts exchanging coins")
        ->capture_default_str()
        ->check(CLI::Range(1, 100'000));
    app.add_option("--ops.per.block", replay.ops_per_block, "Number of transfers in each block")
        ->capture_default_str();
    app.add_option("--finality.lag", replay.finality_lag, "Number of slots before a block becomes final")
        ->capture_default_str();
    app.add_option("--reorg.every", replay.reorg_every, "Replace the latest candidate block every N slots")
        ->capture_default_str();
    app.add_option("--miss.percent", replay.miss_percent, "Probability of a slot to be missed")
        ->capture_default_str()
        ->check(CLI::Range(0, 99));
    app.add_option("--seed", replay.seed, "Seed of the workload generator")->capture_default_str();

    CLI11_PARSE(app, argc, argv);

    log::init(log_settings);

    try {
        Workload workload{replay};
        for (uint64_t i{0}; i < replay.accounts; ++i) {
            settings.initial_ledger[workload.account(i)].parallel_balance = *Amount::from_coins(kGenesisCoins);
        }

        auto handles{start_execution_worker(settings, std::make_shared<NoBytecodeVm>(), [](const std::string& reason) {
            log::Critical("Execution halted", {"reason", reason});
        })};
        auto& controller{*handles.controller};

        const auto start_time{std::chrono::steady_clock::now()};
        Storage storage;
        BlockMap blockclique;
        Slot slot{Slot::last_genesis_slot(settings.thread_count)};
        uint64_t produced_blocks{0}, final_blocks{0}, reorgs{0};

        const uint64_t slot_count{replay.periods * settings.thread_count};
        for (uint64_t i{1}; i <= slot_count; ++i) {
            slot = slot.next(settings.thread_count);
            bool produced{false};
            if (!workload.miss()) {
                blockclique.insert_or_assign(slot, workload.make_block(storage, slot));
                produced = true;
                ++produced_blocks;
            }
            if (replay.reorg_every > 0 && i % replay.reorg_every == 0 && !blockclique.empty()) {
                auto& [reorg_slot, block] = *blockclique.rbegin();
                block = workload.make_block(storage, reorg_slot);
                produced = true;
                ++reorgs;
            }

            BlockMap finalized;
            const uint64_t current{slot_index(slot, settings.thread_count)};
            while (!blockclique.empty() &&
                   slot_index(blockclique.begin()->first, settings.thread_count) + replay.finality_lag <= current) {
                auto oldest{blockclique.begin()};
                finalized.emplace(oldest->first, std::move(oldest->second));
                blockclique.erase(oldest);
            }
            final_blocks += finalized.size();
            controller.update_blockclique_status(std::move(finalized), blockclique);

            if (produced && !wait_for(controller, [&] {
                    return controller.unexecuted_ops_among(workload.last_operations()).empty();
                })) {
                log::Error("Replay stalled", {"slot", slot.to_string()});
                return 1;
            }
            log::Debug("Replayed", {"slot", slot.to_string(), "candidate_blocks", std::to_string(blockclique.size())});
        }

        // A closing period with a block in every thread proves the trailing misses, so that every produced
        // slot can become final
        for (uint8_t thread{0}; thread < settings.thread_count; ++thread) {
            slot = slot.next(settings.thread_count);
            blockclique.insert_or_assign(slot, workload.make_block(storage, slot));
            ++produced_blocks;
        }
        controller.update_blockclique_status({}, blockclique);
        if (!wait_for(controller, [&] { return controller.unexecuted_ops_among(workload.last_operations()).empty(); })) {
            log::Error("Replay stalled", {"slot", slot.to_string()});
            return 1;
        }
        final_blocks += blockclique.size();
        controller.update_blockclique_status(std::move(blockclique), {});

        std::vector<Address> accounts;
        for (uint64_t i{0}; i < replay.accounts; ++i) {
            accounts.push_back(workload.account(i));
        }
        const bool settled{wait_for(controller, [&] {
            for (const auto& [final_balance, active_balance] :
                 controller.get_final_and_active_parallel_balance(accounts)) {
                if (final_balance != active_balance) return false;
            }
            return true;
        })};
        if (!settled) {
            log::Error("Finalization did not complete", {"faulted", controller.is_faulted() ? "true" : "false"});
            return 1;
        }

        Amount supply;
        for (const auto& [final_balance, _] : controller.get_final_and_active_parallel_balance(accounts)) {
            supply = supply.saturating_add(final_balance.value_or(Amount{}));
        }
        const auto genesis_supply{Amount::from_coins(kGenesisCoins)->checked_mul(replay.accounts)};
        const auto minted{settings.block_reward.checked_mul(final_blocks)};
        const auto expected_supply{genesis_supply && minted ? genesis_supply->checked_add(*minted) : std::nullopt};

        const auto elapsed{std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                                  start_time)};
        log::Info("Replay completed",
                  {"slots", std::to_string(slot_count), "blocks", std::to_string(produced_blocks), "final_blocks",
                   std::to_string(final_blocks), "reorgs", std::to_string(reorgs), "operations",
                   std::to_string(workload.operation_count()), "elapsed", std::to_string(elapsed.count()) + "ms"});
        std::cout << "supply " << supply << " expected "
                  << (expected_supply ? expected_supply->to_string() : std::string{"overflow"}) << "\n";

        handles.manager->stop();
        return expected_supply == supply ? 0 : 2;
    } catch (const std::exception& ex) {
        log::Critical("Replay failed", {"error", ex.what()});
        return -1;
    }
}
