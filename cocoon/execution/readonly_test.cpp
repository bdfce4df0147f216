// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "readonly.hpp"

#include <catch2/catch.hpp>

#include <cocoon/execution/test_util/sample_blocks.hpp>
#include <cocoon/execution/test_util/scripted_vm.hpp>
#include <cocoon/infra/test_util/log.hpp>

namespace cocoon::execution {

using namespace test_util;

TEST_CASE("ReadOnlyExecutor", "[execution][readonly]") {
    cocoon::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const Address alice{make_address(1)};
    const Address contract{make_address(2)};
    const Address fresh_contract{make_address(3)};

    auto settings{make_test_settings()};
    add_genesis_account(settings, alice, coins(100));
    settings.initial_ledger[contract].bytecode = to_bytes("get:emit value;set seen 1|loop:gas 1000|fail:trap nope");

    // The Candidate view knows a contract the Final view does not
    auto speculative{std::make_shared<ExecutionOutput>()};
    speculative->slot = Slot{1, 0};
    speculative->state_changes.ledger_changes[fresh_contract].bytecode = to_bytes("hello:emit fresh");
    const ExecutionSnapshot snapshot{
        .final_state = std::make_shared<const FinalState>(settings.final_state_config(), settings.initial_ledger,
                                                          settings.initial_rolls),
        .history = std::make_shared<const ActiveHistory>(ActiveHistory{speculative}),
    };

    ScriptedVm vm;
    const ReadOnlyExecutor executor{settings, vm};

    auto call = [&](const Address& target, std::string function, Gas max_gas = 100) {
        return ReadOnlyExecutionRequest{
            .max_gas = max_gas,
            .simulated_gas_price = Amount{},
            .target = FunctionCall{.target = target, .function = std::move(function), .parameter = {}},
            .call_stack = {alice},
            .is_final = false,
        };
    };

    SECTION("successful call leaves the snapshot untouched") {
        const auto result{executor.execute(call(contract, "get"), snapshot)};
        REQUIRE(result);
        CHECK(result->slot == Slot{1, 1});
        CHECK_FALSE(result->block_id);
        CHECK(result->usage.gas_used == 2);
        REQUIRE(result->events.size() == 1);
        CHECK(result->events[0].data == "value");
        CHECK(result->events[0].context.read_only);
        CHECK(result->events[0].context.call_stack == std::vector<Address>{alice, contract});
        CHECK(result->state_changes.ledger_changes.at(contract).datastore.at(to_bytes("seen")) == to_bytes("1"));

        CHECK_FALSE(snapshot.candidate_view().get_data_entry(contract, to_bytes("seen")));
        CHECK(snapshot.candidate_view().get_filtered_events({}).empty());
    }

    SECTION("bytecode execution") {
        const ReadOnlyExecutionRequest request{
            .max_gas = 100,
            .simulated_gas_price = Amount{},
            .target = BytecodeExecution{.bytecode = to_bytes("set mine 1;emit done")},
            .call_stack = {alice},
            .is_final = true,
        };
        const auto result{executor.execute(request, snapshot)};
        REQUIRE(result);
        CHECK(result->slot == Slot{1, 0});
        CHECK(result->state_changes.ledger_changes.at(alice).datastore.contains(to_bytes("mine")));
    }

    SECTION("view selection") {
        auto request{call(fresh_contract, "hello")};
        CHECK(executor.execute(request, snapshot));
        request.is_final = true;
        const auto result{executor.execute(request, snapshot)};
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ExecutionErrorCode::kTargetNotFound);
    }

    SECTION("nonexistent target") {
        const auto result{executor.execute(call(make_address(42), "get"), snapshot)};
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ExecutionErrorCode::kTargetNotFound);
        CHECK_FALSE(snapshot.candidate_view().exists(make_address(42)));
    }

    SECTION("resource budget") {
        const auto over_limit{executor.execute(call(contract, "get", settings.max_read_only_gas + 1), snapshot)};
        REQUIRE_FALSE(over_limit);
        CHECK(over_limit.error().code == ExecutionErrorCode::kResourceExhausted);

        const auto out_of_gas{executor.execute(call(contract, "loop"), snapshot)};
        REQUIRE_FALSE(out_of_gas);
        CHECK(out_of_gas.error().code == ExecutionErrorCode::kResourceExhausted);
    }

    SECTION("runtime trap") {
        const auto trap{executor.execute(call(contract, "fail"), snapshot)};
        REQUIRE_FALSE(trap);
        CHECK(trap.error().code == ExecutionErrorCode::kRuntimeTrap);
        CHECK(trap.error().message == "nope");

        const auto unknown_function{executor.execute(call(contract, "missing"), snapshot)};
        REQUIRE_FALSE(unknown_function);
        CHECK(unknown_function.error().code == ExecutionErrorCode::kRuntimeTrap);
    }

    SECTION("empty call stack") {
        auto request{call(contract, "get")};
        request.call_stack.clear();
        const auto result{executor.execute(request, snapshot)};
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ExecutionErrorCode::kInvalidRequest);
    }
}

}  // namespace cocoon::execution
