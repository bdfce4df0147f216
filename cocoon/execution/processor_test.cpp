// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "processor.hpp"

#include <stdexcept>

#include <catch2/catch.hpp>

#include <cocoon/execution/execution_context.hpp>
#include <cocoon/execution/test_util/sample_blocks.hpp>
#include <cocoon/execution/test_util/scripted_vm.hpp>
#include <cocoon/infra/test_util/log.hpp>

namespace cocoon::execution {

using namespace test_util;

struct ProcessorTest {
    ProcessorTest() {
        add_genesis_account(settings, alice, coins(100), coins(10));
    }

    ExecutionOutput execute(const Slot& slot, const BlockHandle* block) {
        const auto final_state{std::make_shared<const FinalState>(settings.final_state_config(),
                                                                  settings.initial_ledger, settings.initial_rolls)};
        ExecutionProcessor processor{settings, vm};
        return processor.execute_slot(slot, block, StateView{final_state});
    }

    static Amount parallel_of(const ExecutionOutput& output, const Address& address) {
        return output.state_changes.ledger_changes.at(address).parallel_balance.value();
    }

    cocoon::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    ExecutionSettings settings{make_test_settings()};
    ScriptedVm vm;
    Storage storage;
    const Address alice{make_address(1)};
    const Address bob{make_address(2)};
    const Address creator{make_address(3)};
    const Slot slot{1, 0};
};

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor miss slot", "[execution][processor]") {
    const auto output{execute(slot, nullptr)};
    CHECK(output.slot == slot);
    CHECK_FALSE(output.block_id);
    CHECK(output.state_changes.empty());
    CHECK(output.events.empty());
    CHECK(output.usage == ExecutionUsage{});
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor transfers", "[execution][processor]") {
    const auto transfer{make_transfer(1, alice, bob, coins(30), coins(1))};
    const auto overspend{make_transfer(2, alice, bob, coins(80))};
    const auto expired{make_transfer(3, alice, bob, coins(1), Amount{}, /*expire_period=*/0)};
    const auto block{make_block_handle(storage, 1, slot, creator, {transfer, overspend, transfer, expired})};

    const auto output{execute(slot, &block)};
    CHECK(output.block_id == block.id);
    CHECK(parallel_of(output, alice) == coins(69));
    CHECK(parallel_of(output, bob) == coins(30));
    CHECK(parallel_of(output, creator) == coins(1));
    CHECK(output.usage.executed_ops == 1);
    CHECK(output.usage.rejected_ops == 3);
    CHECK(output.state_changes.executed_ops.size() == 1);
    CHECK(output.state_changes.executed_ops.contains(transfer.id));
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor rejects unpayable fees", "[execution][processor]") {
    const auto unpayable{make_transfer(1, bob, alice, Amount{}, coins(1))};
    const auto missing_id{make_operation_id(42)};
    auto block{make_block_handle(storage, 1, slot, creator, {unpayable})};

    SECTION("fee above balance") {
        const auto output{execute(slot, &block)};
        CHECK(output.usage.rejected_ops == 1);
        CHECK(output.state_changes.ledger_changes.empty());
        CHECK(output.state_changes.executed_ops.empty());
    }

    SECTION("operation missing from storage") {
        Block with_missing{*block.storage.get_block(block.id)};
        with_missing.id = make_block_id(2);
        with_missing.operations = {missing_id};
        Storage handle{storage.clone_without_refs()};
        handle.store_block(with_missing);
        const BlockHandle missing_block{with_missing.id, handle};
        const auto output{execute(slot, &missing_block)};
        CHECK(output.usage.rejected_ops == 1);
    }
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor block reward", "[execution][processor]") {
    settings.block_reward = coins(10);
    const Endorsement first{.id = make_endorsement_id(1), .slot = Slot{0, 1}, .index = 0,
                            .creator = make_address(7), .endorsed_block = make_block_id(9)};
    const Endorsement second{.id = make_endorsement_id(2), .slot = Slot{0, 1}, .index = 1,
                             .creator = make_address(8), .endorsed_block = make_block_id(9)};
    const auto block{make_block_handle(storage, 1, slot, creator, {}, {first, second})};

    const auto output{execute(slot, &block)};
    const auto share{Amount::from_raw(3'333'333'333)};
    CHECK(parallel_of(output, creator) == Amount::from_raw(3'333'333'334));
    CHECK(parallel_of(output, make_address(7)) == share);
    CHECK(parallel_of(output, make_address(8)) == share);
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor rolls", "[execution][processor]") {
    const auto block{make_block_handle(storage, 1, slot, creator,
                                       {make_roll_buy(1, alice, 1), make_roll_buy(2, alice, 1),
                                        make_roll_sell(3, alice, 1), make_roll_sell(4, alice, 1)})};

    const auto output{execute(slot, &block)};
    CHECK(output.usage.executed_ops == 2);
    CHECK(output.usage.rejected_ops == 2);
    CHECK(parallel_of(output, alice) == coins(100));
    CHECK(output.state_changes.roll_changes.at(alice) == 0);
    CHECK(output.state_changes.executed_ops.contains(make_operation_id(1)));
    CHECK(output.state_changes.executed_ops.contains(make_operation_id(3)));
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor smart contracts", "[execution][processor]") {
    const auto gas_price{*Amount::from_string("0.1")};

    SECTION("successful execution") {
        const auto op{make_execute_sc(1, alice, "set k v;emit hi", 10, gas_price)};
        const auto block{make_block_handle(storage, 1, slot, creator, {op})};
        const auto output{execute(slot, &block)};

        const auto& alice_changes{output.state_changes.ledger_changes.at(alice)};
        CHECK(alice_changes.datastore.at(to_bytes("k")) == to_bytes("v"));
        CHECK(alice_changes.sequential_balance == coins(9));
        CHECK(output.state_changes.ledger_changes.at(creator).sequential_balance == coins(1));
        CHECK(output.usage.gas_used == 10);
        REQUIRE(output.events.size() == 1);
        const auto& context{output.events[0].context};
        CHECK(output.events[0].data == "hi");
        CHECK(context.call_stack == std::vector<Address>{alice});
        CHECK(context.origin_operation_id == op.id);
        CHECK(context.block_id == block.id);
        CHECK_FALSE(context.is_error);
        CHECK_FALSE(context.is_final);
    }

    SECTION("trap reverts effects but keeps fees") {
        const auto op{make_execute_sc(1, alice, "set x y;emit lost;trap boom", 10, gas_price, coins(2))};
        const auto block{make_block_handle(storage, 1, slot, creator, {op})};
        const auto output{execute(slot, &block)};

        const auto& alice_changes{output.state_changes.ledger_changes.at(alice)};
        CHECK(alice_changes.datastore.empty());
        CHECK(alice_changes.parallel_balance == coins(98));
        CHECK(alice_changes.sequential_balance == coins(9));
        CHECK(output.state_changes.executed_ops.contains(op.id));
        CHECK(output.usage.executed_ops == 1);
        REQUIRE(output.events.size() == 1);
        CHECK(output.events[0].context.is_error);
        CHECK(output.events[0].context.index_in_slot == 0);
    }

    SECTION("out of gas") {
        const auto op{make_execute_sc(1, alice, "gas 100", 5)};
        const auto block{make_block_handle(storage, 1, slot, creator, {op})};
        const auto output{execute(slot, &block)};
        REQUIRE(output.events.size() == 1);
        CHECK(output.events[0].context.is_error);
        CHECK(output.usage.executed_ops == 1);
    }

    SECTION("call to a missing contract") {
        const auto op{make_call_sc(1, alice, make_address(99), "main", 10, coins(5))};
        const auto block{make_block_handle(storage, 1, slot, creator, {op})};
        const auto output{execute(slot, &block)};
        REQUIRE(output.events.size() == 1);
        CHECK(output.events[0].context.is_error);
        CHECK_FALSE(output.state_changes.ledger_changes.contains(make_address(99)));
    }

    SECTION("deploy then call") {
        const Address contract{ExecutionContext::derive_sc_address(slot, 0, false)};
        const auto deploy{make_execute_sc(1, alice, "deploy main:emit called;set n 1", 10)};
        const auto call{make_call_sc(2, alice, contract, "main", 10, coins(5))};
        const auto block{make_block_handle(storage, 1, slot, creator, {deploy, call})};
        const auto output{execute(slot, &block)};

        REQUIRE(output.events.size() == 2);
        CHECK(output.events[0].data == contract.to_hex());
        CHECK(output.events[1].data == "called");
        CHECK(output.events[1].context.call_stack == std::vector<Address>{alice, contract});
        CHECK(output.events[1].context.index_in_slot == 1);
        const auto& contract_changes{output.state_changes.ledger_changes.at(contract)};
        CHECK(contract_changes.parallel_balance == coins(5));
        CHECK(contract_changes.datastore.at(to_bytes("n")) == to_bytes("1"));
        CHECK(contract_changes.bytecode == to_bytes("main:emit called;set n 1"));
    }

    SECTION("block gas limit") {
        const auto op{make_execute_sc(1, alice, "emit big", settings.max_gas_per_block + 1)};
        const auto block{make_block_handle(storage, 1, slot, creator, {op})};
        const auto output{execute(slot, &block)};
        CHECK(output.usage.rejected_ops == 1);
        CHECK(output.events.empty());
    }
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor is deterministic", "[execution][processor]") {
    const auto block{make_block_handle(storage, 1, slot, creator,
                                       {make_transfer(1, alice, bob, coins(3)),
                                        make_execute_sc(2, alice, "deploy f:emit x", 10),
                                        make_roll_buy(3, alice, 1)})};
    CHECK(execute(slot, &block) == execute(slot, &block));
}

TEST_CASE_METHOD(ProcessorTest, "ExecutionProcessor missing block payload", "[execution][processor]") {
    const BlockHandle unknown{make_block_id(99), storage.clone_without_refs()};
    CHECK_THROWS_AS(execute(slot, &unknown), std::logic_error);

    const auto misplaced{make_block_handle(storage, 1, Slot{2, 0}, creator, {})};
    CHECK_THROWS_AS(execute(slot, &misplaced), std::logic_error);
}

}  // namespace cocoon::execution
