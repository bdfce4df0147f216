// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "controller.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <catch2/catch.hpp>

#include <cocoon/execution/test_util/sample_blocks.hpp>
#include <cocoon/execution/test_util/scripted_vm.hpp>
#include <cocoon/infra/test_util/log.hpp>

namespace cocoon::execution {

using namespace test_util;

struct ControllerTest {
    ControllerTest() {
        add_genesis_account(settings, alice, coins(10));
        settings.initial_ledger[contract].bytecode = to_bytes("get:emit value");
        settings.initial_ledger[contract].datastore[to_bytes("a")] = to_bytes("1");
    }

    ~ControllerTest() {
        if (handles.manager) handles.manager->stop();
    }

    api::ExecutionController& start() {
        handles = start_execution_worker(settings, std::make_shared<ScriptedVm>(),
                                         [this](const std::string& reason) {
                                             last_fault = reason;
                                             fault_count++;
                                             if (throwing_fault_handler) throw std::runtime_error{"supervisor gone"};
                                         });
        return *handles.controller;
    }

    BlockHandle block(uint64_t seed, Slot slot, std::vector<Operation> operations = {}) const {
        return make_block_handle(storage, seed, slot, creator, std::move(operations));
    }

    cocoon::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const Address alice{make_address(1)};
    const Address bob{make_address(2)};
    const Address creator{make_address(3)};
    const Address contract{make_address(4)};
    ExecutionSettings settings{make_test_settings()};
    Storage storage;
    ExecutionHandles handles;
    std::string last_fault;
    std::atomic_int fault_count{0};
    bool throwing_fault_handler{false};
};

using Balances = std::vector<api::FinalAndActive<Amount>>;

TEST_CASE_METHOD(ControllerTest, "ExecutionController transfer scenario", "[execution][controller]") {
    auto& controller{start()};
    const auto b1{block(1, Slot{1, 0}, {make_transfer(1, alice, bob, coins(10))})};

    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}});
    REQUIRE(wait_until([&] { return controller.get_final_and_active_parallel_balance({bob})[0].second; }));
    // Final balances are the genesis ones until the slot is finalized
    CHECK(controller.get_final_and_active_parallel_balance({alice, bob}) ==
          Balances{{coins(10), coins(0)}, {std::nullopt, coins(10)}});

    controller.update_blockclique_status({{Slot{1, 0}, b1}}, {});
    REQUIRE(wait_until([&] { return controller.get_final_and_active_parallel_balance({bob})[0].first; }));
    CHECK(controller.get_final_and_active_parallel_balance({alice, bob}) ==
          Balances{{coins(0), coins(0)}, {coins(10), coins(10)}});
    CHECK(controller.get_final_and_active_sequential_balance({alice, bob, make_address(99)}) ==
          Balances{{Amount{}, Amount{}}, {Amount{}, Amount{}}, {std::nullopt, std::nullopt}});

    SECTION("finalizing twice is a no-op") {
        controller.update_blockclique_status({{Slot{1, 0}, b1}}, {});
        controller.update_blockclique_status(
            {}, {{Slot{2, 0}, block(2, Slot{2, 0}, {make_transfer(2, bob, alice, coins(1))})}});
        REQUIRE(wait_until([&] { return controller.unexecuted_ops_among({make_operation_id(2)}).empty(); }));
        CHECK(controller.get_final_and_active_parallel_balance({alice, bob}) ==
              Balances{{coins(0), coins(1)}, {coins(10), coins(9)}});
    }
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController reorg scenario", "[execution][controller]") {
    auto& controller{start()};
    const auto b1{block(1, Slot{1, 0}, {make_transfer(1, alice, bob, coins(1))})};
    const auto b2{block(2, Slot{1, 1}, {make_transfer(2, alice, bob, coins(2)), make_transfer(3, alice, bob, coins(3))})};
    const auto b3{block(3, Slot{1, 1}, {make_transfer(4, alice, bob, coins(4))})};
    const OrderedSet<OperationId> b2_ops{make_operation_id(2), make_operation_id(3)};

    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}, {Slot{1, 1}, b2}});
    REQUIRE(wait_until([&] { return controller.unexecuted_ops_among(b2_ops).empty(); }));

    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}, {Slot{1, 1}, b3}});
    REQUIRE(wait_until([&] { return controller.unexecuted_ops_among({make_operation_id(4)}).empty(); }));
    CHECK(controller.unexecuted_ops_among(b2_ops) == b2_ops);
    CHECK(controller.unexecuted_ops_among({make_operation_id(1), make_operation_id(2)}) ==
          OrderedSet<OperationId>{make_operation_id(2)});
    CHECK(controller.get_final_and_active_parallel_balance({bob})[0].second == coins(5));
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController read-only scenario", "[execution][controller]") {
    auto& controller{start()};
    const auto b1{block(1, Slot{1, 0}, {make_transfer(1, alice, bob, coins(3))})};
    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}});
    REQUIRE(wait_until([&] { return controller.get_final_and_active_parallel_balance({bob})[0].second; }));

    const auto balances_before{controller.get_final_and_active_parallel_balance({alice, bob})};
    const ReadOnlyExecutionRequest missing{
        .max_gas = 100,
        .simulated_gas_price = Amount{},
        .target = FunctionCall{.target = make_address(42), .function = "get", .parameter = {}},
        .call_stack = {alice},
        .is_final = false,
    };
    const auto result{controller.execute_readonly_request(missing)};
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ExecutionErrorCode::kTargetNotFound);
    CHECK(controller.get_final_and_active_parallel_balance({alice, bob}) == balances_before);
    CHECK(controller.get_filtered_sc_output_event({}).empty());

    auto call{missing};
    call.target = FunctionCall{.target = contract, .function = "get", .parameter = {}};
    const auto success{controller.execute_readonly_request(call)};
    REQUIRE(success);
    CHECK(success->slot == Slot{1, 1});
    CHECK(success->events.size() == 1);
    CHECK(controller.get_filtered_sc_output_event({}).empty());
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController datastore and events", "[execution][controller]") {
    auto& controller{start()};
    const auto op{make_call_sc(1, alice, contract, "get", 10)};
    const auto b1{block(1, Slot{1, 0}, {make_execute_sc(2, alice, "set b 2;emit stored", 10), op})};
    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}});
    REQUIRE(wait_until([&] { return controller.get_filtered_sc_output_event({}).size() == 2; }));

    CHECK(controller.get_final_and_active_data_entry({{alice, to_bytes("b")}, {contract, to_bytes("a")}}) ==
          std::vector<api::FinalAndActive<Bytes>>{{std::nullopt, to_bytes("2")}, {to_bytes("1"), to_bytes("1")}});
    const auto [final_keys, active_keys] = controller.get_final_and_active_datastore_keys(alice);
    CHECK(final_keys.empty());
    CHECK(active_keys == OrderedSet<Bytes>{to_bytes("b")});
    CHECK(controller.get_final_and_active_datastore_keys(make_address(77)).second.empty());

    const auto by_contract{controller.get_filtered_sc_output_event({.emitter_address = contract})};
    REQUIRE(by_contract.size() == 1);
    CHECK(by_contract[0].data == "value");
    CHECK(controller.get_filtered_sc_output_event({.original_operation_id = op.id}).size() == 1);
    CHECK(controller.get_filtered_sc_output_event({.is_final = true}).empty());

    controller.update_blockclique_status({{Slot{1, 0}, b1}}, {});
    REQUIRE(wait_until([&] { return controller.get_filtered_sc_output_event({.is_final = true}).size() == 2; }));
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController cycle rolls", "[execution][controller]") {
    add_genesis_account(settings, alice, coins(1000));
    auto& controller{start()};
    const auto buy{block(1, Slot{1, 0}, {make_roll_buy(1, alice, 2)})};
    const auto end_of_cycle{block(2, Slot{3, 1})};
    const auto next_cycle{block(3, Slot{4, 0})};

    CHECK(controller.get_cycle_rolls(0).empty());
    CHECK(controller.get_cycle_rolls(1).empty());

    controller.update_blockclique_status({{Slot{1, 0}, buy}, {Slot{3, 1}, end_of_cycle}, {Slot{4, 0}, next_cycle}}, {});
    REQUIRE(wait_until([&] { return !controller.get_cycle_rolls(1).empty(); }));
    CHECK(controller.get_cycle_rolls(1) == RollMap{{alice, 2}});
    CHECK(controller.get_cycle_rolls(0).empty());
    CHECK(controller.get_cycle_rolls(2).empty());
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController clones share the worker", "[execution][controller]") {
    auto clone{start().clone()};
    handles.controller.reset();

    clone->update_blockclique_status({}, {{Slot{1, 0}, block(1, Slot{1, 0}, {make_transfer(1, alice, bob, coins(4))})}});
    REQUIRE(wait_until([&] { return clone->get_final_and_active_parallel_balance({bob})[0].second == coins(4); }));
    auto second_clone{clone->clone()};
    CHECK(second_clone->get_final_and_active_parallel_balance({bob}) ==
          clone->get_final_and_active_parallel_balance({bob}));
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController stop", "[execution][controller]") {
    auto& controller{start()};
    handles.manager->stop();
    handles.manager->stop();

    controller.update_blockclique_status({}, {{Slot{1, 0}, block(1, Slot{1, 0}, {make_transfer(1, alice, bob, coins(4))})}});
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    CHECK_FALSE(controller.get_final_and_active_parallel_balance({bob})[0].second);
    // Queries keep answering from the last published snapshot
    CHECK(controller.get_final_and_active_parallel_balance({alice})[0].second == coins(10));
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController halts on determinism violation", "[execution][controller]") {
    auto& controller{start()};
    const auto b1{block(1, Slot{1, 0}, {make_execute_sc(1, alice, "counter", 10)})};
    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}});
    controller.update_blockclique_status({{Slot{1, 0}, b1}}, {});
    REQUIRE(wait_until([&] { return fault_count == 1; }));
    CHECK(controller.is_faulted());
    CHECK(last_fault.find("Determinism violation at slot (1, 0)") != std::string::npos);
    CHECK(controller.fault_reason() == last_fault);

    const ReadOnlyExecutionRequest request{
        .max_gas = 100,
        .simulated_gas_price = Amount{},
        .target = FunctionCall{.target = contract, .function = "get", .parameter = {}},
        .call_stack = {alice},
        .is_final = false,
    };
    const auto result{controller.execute_readonly_request(request)};
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ExecutionErrorCode::kFaulted);

    // Further notifications are ignored
    controller.update_blockclique_status({}, {{Slot{2, 0}, block(2, Slot{2, 0})}});
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    CHECK(fault_count == 1);
    CHECK(controller.get_final_and_active_parallel_balance({creator})[0].second == std::nullopt);
}

TEST_CASE_METHOD(ControllerTest, "ExecutionController survives a throwing fault handler", "[execution][controller]") {
    throwing_fault_handler = true;
    auto& controller{start()};
    const auto b1{block(1, Slot{1, 0}, {make_execute_sc(1, alice, "counter", 10)})};
    controller.update_blockclique_status({}, {{Slot{1, 0}, b1}});
    controller.update_blockclique_status({{Slot{1, 0}, b1}}, {});
    REQUIRE(wait_until([&] { return fault_count == 1; }));
    REQUIRE(wait_until([&] { return controller.is_faulted(); }));
    CHECK(controller.fault_reason() == last_fault);

    // The worker thread is still alive and keeps ignoring notifications
    controller.update_blockclique_status({}, {{Slot{2, 0}, block(2, Slot{2, 0})}});
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    CHECK(fault_count == 1);
    CHECK(controller.get_final_and_active_parallel_balance({alice})[0].first == coins(10));
    CHECK_NOTHROW(handles.manager->stop());
}

TEST_CASE("start_execution_worker validates settings", "[execution][controller]") {
    auto settings{make_test_settings()};
    settings.thread_count = 0;
    CHECK_THROWS_AS(start_execution_worker(settings, std::make_shared<ScriptedVm>()), std::invalid_argument);
    CHECK_THROWS_AS(start_execution_worker(make_test_settings(), nullptr), std::invalid_argument);
}

}  // namespace cocoon::execution
