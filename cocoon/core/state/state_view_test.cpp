// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "state_view.hpp"

#include <catch2/catch.hpp>

#include <cocoon/core/test_util/sample_data.hpp>

namespace cocoon {

using namespace test_util;

TEST_CASE("StateView resolves history over final", "[core][state][view]") {
    const Address alice{make_address(1)};
    const Address bob{make_address(2)};
    const Address carol{make_address(3)};

    OrderedMap<Address, LedgerEntry> ledger;
    ledger[alice].parallel_balance = coins(10);
    ledger[alice].datastore[to_bytes("a")] = to_bytes("1");
    ledger[alice].datastore[to_bytes("b")] = to_bytes("2");
    const auto final_state{std::make_shared<const FinalState>(
        FinalStateConfig{.thread_count = 2, .periods_per_cycle = 4, .cycle_history_length = 2}, ledger,
        RollMap{{alice, 1}})};

    auto first{std::make_shared<ExecutionOutput>()};
    first->slot = Slot{1, 0};
    first->state_changes.ledger_changes[alice].parallel_balance = coins(6);
    first->state_changes.ledger_changes[alice].datastore[to_bytes("a")] = std::nullopt;
    first->state_changes.ledger_changes[bob].datastore[to_bytes("x")] = to_bytes("y");
    first->state_changes.executed_ops[make_operation_id(1)] = 10;
    first->events.push_back(SCOutputEvent{.context = {.slot = Slot{1, 0}, .call_stack = {alice}}, .data = "e1"});

    auto second{std::make_shared<ExecutionOutput>()};
    second->slot = Slot{1, 1};
    second->state_changes.ledger_changes[alice].sequential_balance = coins(2);
    second->state_changes.ledger_changes[alice].datastore[to_bytes("c")] = to_bytes("3");
    second->state_changes.roll_changes[alice] = 4;

    const ActiveHistory history{first, second};
    const StateView final_view{final_state};
    const StateView candidate_view{final_state, history};

    CHECK(final_view.slot() == Slot{0, 1});
    CHECK(candidate_view.slot() == Slot{1, 1});

    SECTION("balances") {
        CHECK(final_view.get_parallel_balance(alice) == coins(10));
        CHECK(candidate_view.get_parallel_balance(alice) == coins(6));
        CHECK(candidate_view.get_sequential_balance(alice) == coins(2));
        CHECK_FALSE(final_view.get_parallel_balance(bob));
        CHECK(candidate_view.get_parallel_balance(bob) == Amount{});
        CHECK_FALSE(candidate_view.get_parallel_balance(carol));
        CHECK(candidate_view.exists(bob));
        CHECK_FALSE(final_view.exists(bob));
    }

    SECTION("datastore") {
        CHECK(final_view.get_data_entry(alice, to_bytes("a")) == to_bytes("1"));
        CHECK_FALSE(candidate_view.get_data_entry(alice, to_bytes("a")));
        CHECK(candidate_view.get_data_entry(bob, to_bytes("x")) == to_bytes("y"));
        CHECK(final_view.get_datastore_keys(alice) == OrderedSet<Bytes>{to_bytes("a"), to_bytes("b")});
        CHECK(candidate_view.get_datastore_keys(alice) == OrderedSet<Bytes>{to_bytes("b"), to_bytes("c")});
        CHECK(candidate_view.get_datastore_keys(carol).empty());
    }

    SECTION("rolls and executed operations") {
        CHECK(final_view.get_rolls(alice) == 1);
        CHECK(candidate_view.get_rolls(alice) == 4);
        CHECK_FALSE(final_view.is_op_executed(make_operation_id(1)));
        CHECK(candidate_view.is_op_executed(make_operation_id(1)));
    }

    SECTION("events") {
        CHECK(final_view.get_filtered_events({}).empty());
        const auto events{candidate_view.get_filtered_events({.emitter_address = alice})};
        REQUIRE(events.size() == 1);
        CHECK(events[0].data == "e1");
        CHECK(candidate_view.get_filtered_events({.is_final = true}).empty());
        CHECK(candidate_view.get_filtered_events({.start = Slot{1, 1}}).empty());
    }
}

}  // namespace cocoon
