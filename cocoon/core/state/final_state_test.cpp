// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "final_state.hpp"

#include <stdexcept>
#include <type_traits>

#include <catch2/catch.hpp>

#include <cocoon/core/test_util/sample_data.hpp>

namespace cocoon {

using namespace test_util;

static constexpr FinalStateConfig kConfig{.thread_count = 2, .periods_per_cycle = 2, .cycle_history_length = 2};

static std::shared_ptr<const FinalState> make_genesis() {
    OrderedMap<Address, LedgerEntry> ledger;
    ledger[make_address(1)].parallel_balance = coins(10);
    ledger[make_address(2)].parallel_balance = coins(20);
    return std::make_shared<const FinalState>(kConfig, ledger, RollMap{{make_address(1), 5}});
}

static ExecutionOutput empty_output(Slot slot) {
    return ExecutionOutput{.slot = slot, .block_id = {}, .state_changes = {}, .events = {}, .usage = {}};
}

TEST_CASE("FinalState genesis", "[core][state][final]") {
    const auto genesis{make_genesis()};
    CHECK(genesis->slot() == Slot{0, 1});
    CHECK(genesis->ledger_size() == 2);
    CHECK(genesis->get_entry(make_address(1))->parallel_balance == coins(10));
    CHECK_FALSE(genesis->get_entry(make_address(3)));
    CHECK(genesis->get_rolls(make_address(1)) == 5);
    CHECK(genesis->get_rolls(make_address(2)) == 0);
    CHECK_FALSE(genesis->get_cycle_rolls(0));
}

TEST_CASE("FinalState apply", "[core][state][final]") {
    const auto genesis{make_genesis()};

    auto output{empty_output(Slot{1, 0})};
    output.block_id = make_block_id(1);
    output.state_changes.ledger_changes[make_address(1)].parallel_balance = coins(4);
    output.state_changes.ledger_changes[make_address(3)].datastore[to_bytes("k")] = to_bytes("v");
    output.state_changes.roll_changes[make_address(1)] = 0;
    output.state_changes.executed_ops[make_operation_id(1)] = 1;
    output.state_changes.executed_ops[make_operation_id(2)] = 3;
    output.events.push_back(SCOutputEvent{.context = {.slot = Slot{1, 0}}, .data = "hello"});

    const auto next{genesis->apply(output)};

    SECTION("publishes a new version") {
        CHECK(next->slot() == Slot{1, 0});
        CHECK(next->get_entry(make_address(1))->parallel_balance == coins(4));
        CHECK(next->get_entry(make_address(3))->datastore.at(to_bytes("k")) == to_bytes("v"));
        CHECK(next->get_rolls(make_address(1)) == 0);
        CHECK(next->is_op_executed(make_operation_id(1)));
        CHECK(next->events().size() == 1);
        CHECK(next->events().query({})[0].context.is_final);
    }

    SECTION("previous version is untouched") {
        CHECK(genesis->slot() == Slot{0, 1});
        CHECK(genesis->get_entry(make_address(1))->parallel_balance == coins(10));
        CHECK_FALSE(genesis->get_entry(make_address(3)));
        CHECK(genesis->events().size() == 0);
    }

    SECTION("untouched entries are shared") {
        CHECK(next->get_entry(make_address(2)) == genesis->get_entry(make_address(2)));
        CHECK(next->get_entry(make_address(1)) != genesis->get_entry(make_address(1)));
        // Only the shards holding the two updated addresses are duplicated
        using Ledger = std::decay_t<decltype(next->ledger())>;
        CHECK(next->ledger().shared_shard_count(genesis->ledger()) >= Ledger::kShardCount - 2);
    }

    SECTION("expired executed operations are pruned") {
        auto same_expiry{empty_output(Slot{1, 1})};
        same_expiry.state_changes.executed_ops[make_operation_id(3)] = 1;
        auto later{next->apply(same_expiry)};
        CHECK(later->executed_op_count() == 3);
        later = later->apply(empty_output(Slot{2, 0}));
        CHECK_FALSE(later->is_op_executed(make_operation_id(1)));
        CHECK_FALSE(later->is_op_executed(make_operation_id(3)));
        CHECK(later->is_op_executed(make_operation_id(2)));
        CHECK(later->executed_op_count() == 1);
        CHECK(next->executed_op_count() == 2);
    }

    SECTION("slots must be consecutive") {
        CHECK_THROWS_AS(next->apply(empty_output(Slot{2, 0})), std::logic_error);
        CHECK_THROWS_AS(next->apply(empty_output(Slot{1, 0})), std::logic_error);
    }
}

TEST_CASE("FinalState cycle roll snapshots", "[core][state][final]") {
    auto state{make_genesis()};
    // Cycles are two periods long: cycle 0 ends at (1, 1), cycle 1 at (3, 1)
    for (Slot slot{1, 0}; slot <= Slot{7, 1}; slot = slot.next(kConfig.thread_count)) {
        auto output{empty_output(slot)};
        if (slot == Slot{2, 0}) {
            output.state_changes.roll_changes[make_address(2)] = 7;
        }
        state = state->apply(output);
    }

    // Only the last two completed cycles are retained
    CHECK_FALSE(state->get_cycle_rolls(0));
    CHECK_FALSE(state->get_cycle_rolls(1));
    REQUIRE(state->get_cycle_rolls(2));
    REQUIRE(state->get_cycle_rolls(3));
    CHECK(state->get_cycle_rolls(3)->at(make_address(1)) == 5);
    CHECK(state->get_cycle_rolls(3)->at(make_address(2)) == 7);
    CHECK_FALSE(state->get_cycle_rolls(4));
}

}  // namespace cocoon
