// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "ensure.hpp"

#include <catch2/catch.hpp>

namespace cocoon {

using Catch::Matchers::Message;

TEST_CASE("ensure", "[infra][common][ensure]") {
    CHECK_NOTHROW(ensure(true, "ignored"));
    CHECK_THROWS_AS(ensure(false, "error"), std::logic_error);
    CHECK_THROWS_MATCHES(ensure(false, "condition violation"), std::logic_error, Message("condition violation"));
}

TEST_CASE("ensure dynamic message", "[infra][common][ensure]") {
    CHECK_NOTHROW(ensure(true, []() { return "ignored"; }));
    CHECK_THROWS_MATCHES(ensure(false, []() { return "slot " + std::to_string(42); }), std::logic_error, Message("slot 42"));
}

TEST_CASE("ensure_invariant", "[infra][common][ensure]") {
    CHECK_NOTHROW(ensure_invariant(true, []() { return "ignored"; }));
    CHECK_THROWS_MATCHES(ensure_invariant(false, []() { return "x " + std::to_string(42); }), std::logic_error, Message("Invariant violation: x 42"));
}

TEST_CASE("ensure_pre_condition", "[infra][common][ensure]") {
    CHECK_NOTHROW(ensure_pre_condition(true, []() { return "ignored"; }));
    CHECK_THROWS_AS(ensure_pre_condition(false, []() { return "error"; }), std::invalid_argument);
    CHECK_THROWS_MATCHES(ensure_pre_condition(false, []() { return "x"; }), std::invalid_argument, Message("Pre-condition violation: x"));
}

}  // namespace cocoon
