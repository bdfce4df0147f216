// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

namespace cocoon::execution {

std::string ExecutionError::to_string() const {
    return std::string{magic_enum::enum_name(code)} + ": " + message;
}

DeterminismViolation::DeterminismViolation(const Slot& slot, const std::string& detail)
    : std::runtime_error{"Determinism violation at slot " + slot.to_string() + ": " + detail}, slot_{slot} {}

}  // namespace cocoon::execution
