// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

#include <cocoon/core/types/slot.hpp>

namespace cocoon::execution {

enum class ExecutionErrorCode {
    kTargetNotFound,
    kResourceExhausted,
    kRuntimeTrap,
    kInvalidRequest,
    kFaulted,
};

//! Recoverable failure of a read-only execution request
struct ExecutionError {
    ExecutionErrorCode code;
    std::string message;

    std::string to_string() const;
};

//! \brief Re-executing a slot with identical inputs produced a different output.
//! \details Fatal: this node has diverged from consensus and must not process further notifications.
class DeterminismViolation : public std::runtime_error {
  public:
    DeterminismViolation(const Slot& slot, const std::string& detail);

    const Slot& slot() const noexcept { return slot_; }

  private:
    Slot slot_;
};

}  // namespace cocoon::execution
