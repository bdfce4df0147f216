// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/state/state_changes.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/output_event.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon {

struct ExecutionUsage {
    Gas gas_used{0};
    uint64_t executed_ops{0};
    uint64_t rejected_ops{0};

    friend bool operator==(const ExecutionUsage&, const ExecutionUsage&) = default;
};

//! Result of the execution of one slot (or of one read-only request): immutable once produced
struct ExecutionOutput {
    Slot slot;
    //! Absent for a miss slot
    std::optional<BlockId> block_id;
    StateChanges state_changes;
    std::vector<SCOutputEvent> events;
    ExecutionUsage usage;

    friend bool operator==(const ExecutionOutput&, const ExecutionOutput&) = default;
};

//! Speculative outputs of the slots following the final slot, in increasing slot order
using ActiveHistory = std::vector<std::shared_ptr<const ExecutionOutput>>;

}  // namespace cocoon
