// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon {

//! Where and how an output event was emitted
struct EventExecutionContext {
    Slot slot;
    std::optional<BlockId> block_id;
    bool read_only{false};
    //! Emission order within the slot
    uint64_t index_in_slot{0};
    //! Front is the original caller, back is the emitter
    std::vector<Address> call_stack;
    std::optional<OperationId> origin_operation_id;
    bool is_final{false};
    bool is_error{false};

    friend bool operator==(const EventExecutionContext&, const EventExecutionContext&) = default;
};

//! Structured event emitted by smart contract execution
struct SCOutputEvent {
    EventExecutionContext context;
    std::string data;

    std::optional<Address> emitter() const {
        if (context.call_stack.empty()) return std::nullopt;
        return context.call_stack.back();
    }

    std::optional<Address> original_caller() const {
        if (context.call_stack.empty()) return std::nullopt;
        return context.call_stack.front();
    }

    friend bool operator==(const SCOutputEvent&, const SCOutputEvent&) = default;
};

}  // namespace cocoon
