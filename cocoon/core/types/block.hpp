// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon {

struct Endorsement {
    EndorsementId id;
    Slot slot;
    uint32_t index{0};
    Address creator;
    BlockId endorsed_block;

    friend bool operator==(const Endorsement&, const Endorsement&) = default;
};

//! Block content as seen by execution: payloads are referenced by identifier and owned by storage
struct Block {
    BlockId id;
    Slot slot;
    Address creator;
    std::vector<OperationId> operations;
    std::vector<EndorsementId> endorsements;

    friend bool operator==(const Block&, const Block&) = default;
};

}  // namespace cocoon
