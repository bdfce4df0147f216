// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/storage/storage.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon::execution {

//! A block identifier together with a storage handle referencing its payloads
struct BlockHandle {
    BlockId id;
    Storage storage;
};

//! Blocks indexed by the slot they occupy
using BlockMap = OrderedMap<Slot, BlockHandle>;

}  // namespace cocoon::execution
