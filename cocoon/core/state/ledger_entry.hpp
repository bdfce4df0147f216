// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/types/amount.hpp>

namespace cocoon {

using Datastore = OrderedMap<Bytes, Bytes>;

//! Account content in the ledger
struct LedgerEntry {
    Amount parallel_balance;
    Amount sequential_balance;
    //! Empty for user accounts
    Bytes bytecode;
    //! Keys ordered lexicographically by byte value
    Datastore datastore;

    friend bool operator==(const LedgerEntry&, const LedgerEntry&) = default;
};

}  // namespace cocoon
