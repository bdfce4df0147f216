// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cocoon/core/types/hash.hpp>

namespace cocoon {

//! Account identifier. User accounts are digests of public keys, smart contract accounts are derived
//! deterministically at creation time from the creating slot.
struct Address : public Hash {
    using Hash::Hash;
};

}  // namespace cocoon
