// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "hash.hpp"

#include <algorithm>

#include <cocoon/core/common/util.hpp>

namespace cocoon {

Hash::Hash(ByteView bv) {
    COCOON_ASSERT(bv.size() == size());
    std::copy(bv.begin(), bv.end(), bytes.begin());
}

std::string Hash::to_hex() const {
    return cocoon::to_hex(view());
}

std::optional<Hash> Hash::from_hex(std::string_view hex) {
    const auto bytes{cocoon::from_hex(hex)};
    if (!bytes || bytes->size() != kHashLength) {
        return std::nullopt;
    }
    return Hash{*bytes};
}

std::ostream& operator<<(std::ostream& out, const Hash& hash) {
    out << hash.to_hex();
    return out;
}

}  // namespace cocoon
