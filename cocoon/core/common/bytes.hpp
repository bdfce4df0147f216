// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cocoon {

//! Owned byte sequence. Ordered lexicographically by unsigned byte value.
using Bytes = std::vector<uint8_t>;

using ByteView = std::span<const uint8_t>;

inline Bytes to_bytes(std::string_view s) {
    return Bytes{s.begin(), s.end()};
}

inline std::string_view to_string_view(const Bytes& bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace cocoon
