// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>

namespace cocoon {

//! Fixed-size 32 bytes digest. Base of every content-addressed identifier.
class Hash {
  public:
    constexpr Hash() = default;
    explicit Hash(ByteView bv);

    static constexpr size_t size() { return kHashLength; }

    std::string to_hex() const;
    static std::optional<Hash> from_hex(std::string_view hex);

    ByteView view() const noexcept { return ByteView{bytes}; }

    friend bool operator==(const Hash&, const Hash&) = default;
    friend std::strong_ordering operator<=>(const Hash&, const Hash&) = default;

    template <typename H>
    friend H AbslHashValue(H h, const Hash& hash) {
        return H::combine(std::move(h), hash.bytes);
    }

    std::array<uint8_t, kHashLength> bytes{};
};

std::ostream& operator<<(std::ostream& out, const Hash& hash);

//! Parses the hex representation of any identifier deriving from \ref Hash
template <class T>
std::optional<T> hash_from_hex(std::string_view hex) {
    const auto hash{Hash::from_hex(hex)};
    if (!hash) return std::nullopt;
    T id;
    id.bytes = hash->bytes;
    return id;
}

//! Identifier of a block, i.e. the digest of its header content
struct BlockId : public Hash {
    using Hash::Hash;
};

//! Identifier of an operation
struct OperationId : public Hash {
    using Hash::Hash;
};

//! Identifier of an endorsement
struct EndorsementId : public Hash {
    using Hash::Hash;
};

}  // namespace cocoon
