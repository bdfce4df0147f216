// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <cocoon/core/common/bytes.hpp>

namespace cocoon {

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a hex string, with or without 0x prefix, into bytes
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Appends the big-endian representation of value to out
void append_big_endian(Bytes& out, uint64_t value);

}  // namespace cocoon
