// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <array>

namespace cocoon {

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const std::array<char, 16> kHexDigits{'0', '1', '2', '3', '4', '5', '6', '7',
                                                 '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos(hex.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, '\0');
    auto dst{out.begin()};
    if (pos) {
        const auto b{decode_hex_digit(hex[0])};
        if (!b) return std::nullopt;
        *dst++ = *b;
        hex.remove_prefix(1);
    }
    for (size_t i{0}; i < hex.length(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

void append_big_endian(Bytes& out, uint64_t value) {
    for (int shift{56}; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

}  // namespace cocoon
