// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <cocoon/core/common/base.hpp>

namespace cocoon {

//! Unsigned fixed-point coin amount with \ref kAmountDecimalPlaces decimals.
//! Arithmetic is checked: overflow and underflow yield no value instead of wrapping.
class Amount {
  public:
    constexpr Amount() = default;

    static constexpr Amount from_raw(uint64_t raw) { return Amount{raw}; }

    //! \brief Amount of whole coins
    static std::optional<Amount> from_coins(uint64_t coins);

    //! \brief Parses a decimal representation like "10", "0.5" or "1234.000000001"
    static std::optional<Amount> from_string(std::string_view str);

    constexpr uint64_t to_raw() const noexcept { return raw_; }
    constexpr bool is_zero() const noexcept { return raw_ == 0; }

    std::optional<Amount> checked_add(Amount other) const noexcept;
    std::optional<Amount> checked_sub(Amount other) const noexcept;
    std::optional<Amount> checked_mul(uint64_t factor) const noexcept;
    std::optional<Amount> checked_div(uint64_t divisor) const noexcept;
    Amount saturating_add(Amount other) const noexcept;
    Amount saturating_sub(Amount other) const noexcept;

    std::string to_string() const;

    friend bool operator==(const Amount&, const Amount&) = default;
    friend std::strong_ordering operator<=>(const Amount&, const Amount&) = default;

    template <typename H>
    friend H AbslHashValue(H h, const Amount& amount) {
        return H::combine(std::move(h), amount.raw_);
    }

  private:
    explicit constexpr Amount(uint64_t raw) : raw_{raw} {}

    uint64_t raw_{0};
};

std::ostream& operator<<(std::ostream& out, const Amount& amount);

}  // namespace cocoon
