// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "amount.hpp"

#include <charconv>
#include <limits>

namespace cocoon {

std::optional<Amount> Amount::from_coins(uint64_t coins) {
    return Amount{kAmountDecimalFactor}.checked_mul(coins);
}

std::optional<Amount> Amount::from_string(std::string_view str) {
    if (str.empty()) return std::nullopt;

    std::string_view integral{str};
    std::string_view fractional;
    if (const auto dot{str.find('.')}; dot != std::string_view::npos) {
        integral = str.substr(0, dot);
        fractional = str.substr(dot + 1);
        if (fractional.empty() || fractional.size() > kAmountDecimalPlaces) return std::nullopt;
    }
    if (integral.empty()) return std::nullopt;

    uint64_t coins{0};
    const auto [int_end, int_ec] = std::from_chars(integral.data(), integral.data() + integral.size(), coins);
    if (int_ec != std::errc{} || int_end != integral.data() + integral.size()) return std::nullopt;

    uint64_t fraction{0};
    if (!fractional.empty()) {
        const auto [frac_end, frac_ec] = std::from_chars(fractional.data(), fractional.data() + fractional.size(), fraction);
        if (frac_ec != std::errc{} || frac_end != fractional.data() + fractional.size()) return std::nullopt;
        for (size_t i{fractional.size()}; i < kAmountDecimalPlaces; ++i) {
            fraction *= 10;
        }
    }

    const auto whole{from_coins(coins)};
    if (!whole) return std::nullopt;
    return whole->checked_add(Amount{fraction});
}

std::optional<Amount> Amount::checked_add(Amount other) const noexcept {
    if (raw_ > std::numeric_limits<uint64_t>::max() - other.raw_) return std::nullopt;
    return Amount{raw_ + other.raw_};
}

std::optional<Amount> Amount::checked_sub(Amount other) const noexcept {
    if (other.raw_ > raw_) return std::nullopt;
    return Amount{raw_ - other.raw_};
}

std::optional<Amount> Amount::checked_mul(uint64_t factor) const noexcept {
    if (factor != 0 && raw_ > std::numeric_limits<uint64_t>::max() / factor) return std::nullopt;
    return Amount{raw_ * factor};
}

std::optional<Amount> Amount::checked_div(uint64_t divisor) const noexcept {
    if (divisor == 0) return std::nullopt;
    return Amount{raw_ / divisor};
}

Amount Amount::saturating_add(Amount other) const noexcept {
    return checked_add(other).value_or(Amount{std::numeric_limits<uint64_t>::max()});
}

Amount Amount::saturating_sub(Amount other) const noexcept {
    return checked_sub(other).value_or(Amount{});
}

std::string Amount::to_string() const {
    std::string result{std::to_string(raw_ / kAmountDecimalFactor)};
    uint64_t fraction{raw_ % kAmountDecimalFactor};
    if (fraction == 0) return result;

    std::string digits(kAmountDecimalPlaces, '0');
    for (size_t i{kAmountDecimalPlaces}; i > 0; --i) {
        digits[i - 1] = static_cast<char>('0' + fraction % 10);
        fraction /= 10;
    }
    digits.erase(digits.find_last_not_of('0') + 1);
    return result + "." + digits;
}

std::ostream& operator<<(std::ostream& out, const Amount& amount) {
    out << amount.to_string();
    return out;
}

}  // namespace cocoon
