// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, types, and constants.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include <cocoon/core/common/assert.hpp>

namespace cocoon {

using namespace std::string_view_literals;

using Period = uint64_t;
using Cycle = uint64_t;
using Gas = uint64_t;
using RollCount = uint64_t;

inline constexpr Period kMaxPeriod = std::numeric_limits<Period>::max();

inline constexpr size_t kHashLength{32};

//! Number of decimal places of a coin amount
inline constexpr uint32_t kAmountDecimalPlaces{9};

//! Raw units per coin
inline constexpr uint64_t kAmountDecimalFactor{1'000'000'000};

}  // namespace cocoon
