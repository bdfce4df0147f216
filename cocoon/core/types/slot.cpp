// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "slot.hpp"

#include <stdexcept>

namespace cocoon {

Slot Slot::next(uint8_t thread_count) const {
    COCOON_ASSERT(thread_count > 0);
    if (thread + 1 < thread_count) {
        return Slot{period, static_cast<uint8_t>(thread + 1)};
    }
    if (period == kMaxPeriod) {
        throw std::overflow_error{"slot period overflow after " + to_string()};
    }
    return Slot{period + 1, 0};
}

bool Slot::is_last_of_cycle(uint64_t periods_per_cycle, uint8_t thread_count) const {
    return period % periods_per_cycle == periods_per_cycle - 1 && thread == thread_count - 1;
}

std::string Slot::to_string() const {
    return "(" + std::to_string(period) + ", " + std::to_string(thread) + ")";
}

std::ostream& operator<<(std::ostream& out, const Slot& slot) {
    out << slot.to_string();
    return out;
}

}  // namespace cocoon
