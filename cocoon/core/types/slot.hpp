// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <cocoon/core/common/base.hpp>

namespace cocoon {

//! Position in the chain: one block can be produced per (period, thread) pair.
//! Slots are totally ordered by period first, then by thread.
struct Slot {
    Period period{0};
    uint8_t thread{0};

    //! \brief The slot following this one
    //! \throws std::overflow_error when period overflows
    Slot next(uint8_t thread_count) const;

    //! \brief The cycle this slot belongs to
    Cycle cycle(uint64_t periods_per_cycle) const { return period / periods_per_cycle; }

    //! \brief Whether this is the last slot of its cycle, after which the cycle roll snapshot is frozen
    bool is_last_of_cycle(uint64_t periods_per_cycle, uint8_t thread_count) const;

    //! \brief The last slot of the genesis period, i.e. the slot cursor of a freshly created final state
    static Slot last_genesis_slot(uint8_t thread_count) { return Slot{0, static_cast<uint8_t>(thread_count - 1)}; }

    std::string to_string() const;

    friend bool operator==(const Slot&, const Slot&) = default;
    friend std::strong_ordering operator<=>(const Slot&, const Slot&) = default;

    template <typename H>
    friend H AbslHashValue(H h, const Slot& slot) {
        return H::combine(std::move(h), slot.period, slot.thread);
    }
};

std::ostream& operator<<(std::ostream& out, const Slot& slot);

}  // namespace cocoon
