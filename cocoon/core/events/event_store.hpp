// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/output_event.hpp>
#include <cocoon/core/types/slot.hpp>

namespace cocoon {

//! Selection criteria for output events: every field present must match (logical AND)
struct EventFilter {
    //! Inclusive lower slot bound
    std::optional<Slot> start;
    //! Inclusive upper slot bound
    std::optional<Slot> end;
    //! Last address of the event call stack
    std::optional<Address> emitter_address;
    //! First address of the event call stack
    std::optional<Address> original_caller_address;
    std::optional<OperationId> original_operation_id;
    std::optional<bool> is_final;
    std::optional<bool> is_error;

    bool matches_slot(const Slot& slot) const;
    bool matches(const SCOutputEvent& event) const;
};

//! Events emitted during one slot, chained to the segment of the previous recorded slot
struct EventSegment {
    Slot slot;
    std::optional<BlockId> block_id;
    std::vector<SCOutputEvent> events;
    std::shared_ptr<const EventSegment> previous;
};

//! \brief Append-only log of output events ordered by (slot, index in slot).
//! \details The log is a persistent list of immutable segments: copying an EventStore is O(1) and copies share
//! every segment recorded before the copy, so recording into one copy is never visible from the others.
class EventStore {
  public:
    EventStore() = default;

    //! \brief Append the events emitted during a slot
    //! \remarks slot must be greater than the slot of any previously recorded segment
    void record(const Slot& slot, std::optional<BlockId> block_id, std::vector<SCOutputEvent> events);

    //! \brief Events matching filter, ordered by (slot, index in slot)
    std::vector<SCOutputEvent> query(const EventFilter& filter) const;

    std::optional<Slot> last_slot() const;

    //! Total number of recorded events
    size_t size() const noexcept { return size_; }

  private:
    std::shared_ptr<const EventSegment> head_;
    size_t size_{0};
};

}  // namespace cocoon
