// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "event_store.hpp"

#include <utility>

#include <cocoon/infra/common/ensure.hpp>

namespace cocoon {

bool EventFilter::matches_slot(const Slot& slot) const {
    if (start && slot < *start) return false;
    if (end && slot > *end) return false;
    return true;
}

bool EventFilter::matches(const SCOutputEvent& event) const {
    const auto& context{event.context};
    if (!matches_slot(context.slot)) return false;
    if (is_final && context.is_final != *is_final) return false;
    if (is_error && context.is_error != *is_error) return false;
    if (emitter_address && event.emitter() != emitter_address) return false;
    if (original_caller_address && event.original_caller() != original_caller_address) return false;
    if (original_operation_id && context.origin_operation_id != original_operation_id) return false;
    return true;
}

void EventStore::record(const Slot& slot, std::optional<BlockId> block_id, std::vector<SCOutputEvent> events) {
    ensure(!head_ || head_->slot < slot, [&]() {
        return "EventStore: slot " + slot.to_string() + " recorded after " + head_->slot.to_string();
    });
    size_ += events.size();
    head_ = std::make_shared<const EventSegment>(EventSegment{
        .slot = slot,
        .block_id = std::move(block_id),
        .events = std::move(events),
        .previous = std::move(head_),
    });
}

std::vector<SCOutputEvent> EventStore::query(const EventFilter& filter) const {
    // Walk back from the most recent segment, then emit in increasing slot order
    std::vector<const EventSegment*> segments;
    for (const EventSegment* segment{head_.get()}; segment; segment = segment->previous.get()) {
        if (filter.start && segment->slot < *filter.start) break;
        if (filter.matches_slot(segment->slot) && !segment->events.empty()) {
            segments.push_back(segment);
        }
    }

    std::vector<SCOutputEvent> result;
    for (auto it{segments.rbegin()}; it != segments.rend(); ++it) {
        for (const auto& event : (*it)->events) {
            if (filter.matches(event)) {
                result.push_back(event);
            }
        }
    }
    return result;
}

std::optional<Slot> EventStore::last_slot() const {
    if (!head_) return std::nullopt;
    return head_->slot;
}

}  // namespace cocoon
