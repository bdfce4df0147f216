// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/events/event_store.hpp>
#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/state/final_state.hpp>

namespace cocoon {

//! \brief Read-only composition of a final state and the speculative outputs of the slots following it.
//! \details With an empty history this is the Final view, with the whole active history the Candidate view.
//! Reads resolve the most recent output touching the requested item, then fall back to the final state.
//! The referenced history must outlive the view.
class StateView {
  public:
    explicit StateView(std::shared_ptr<const FinalState> final_state,
                       std::span<const std::shared_ptr<const ExecutionOutput>> history = {});

    const FinalState& final_state() const noexcept { return *final_; }
    std::span<const std::shared_ptr<const ExecutionOutput>> history() const noexcept { return history_; }

    //! Last slot covered by the view
    Slot slot() const noexcept;

    bool exists(const Address& address) const;

    //! \return absent if address is unknown to the view
    std::optional<Amount> get_parallel_balance(const Address& address) const;
    std::optional<Amount> get_sequential_balance(const Address& address) const;
    std::optional<Bytes> get_bytecode(const Address& address) const;

    std::optional<Bytes> get_data_entry(const Address& address, const Bytes& key) const;
    OrderedSet<Bytes> get_datastore_keys(const Address& address) const;

    RollCount get_rolls(const Address& address) const;

    bool is_op_executed(const OperationId& id) const;

    //! Final events followed by the speculative ones, in (slot, index in slot) order
    std::vector<SCOutputEvent> get_filtered_events(const EventFilter& filter) const;

  private:
    //! Most recent value of an entry field set by the history, falling back to final, then to a default value for
    //! addresses only created by the history
    template <class Field, class FinalGetter>
    std::optional<Field> resolve_field(const Address& address, std::optional<Field> LedgerEntryUpdate::* field,
                                       FinalGetter final_getter) const;

    std::shared_ptr<const FinalState> final_;
    std::span<const std::shared_ptr<const ExecutionOutput>> history_;
};

}  // namespace cocoon
