// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/state/delta.hpp>
#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/state/state_changes.hpp>
#include <cocoon/core/state/state_view.hpp>
#include <cocoon/core/types/output_event.hpp>

namespace cocoon {

//! \brief Journaled write overlay for the execution of one slot, or of one read-only request, over a StateView.
//! \details Every write is recorded in a journal of deltas, so that the effects of a failed operation can be undone
//! completely by reverting to a snapshot taken before it. Accumulated changes are kept in ordered form.
class SlotState {
  public:
    class Snapshot {
      public:
        // Only movable
        Snapshot(Snapshot&&) = default;
        Snapshot& operator=(Snapshot&&) = default;

      private:
        friend class SlotState;

        Snapshot() = default;

        size_t journal_size_{0};
        size_t event_size_{0};
    };

    // Not copyable nor movable
    SlotState(const SlotState&) = delete;
    SlotState& operator=(const SlotState&) = delete;

    SlotState(const StateView& base, const Slot& slot) noexcept : base_{base}, slot_{slot} {}

    const Slot& slot() const noexcept { return slot_; }
    const StateView& base() const noexcept { return base_; }

    bool exists(const Address& address) const;

    std::optional<Amount> get_parallel_balance(const Address& address) const;
    std::optional<Amount> get_sequential_balance(const Address& address) const;
    std::optional<Bytes> get_bytecode(const Address& address) const;
    std::optional<Bytes> get_data_entry(const Address& address, const Bytes& key) const;
    OrderedSet<Bytes> get_datastore_keys(const Address& address) const;
    RollCount get_rolls(const Address& address) const;
    bool is_op_executed(const OperationId& id) const;

    //! Create an empty ledger entry if address is unknown
    void create_entry(const Address& address);

    void set_parallel_balance(const Address& address, Amount value);
    void set_sequential_balance(const Address& address, Amount value);

    //! \brief Move parallel coins between two addresses, or mint (no sender) or burn (no recipient) them
    //! \return false if the sender balance is insufficient or the recipient balance would overflow, in which case
    //! nothing is changed
    [[nodiscard]] bool transfer_parallel(const std::optional<Address>& from, const std::optional<Address>& to,
                                         Amount amount);
    [[nodiscard]] bool transfer_sequential(const std::optional<Address>& from, const std::optional<Address>& to,
                                           Amount amount);

    void set_bytecode(const Address& address, Bytes bytecode);
    void set_data_entry(const Address& address, const Bytes& key, Bytes value);
    void delete_data_entry(const Address& address, const Bytes& key);

    void set_rolls(const Address& address, RollCount count);

    void mark_op_executed(const OperationId& id, Period expire_period);

    //! Append an event, numbering it after the ones already emitted in the slot
    void add_event(SCOutputEvent event);

    Snapshot take_snapshot() const noexcept;
    void revert_to_snapshot(const Snapshot& snapshot) noexcept;

    const StateChanges& changes() const noexcept { return changes_; }
    const std::vector<SCOutputEvent>& events() const noexcept { return events_; }

    //! \brief Output of the slot, leaving this state empty
    ExecutionOutput release_output(std::optional<BlockId> block_id, ExecutionUsage usage);

  private:
    friend class state::CreateDelta;
    friend class state::ParallelBalanceDelta;
    friend class state::SequentialBalanceDelta;
    friend class state::BytecodeDelta;
    friend class state::DatastoreDelta;
    friend class state::RollDelta;
    friend class state::ExecutedOpDelta;

    LedgerEntryUpdate& touch(const Address& address);

    const StateView& base_;
    Slot slot_;

    StateChanges changes_;
    std::vector<SCOutputEvent> events_;

    std::vector<std::unique_ptr<state::Delta>> journal_;
};

}  // namespace cocoon
