// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/state/final_state.hpp>
#include <cocoon/execution/block_handle.hpp>
#include <cocoon/execution/processor.hpp>
#include <cocoon/execution/settings.hpp>
#include <cocoon/execution/snapshot.hpp>
#include <cocoon/execution/vm.hpp>
#include <cocoon/infra/concurrency/stoppable.hpp>

namespace cocoon::execution {

//! \brief Keeps the Final and Candidate views in line with consensus.
//! \details Owned and driven by the execution worker thread only. Each blockclique notification goes through
//! Finalizing (apply final slots), Reconciling (drop the speculative outputs the new blockclique disagrees with)
//! and Executing (replay up to the latest blockclique slot). A stop request is honored at slot boundaries only.
class ExecutionPipeline : public Stoppable {
  public:
    enum class State {
        kIdle,
        kFinalizing,
        kReconciling,
        kExecuting,
        kFaulted,
    };

    ExecutionPipeline(const ExecutionSettings& settings, VirtualMachine& vm, SnapshotHolder& snapshots);

    // Not copyable nor movable
    ExecutionPipeline(const ExecutionPipeline&) = delete;
    ExecutionPipeline& operator=(const ExecutionPipeline&) = delete;

    //! \brief Process one consensus notification
    //! \throws DeterminismViolation if a finalized slot does not match its speculative execution
    void update_blockclique_status(const BlockMap& finalized_blocks, const BlockMap& blockclique);

    //! \brief Stop processing notifications for good
    void set_faulted(std::string reason);

    State state() const noexcept { return state_; }
    const std::optional<std::string>& fault_reason() const noexcept { return fault_reason_; }

    const std::shared_ptr<const FinalState>& final_state() const noexcept { return final_; }
    const ActiveHistory& active_history() const noexcept { return history_; }

    //! Initial snapshot of a pipeline created with settings
    static ExecutionSnapshot genesis_snapshot(const ExecutionSettings& settings);

  private:
    //! Finalize every slot following the final cursor for which finality is known
    void finalize_pending();

    //! The block occupying the slot following the final cursor if that slot can be finalized, nullptr for a miss
    std::optional<const BlockHandle*> next_final_block() const;

    //! Drop the speculative outputs disagreeing with the blockclique
    void reconcile();

    //! Execute the slots between the end of the active history and the latest blockclique slot
    void replay();

    void publish();

    const ExecutionSettings& settings_;
    ExecutionProcessor processor_;
    SnapshotHolder& snapshots_;

    State state_{State::kIdle};
    std::optional<std::string> fault_reason_;

    std::shared_ptr<const FinalState> final_;
    ActiveHistory history_;

    //! Finalized blocks not applied to the final state yet
    BlockMap pending_final_;
    //! Pending final blocks plus the blockclique blocks above the final cursor
    BlockMap blockclique_;
};

}  // namespace cocoon::execution
