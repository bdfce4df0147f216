// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <utility>

#include <cocoon/core/state/execution_output.hpp>
#include <cocoon/core/state/final_state.hpp>
#include <cocoon/core/state/state_view.hpp>

namespace cocoon::execution {

//! Consistent pair of final state and active history published by the execution worker
struct ExecutionSnapshot {
    std::shared_ptr<const FinalState> final_state;
    std::shared_ptr<const ActiveHistory> history;

    StateView final_view() const { return StateView{final_state}; }
    StateView candidate_view() const { return StateView{final_state, *history}; }
};

//! Latest published snapshot. The lock is held only to copy two shared pointers, never during a query.
class SnapshotHolder {
  public:
    explicit SnapshotHolder(ExecutionSnapshot initial) : snapshot_{std::move(initial)} {}

    void publish(ExecutionSnapshot snapshot) {
        std::scoped_lock lock{mutex_};
        snapshot_ = std::move(snapshot);
    }

    ExecutionSnapshot get() const {
        std::scoped_lock lock{mutex_};
        return snapshot_;
    }

  private:
    mutable std::mutex mutex_;
    ExecutionSnapshot snapshot_;
};

}  // namespace cocoon::execution
