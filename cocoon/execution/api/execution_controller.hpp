// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cocoon/core/common/base.hpp>
#include <cocoon/core/common/bytes.hpp>
#include <cocoon/core/common/hash_maps.hpp>
#include <cocoon/core/events/event_store.hpp>
#include <cocoon/core/state/final_state.hpp>
#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/execution/block_handle.hpp>
#include <cocoon/execution/readonly.hpp>

namespace cocoon::execution::api {

//! (final, candidate) values of one item, absent when unknown to the view
template <class T>
using FinalAndActive = std::pair<std::optional<T>, std::optional<T>>;

//! \brief Thread-safe boundary of the execution worker exposed to the rest of the node.
//! \details Notifications are fire-and-forget and processed in arrival order by the worker. Queries run on the
//! calling thread against the latest snapshot published by the worker: they never wait for a notification to
//! be processed and never block each other.
class ExecutionController {
  public:
    virtual ~ExecutionController() = default;

    //! Notify finalized blocks and the new blockclique, both replacing any previous notification
    virtual void update_blockclique_status(BlockMap finalized_blocks, BlockMap blockclique) = 0;

    virtual std::vector<SCOutputEvent> get_filtered_sc_output_event(const EventFilter& filter) const = 0;

    virtual std::vector<FinalAndActive<Amount>> get_final_and_active_parallel_balance(
        const std::vector<Address>& addresses) const = 0;

    virtual std::vector<FinalAndActive<Amount>> get_final_and_active_sequential_balance(
        const std::vector<Address>& addresses) const = 0;

    virtual std::vector<FinalAndActive<Bytes>> get_final_and_active_data_entry(
        const std::vector<std::pair<Address, Bytes>>& entries) const = 0;

    //! (final keys, candidate keys) ordered lexicographically
    virtual std::pair<OrderedSet<Bytes>, OrderedSet<Bytes>> get_final_and_active_datastore_keys(
        const Address& address) const = 0;

    //! Roll distribution frozen at the end of cycle - 1, empty when unavailable
    virtual RollMap get_cycle_rolls(Cycle cycle) const = 0;

    virtual ReadOnlyResult execute_readonly_request(const ReadOnlyExecutionRequest& request) const = 0;

    //! The operations among ops not executed in the Final nor in the Candidate view
    virtual OrderedSet<OperationId> unexecuted_ops_among(const OrderedSet<OperationId>& ops) const = 0;

    //! Whether the worker halted on an unrecoverable fault
    virtual bool is_faulted() const = 0;
    virtual std::optional<std::string> fault_reason() const = 0;

    //! Another handle onto the same worker
    virtual std::unique_ptr<ExecutionController> clone() const = 0;
};

//! Lifecycle of the execution worker
class ExecutionManager {
  public:
    virtual ~ExecutionManager() = default;

    //! Stop the worker at the next slot boundary and wait for its termination. Pending notifications are dropped.
    virtual void stop() = 0;
};

}  // namespace cocoon::execution::api
