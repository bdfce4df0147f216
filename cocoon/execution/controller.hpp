// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <cocoon/execution/api/execution_controller.hpp>
#include <cocoon/execution/pipeline.hpp>
#include <cocoon/execution/readonly.hpp>
#include <cocoon/execution/settings.hpp>
#include <cocoon/execution/snapshot.hpp>
#include <cocoon/execution/vm.hpp>
#include <cocoon/infra/concurrency/context.hpp>

namespace cocoon::execution {

//! Invoked once on the worker thread when the worker halts on an unrecoverable fault
using FaultHandler = std::function<void(const std::string& reason)>;

//! \brief Execution worker: one dedicated thread owning the pipeline, plus the snapshot its queries read.
//! \details Shared by every controller handle and the manager. Notifications are posted to the worker context and
//! handled one at a time in posting order.
class ExecutionWorker {
  public:
    ExecutionWorker(ExecutionSettings settings, std::shared_ptr<VirtualMachine> vm, FaultHandler fault_handler);
    ~ExecutionWorker();

    ExecutionWorker(const ExecutionWorker&) = delete;
    ExecutionWorker& operator=(const ExecutionWorker&) = delete;

    void start();
    void stop();

    void post_update(BlockMap finalized_blocks, BlockMap blockclique);

    ExecutionSnapshot snapshot() const { return snapshots_.get(); }
    ReadOnlyResult execute_readonly(const ReadOnlyExecutionRequest& request) const;
    const ExecutionSettings& settings() const noexcept { return settings_; }

    bool is_faulted() const noexcept { return faulted_.load(); }
    std::optional<std::string> fault_reason() const;

  private:
    void handle_update(const BlockMap& finalized_blocks, const BlockMap& blockclique);
    void fault(const std::string& reason);

    const ExecutionSettings settings_;
    std::shared_ptr<VirtualMachine> vm_;
    FaultHandler fault_handler_;

    SnapshotHolder snapshots_;
    ExecutionPipeline pipeline_;
    ReadOnlyExecutor readonly_executor_;
    concurrency::SingleThreadContext context_;

    std::atomic_bool faulted_{false};
    mutable std::mutex fault_mutex_;
    std::optional<std::string> fault_reason_;
};

//! Controller handle onto a local ExecutionWorker
class LocalExecutionController : public api::ExecutionController {
  public:
    explicit LocalExecutionController(std::shared_ptr<ExecutionWorker> worker) : worker_{std::move(worker)} {}

    void update_blockclique_status(BlockMap finalized_blocks, BlockMap blockclique) override;

    std::vector<SCOutputEvent> get_filtered_sc_output_event(const EventFilter& filter) const override;

    std::vector<api::FinalAndActive<Amount>> get_final_and_active_parallel_balance(
        const std::vector<Address>& addresses) const override;

    std::vector<api::FinalAndActive<Amount>> get_final_and_active_sequential_balance(
        const std::vector<Address>& addresses) const override;

    std::vector<api::FinalAndActive<Bytes>> get_final_and_active_data_entry(
        const std::vector<std::pair<Address, Bytes>>& entries) const override;

    std::pair<OrderedSet<Bytes>, OrderedSet<Bytes>> get_final_and_active_datastore_keys(
        const Address& address) const override;

    RollMap get_cycle_rolls(Cycle cycle) const override;

    ReadOnlyResult execute_readonly_request(const ReadOnlyExecutionRequest& request) const override;

    OrderedSet<OperationId> unexecuted_ops_among(const OrderedSet<OperationId>& ops) const override;

    bool is_faulted() const override { return worker_->is_faulted(); }
    std::optional<std::string> fault_reason() const override { return worker_->fault_reason(); }

    std::unique_ptr<api::ExecutionController> clone() const override;

  private:
    std::shared_ptr<ExecutionWorker> worker_;
};

class LocalExecutionManager : public api::ExecutionManager {
  public:
    explicit LocalExecutionManager(std::shared_ptr<ExecutionWorker> worker) : worker_{std::move(worker)} {}

    void stop() override { worker_->stop(); }

  private:
    std::shared_ptr<ExecutionWorker> worker_;
};

struct ExecutionHandles {
    std::unique_ptr<api::ExecutionManager> manager;
    std::unique_ptr<api::ExecutionController> controller;
};

//! \brief Launch the execution worker thread
//! \throws std::invalid_argument if settings are not valid
ExecutionHandles start_execution_worker(ExecutionSettings settings, std::shared_ptr<VirtualMachine> vm,
                                        FaultHandler fault_handler = {});

}  // namespace cocoon::execution
