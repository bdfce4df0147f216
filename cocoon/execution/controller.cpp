// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "controller.hpp"

#include <boost/asio/post.hpp>

#include <cocoon/execution/errors.hpp>
#include <cocoon/infra/common/ensure.hpp>
#include <cocoon/infra/common/log.hpp>

namespace cocoon::execution {

ExecutionWorker::ExecutionWorker(ExecutionSettings settings, std::shared_ptr<VirtualMachine> vm,
                                 FaultHandler fault_handler)
    : settings_{std::move(settings)},
      vm_{std::move(vm)},
      fault_handler_{std::move(fault_handler)},
      snapshots_{ExecutionPipeline::genesis_snapshot(settings_)},
      pipeline_{settings_, *vm_, snapshots_},
      readonly_executor_{settings_, *vm_},
      context_{0, "exec-worker"} {
    context_.set_exception_handler([this](std::exception_ptr) { fault("unexpected worker loop termination"); });
}

ExecutionWorker::~ExecutionWorker() {
    stop();
}

void ExecutionWorker::start() {
    COCOON_INFO_M("ExecutionWorker", {"op", "start", "settings", settings_.to_string()});
    context_.start();
}

void ExecutionWorker::stop() {
    if (!pipeline_.stop()) return;
    COCOON_INFO_M("ExecutionWorker", {"op", "stop"});
    context_.stop_and_join();
}

void ExecutionWorker::post_update(BlockMap finalized_blocks, BlockMap blockclique) {
    boost::asio::post(*context_.ioc(), [this, finalized = std::move(finalized_blocks),
                                        clique = std::move(blockclique)]() { handle_update(finalized, clique); });
}

void ExecutionWorker::handle_update(const BlockMap& finalized_blocks, const BlockMap& blockclique) {
    if (pipeline_.is_stopping() || is_faulted()) return;
    try {
        pipeline_.update_blockclique_status(finalized_blocks, blockclique);
    } catch (const DeterminismViolation& ex) {
        fault(ex.what());
    } catch (const std::exception& ex) {
        fault(std::string{"unexpected error: "} + ex.what());
    }
}

void ExecutionWorker::fault(const std::string& reason) {
    COCOON_CRIT_M("ExecutionWorker", {"fault", reason});
    pipeline_.set_faulted(reason);
    {
        std::scoped_lock lock{fault_mutex_};
        fault_reason_ = reason;
    }
    faulted_ = true;
    if (!fault_handler_) return;
    try {
        fault_handler_(reason);
    } catch (const std::exception& ex) {
        COCOON_ERROR_M("ExecutionWorker", {"fault_handler", "failed", "error", ex.what()});
    } catch (...) {
        COCOON_ERROR_M("ExecutionWorker", {"fault_handler", "failed", "error", "unknown exception"});
    }
}

std::optional<std::string> ExecutionWorker::fault_reason() const {
    std::scoped_lock lock{fault_mutex_};
    return fault_reason_;
}

ReadOnlyResult ExecutionWorker::execute_readonly(const ReadOnlyExecutionRequest& request) const {
    if (is_faulted()) {
        return tl::make_unexpected(ExecutionError{ExecutionErrorCode::kFaulted, fault_reason().value_or("")});
    }
    return readonly_executor_.execute(request, snapshots_.get());
}

void LocalExecutionController::update_blockclique_status(BlockMap finalized_blocks, BlockMap blockclique) {
    worker_->post_update(std::move(finalized_blocks), std::move(blockclique));
}

std::vector<SCOutputEvent> LocalExecutionController::get_filtered_sc_output_event(const EventFilter& filter) const {
    const auto snapshot{worker_->snapshot()};
    return snapshot.candidate_view().get_filtered_events(filter);
}

std::vector<api::FinalAndActive<Amount>> LocalExecutionController::get_final_and_active_parallel_balance(
    const std::vector<Address>& addresses) const {
    const auto snapshot{worker_->snapshot()};
    const auto final_view{snapshot.final_view()};
    const auto candidate_view{snapshot.candidate_view()};
    std::vector<api::FinalAndActive<Amount>> result;
    result.reserve(addresses.size());
    for (const auto& address : addresses) {
        result.emplace_back(final_view.get_parallel_balance(address), candidate_view.get_parallel_balance(address));
    }
    return result;
}

std::vector<api::FinalAndActive<Amount>> LocalExecutionController::get_final_and_active_sequential_balance(
    const std::vector<Address>& addresses) const {
    const auto snapshot{worker_->snapshot()};
    const auto final_view{snapshot.final_view()};
    const auto candidate_view{snapshot.candidate_view()};
    std::vector<api::FinalAndActive<Amount>> result;
    result.reserve(addresses.size());
    for (const auto& address : addresses) {
        result.emplace_back(final_view.get_sequential_balance(address),
                            candidate_view.get_sequential_balance(address));
    }
    return result;
}

std::vector<api::FinalAndActive<Bytes>> LocalExecutionController::get_final_and_active_data_entry(
    const std::vector<std::pair<Address, Bytes>>& entries) const {
    const auto snapshot{worker_->snapshot()};
    const auto final_view{snapshot.final_view()};
    const auto candidate_view{snapshot.candidate_view()};
    std::vector<api::FinalAndActive<Bytes>> result;
    result.reserve(entries.size());
    for (const auto& [address, key] : entries) {
        result.emplace_back(final_view.get_data_entry(address, key), candidate_view.get_data_entry(address, key));
    }
    return result;
}

std::pair<OrderedSet<Bytes>, OrderedSet<Bytes>> LocalExecutionController::get_final_and_active_datastore_keys(
    const Address& address) const {
    const auto snapshot{worker_->snapshot()};
    return {snapshot.final_view().get_datastore_keys(address), snapshot.candidate_view().get_datastore_keys(address)};
}

RollMap LocalExecutionController::get_cycle_rolls(Cycle cycle) const {
    if (cycle == 0) return {};
    const auto snapshot{worker_->snapshot()};
    if (const auto rolls{snapshot.final_state->get_cycle_rolls(cycle - 1)}) {
        return *rolls;
    }
    return {};
}

ReadOnlyResult LocalExecutionController::execute_readonly_request(const ReadOnlyExecutionRequest& request) const {
    return worker_->execute_readonly(request);
}

OrderedSet<OperationId> LocalExecutionController::unexecuted_ops_among(const OrderedSet<OperationId>& ops) const {
    const auto snapshot{worker_->snapshot()};
    const auto candidate_view{snapshot.candidate_view()};
    OrderedSet<OperationId> result;
    for (const auto& id : ops) {
        if (!candidate_view.is_op_executed(id)) {
            result.insert(id);
        }
    }
    return result;
}

std::unique_ptr<api::ExecutionController> LocalExecutionController::clone() const {
    return std::make_unique<LocalExecutionController>(worker_);
}

ExecutionHandles start_execution_worker(ExecutionSettings settings, std::shared_ptr<VirtualMachine> vm,
                                        FaultHandler fault_handler) {
    settings.validate();
    ensure_pre_condition(vm != nullptr, [&]() { return "start_execution_worker: no virtual machine"; });

    auto worker{std::make_shared<ExecutionWorker>(std::move(settings), std::move(vm), std::move(fault_handler))};
    worker->start();
    return ExecutionHandles{
        .manager = std::make_unique<LocalExecutionManager>(worker),
        .controller = std::make_unique<LocalExecutionController>(worker),
    };
}

}  // namespace cocoon::execution
