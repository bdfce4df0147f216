// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "pipeline.hpp"

#include <utility>

#include <cocoon/core/common/util.hpp>
#include <cocoon/execution/errors.hpp>
#include <cocoon/infra/common/ensure.hpp>
#include <cocoon/infra/common/log.hpp>

namespace cocoon::execution {

static std::string block_name(const std::optional<BlockId>& id) {
    return id ? abridge(id->to_hex(), 16) : "miss";
}

ExecutionPipeline::ExecutionPipeline(const ExecutionSettings& settings, VirtualMachine& vm, SnapshotHolder& snapshots)
    : settings_{settings}, processor_{settings, vm}, snapshots_{snapshots} {
    auto genesis{snapshots_.get()};
    final_ = std::move(genesis.final_state);
    history_ = *genesis.history;
}

ExecutionSnapshot ExecutionPipeline::genesis_snapshot(const ExecutionSettings& settings) {
    return ExecutionSnapshot{
        .final_state = std::make_shared<const FinalState>(settings.final_state_config(), settings.initial_ledger,
                                                          settings.initial_rolls),
        .history = std::make_shared<const ActiveHistory>(),
    };
}

void ExecutionPipeline::set_faulted(std::string reason) {
    state_ = State::kFaulted;
    fault_reason_ = std::move(reason);
}

void ExecutionPipeline::update_blockclique_status(const BlockMap& finalized_blocks, const BlockMap& blockclique) {
    if (state_ == State::kFaulted) {
        COCOON_WARN_M("ExecutionPipeline", {"notification", "ignored", "fault", fault_reason_.value_or("")});
        return;
    }

    state_ = State::kFinalizing;
    for (const auto& [slot, block] : finalized_blocks) {
        // Already final slots are ignored, which makes finalization idempotent
        if (slot > final_->slot()) {
            pending_final_.insert_or_assign(slot, block);
        }
    }
    finalize_pending();

    state_ = State::kReconciling;
    blockclique_ = pending_final_;
    for (const auto& [slot, block] : blockclique) {
        if (slot > final_->slot()) {
            blockclique_.try_emplace(slot, block);
        }
    }
    reconcile();

    state_ = State::kExecuting;
    replay();
    publish();

    state_ = State::kIdle;
    COCOON_DEBUG_M("ExecutionPipeline", {"final", final_->slot().to_string(),
                                         "candidate", StateView{final_, history_}.slot().to_string(),
                                         "pending_final", std::to_string(pending_final_.size())});
}

std::optional<const BlockHandle*> ExecutionPipeline::next_final_block() const {
    const Slot next{final_->slot().next(settings_.thread_count)};
    if (const auto it{pending_final_.find(next)}; it != pending_final_.end()) {
        return &it->second;
    }
    // A later final block in the same thread proves that this slot was missed
    for (auto it{pending_final_.upper_bound(next)}; it != pending_final_.end(); ++it) {
        if (it->first.thread == next.thread) {
            return nullptr;
        }
    }
    return std::nullopt;
}

void ExecutionPipeline::finalize_pending() {
    while (!is_stopping()) {
        const auto next_block{next_final_block()};
        if (!next_block) break;

        const BlockHandle* block{*next_block};
        const Slot slot{final_->slot().next(settings_.thread_count)};
        const std::optional<BlockId> block_id{block ? std::optional<BlockId>{block->id} : std::nullopt};

        std::shared_ptr<const ExecutionOutput> output;
        if (!history_.empty() && history_.front()->slot == slot && history_.front()->block_id == block_id) {
            output = history_.front();
            if (settings_.verify_determinism) {
                const auto replayed{processor_.execute_slot(slot, block, StateView{final_})};
                if (replayed != *output) {
                    throw DeterminismViolation{slot, "speculative and final executions of block " +
                                                         block_name(block_id) + " differ"};
                }
            }
            history_.erase(history_.begin());
        } else {
            // The speculative history was built on another chain
            history_.clear();
            output = std::make_shared<const ExecutionOutput>(processor_.execute_slot(slot, block, StateView{final_}));
        }

        final_ = final_->apply(*output);
        ensure_invariant(final_->slot() == slot, [&]() {
            return "final cursor at " + final_->slot().to_string() + " after finalizing " + slot.to_string();
        });
        pending_final_.erase(slot);
        publish();
        COCOON_DEBUG_M("ExecutionPipeline", {"finalized", slot.to_string(), "block", block_name(block_id)});
    }
}

void ExecutionPipeline::reconcile() {
    const std::optional<Slot> latest{blockclique_.empty() ? std::nullopt
                                                          : std::optional<Slot>{blockclique_.rbegin()->first}};
    size_t keep{0};
    for (; keep < history_.size(); ++keep) {
        const auto& output{*history_[keep]};
        if (!latest || output.slot > *latest) break;
        const auto it{blockclique_.find(output.slot)};
        const std::optional<BlockId> block_id{it == blockclique_.end() ? std::nullopt
                                                                      : std::optional<BlockId>{it->second.id}};
        if (block_id != output.block_id) break;
    }
    if (keep < history_.size()) {
        COCOON_DEBUG_M("ExecutionPipeline", {"divergence", history_[keep]->slot.to_string(),
                                             "dropped", std::to_string(history_.size() - keep)});
        history_.resize(keep);
    }
}

void ExecutionPipeline::replay() {
    if (blockclique_.empty()) return;
    const Slot latest{blockclique_.rbegin()->first};
    Slot slot{(history_.empty() ? final_->slot() : history_.back()->slot).next(settings_.thread_count)};
    while (slot <= latest && !is_stopping()) {
        const auto it{blockclique_.find(slot)};
        const BlockHandle* block{it == blockclique_.end() ? nullptr : &it->second};
        history_.push_back(
            std::make_shared<const ExecutionOutput>(processor_.execute_slot(slot, block, StateView{final_, history_})));
        slot = slot.next(settings_.thread_count);
    }
}

void ExecutionPipeline::publish() {
    snapshots_.publish(ExecutionSnapshot{
        .final_state = final_,
        .history = std::make_shared<const ActiveHistory>(history_),
    });
}

}  // namespace cocoon::execution
