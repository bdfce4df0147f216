// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "execution_context.hpp"

#include <utility>

#include <cocoon/core/common/util.hpp>
#include <cocoon/infra/common/ensure.hpp>

namespace cocoon::execution {

//! Leading byte of smart contract addresses
static constexpr uint8_t kScAddressMarker{0x5c};

ExecutionContext::ExecutionContext(SlotState& state, VirtualMachine& vm, std::vector<Address> call_stack,
                                   Amount gas_price, ExecutionOrigin origin, uint64_t& created_sc_count)
    : state_{state},
      vm_{vm},
      call_stack_{std::move(call_stack)},
      gas_price_{gas_price},
      origin_{std::move(origin)},
      created_sc_count_{created_sc_count} {}

const Address& ExecutionContext::current_address() const {
    ensure(!call_stack_.empty(), "ExecutionContext: empty call stack");
    return call_stack_.back();
}

Address ExecutionContext::derive_sc_address(const Slot& slot, uint64_t index, bool read_only) {
    Bytes buffer;
    buffer.reserve(kHashLength);
    buffer.push_back(kScAddressMarker);
    append_big_endian(buffer, slot.period);
    buffer.push_back(slot.thread);
    append_big_endian(buffer, index);
    buffer.push_back(read_only ? 1 : 0);
    buffer.resize(kHashLength, 0);
    return Address{buffer};
}

CallResult ExecutionContext::run_main(ByteView bytecode, Gas max_gas) {
    const auto snapshot{state_.take_snapshot()};
    auto result{vm_.run_main(*this, bytecode, max_gas)};
    if (!result.success()) {
        state_.revert_to_snapshot(snapshot);
    }
    return result;
}

CallResult ExecutionContext::call_function(const Address& target, std::string_view function, ByteView parameter,
                                           Gas max_gas, Amount parallel_coins, Amount sequential_coins) {
    const auto bytecode{state_.get_bytecode(target)};
    if (!bytecode || bytecode->empty()) {
        return CallResult{CallStatus::kTargetNotFound, 0, "no smart contract at " + target.to_hex()};
    }

    const auto snapshot{state_.take_snapshot()};
    const Address caller{current_address()};
    if (!parallel_coins.is_zero() && !state_.transfer_parallel(caller, target, parallel_coins)) {
        return CallResult{CallStatus::kTrap, 0, "insufficient parallel balance for coins " + parallel_coins.to_string()};
    }
    if (!sequential_coins.is_zero() && !state_.transfer_sequential(caller, target, sequential_coins)) {
        state_.revert_to_snapshot(snapshot);
        return CallResult{CallStatus::kTrap, 0,
                          "insufficient sequential balance for coins " + sequential_coins.to_string()};
    }

    call_stack_.push_back(target);
    auto result{vm_.run_function(*this, *bytecode, function, parameter, max_gas)};
    call_stack_.pop_back();

    if (!result.success()) {
        state_.revert_to_snapshot(snapshot);
    }
    return result;
}

void ExecutionContext::emit_error_event(std::string message) {
    state_.add_event(SCOutputEvent{.context = make_event_context(/*is_error=*/true), .data = std::move(message)});
}

std::optional<Amount> ExecutionContext::get_balance(const Address& address) const {
    return state_.get_parallel_balance(address);
}

std::optional<Bytes> ExecutionContext::get_data(const Bytes& key) const {
    return state_.get_data_entry(current_address(), key);
}

void ExecutionContext::set_data(const Bytes& key, Bytes value) {
    state_.set_data_entry(current_address(), key, std::move(value));
}

void ExecutionContext::delete_data(const Bytes& key) {
    state_.delete_data_entry(current_address(), key);
}

bool ExecutionContext::transfer_coins(const Address& to, Amount amount) {
    return state_.transfer_parallel(current_address(), to, amount);
}

Address ExecutionContext::create_sc(Bytes bytecode) {
    const Address address{derive_sc_address(state_.slot(), created_sc_count_++, origin_.read_only)};
    state_.set_bytecode(address, std::move(bytecode));
    return address;
}

CallResult ExecutionContext::call(const Address& target, std::string_view function, ByteView parameter, Gas max_gas,
                                  Amount coins) {
    return call_function(target, function, parameter, max_gas, coins, Amount{});
}

void ExecutionContext::emit_event(std::string data) {
    state_.add_event(SCOutputEvent{.context = make_event_context(/*is_error=*/false), .data = std::move(data)});
}

EventExecutionContext ExecutionContext::make_event_context(bool is_error) const {
    return EventExecutionContext{
        .slot = state_.slot(),
        .block_id = origin_.block_id,
        .read_only = origin_.read_only,
        .index_in_slot = 0,
        .call_stack = call_stack_,
        .origin_operation_id = origin_.operation_id,
        .is_final = false,
        .is_error = is_error,
    };
}

}  // namespace cocoon::execution
