// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cocoon/core/state/slot_state.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/execution/vm.hpp>

namespace cocoon::execution {

//! Where the bytecode run by an ExecutionContext comes from
struct ExecutionOrigin {
    std::optional<BlockId> block_id;
    std::optional<OperationId> operation_id;
    bool read_only{false};
};

//! \brief Host implementation binding a virtual machine run to a SlotState.
//! \details One context is created per operation (or read-only request). Every call it runs is atomic: a failed
//! call leaves no trace in the slot state besides the events emitted afterwards.
class ExecutionContext : public Host {
  public:
    //! \param created_sc_count per-slot counter of created smart contracts, shared by all contexts of a slot
    ExecutionContext(SlotState& state, VirtualMachine& vm, std::vector<Address> call_stack, Amount gas_price,
                     ExecutionOrigin origin, uint64_t& created_sc_count);

    //! Run the main entrypoint of bytecode on behalf of the current address
    CallResult run_main(ByteView bytecode, Gas max_gas);

    //! Transfer coins from the current address to target and run one of its functions
    CallResult call_function(const Address& target, std::string_view function, ByteView parameter, Gas max_gas,
                             Amount parallel_coins, Amount sequential_coins);

    //! Event reporting a failed execution
    void emit_error_event(std::string message);

    //! Deterministic address of the index-th smart contract created during slot
    static Address derive_sc_address(const Slot& slot, uint64_t index, bool read_only);

    Slot current_slot() const override { return state_.slot(); }
    const std::vector<Address>& call_stack() const override { return call_stack_; }
    Amount gas_price() const override { return gas_price_; }

    std::optional<Amount> get_balance(const Address& address) const override;

    std::optional<Bytes> get_data(const Bytes& key) const override;
    void set_data(const Bytes& key, Bytes value) override;
    void delete_data(const Bytes& key) override;

    bool transfer_coins(const Address& to, Amount amount) override;

    Address create_sc(Bytes bytecode) override;

    CallResult call(const Address& target, std::string_view function, ByteView parameter, Gas max_gas,
                    Amount coins) override;

    void emit_event(std::string data) override;

  private:
    const Address& current_address() const;
    EventExecutionContext make_event_context(bool is_error) const;

    SlotState& state_;
    VirtualMachine& vm_;
    std::vector<Address> call_stack_;
    Amount gas_price_;
    ExecutionOrigin origin_;
    uint64_t& created_sc_count_;
};

}  // namespace cocoon::execution
