// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include <cocoon/core/types/address.hpp>
#include <cocoon/core/types/amount.hpp>
#include <cocoon/core/types/block.hpp>
#include <cocoon/core/types/hash.hpp>
#include <cocoon/core/types/operation.hpp>

namespace cocoon::test_util {

//! Identifier whose bytes are all zero except the last two, holding the given tag and seed
template <class T>
T make_id(uint8_t tag, uint64_t seed) {
    T id;
    id.bytes[0] = tag;
    for (size_t i{0}; i < sizeof(seed); ++i) {
        id.bytes[kHashLength - 1 - i] = static_cast<uint8_t>(seed >> (8 * i));
    }
    return id;
}

inline Address make_address(uint64_t seed) { return make_id<Address>(0x0a, seed); }
inline BlockId make_block_id(uint64_t seed) { return make_id<BlockId>(0x0b, seed); }
inline OperationId make_operation_id(uint64_t seed) { return make_id<OperationId>(0x0c, seed); }
inline EndorsementId make_endorsement_id(uint64_t seed) { return make_id<EndorsementId>(0x0d, seed); }

inline Amount coins(uint64_t count) { return *Amount::from_coins(count); }

inline Operation make_transfer(uint64_t seed, const Address& from, const Address& to, Amount amount,
                               Amount fee = {}, Period expire_period = kMaxPeriod) {
    return Operation{
        .id = make_operation_id(seed),
        .sender = from,
        .fee = fee,
        .expire_period = expire_period,
        .payload = Transaction{.recipient = to, .amount = amount},
    };
}

inline Operation make_roll_buy(uint64_t seed, const Address& from, RollCount count, Amount fee = {}) {
    return Operation{
        .id = make_operation_id(seed),
        .sender = from,
        .fee = fee,
        .expire_period = kMaxPeriod,
        .payload = RollBuy{.roll_count = count},
    };
}

inline Operation make_roll_sell(uint64_t seed, const Address& from, RollCount count, Amount fee = {}) {
    return Operation{
        .id = make_operation_id(seed),
        .sender = from,
        .fee = fee,
        .expire_period = kMaxPeriod,
        .payload = RollSell{.roll_count = count},
    };
}

inline Operation make_execute_sc(uint64_t seed, const Address& from, std::string_view bytecode, Gas max_gas,
                                 Amount gas_price = {}, Amount fee = {}) {
    return Operation{
        .id = make_operation_id(seed),
        .sender = from,
        .fee = fee,
        .expire_period = kMaxPeriod,
        .payload = ExecuteSC{.bytecode = to_bytes(bytecode), .max_gas = max_gas, .gas_price = gas_price},
    };
}

inline Operation make_call_sc(uint64_t seed, const Address& from, const Address& target, std::string function,
                              Gas max_gas, Amount parallel_coins = {}, Amount gas_price = {}, Amount fee = {}) {
    return Operation{
        .id = make_operation_id(seed),
        .sender = from,
        .fee = fee,
        .expire_period = kMaxPeriod,
        .payload = CallSC{
            .target = target,
            .function = std::move(function),
            .parameter = {},
            .max_gas = max_gas,
            .sequential_coins = {},
            .parallel_coins = parallel_coins,
            .gas_price = gas_price,
        },
    };
}

inline Block make_block(uint64_t seed, Slot slot, const Address& creator, const std::vector<Operation>& operations) {
    Block block{.id = make_block_id(seed), .slot = slot, .creator = creator, .operations = {}, .endorsements = {}};
    for (const auto& operation : operations) {
        block.operations.push_back(operation.id);
    }
    return block;
}

}  // namespace cocoon::test_util
