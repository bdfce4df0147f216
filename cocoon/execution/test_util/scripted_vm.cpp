// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "scripted_vm.hpp"

#include <charconv>
#include <optional>
#include <string>

#include <cocoon/core/common/bytes.hpp>

namespace cocoon::execution::test_util {

static std::string_view as_text(ByteView bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

//! Split the first whitespace-separated word off text
static std::string_view next_word(std::string_view& text) {
    const auto start{text.find_first_not_of(' ')};
    if (start == std::string_view::npos) {
        text = {};
        return {};
    }
    text.remove_prefix(start);
    const auto end{text.find(' ')};
    const auto word{text.substr(0, end)};
    text.remove_prefix(end == std::string_view::npos ? text.size() : end + 1);
    return word;
}

static std::optional<uint64_t> parse_number(std::string_view text) {
    uint64_t value{0};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) return std::nullopt;
    return value;
}

CallResult ScriptedVm::run_main(Host& host, ByteView bytecode, Gas max_gas) {
    return run_script(host, as_text(bytecode), max_gas);
}

CallResult ScriptedVm::run_function(Host& host, ByteView bytecode, std::string_view function, ByteView /*parameter*/,
                                    Gas max_gas) {
    std::string_view contract{as_text(bytecode)};
    while (!contract.empty()) {
        const auto end{contract.find('|')};
        const auto section{contract.substr(0, end)};
        contract.remove_prefix(end == std::string_view::npos ? contract.size() : end + 1);
        const auto colon{section.find(':')};
        if (colon != std::string_view::npos && section.substr(0, colon) == function) {
            return run_script(host, section.substr(colon + 1), max_gas);
        }
    }
    return CallResult{CallStatus::kTrap, 0, "unknown function " + std::string{function}};
}

CallResult ScriptedVm::run_script(Host& host, std::string_view script, Gas max_gas) {
    ++call_count_;
    Gas gas_used{0};
    auto consume = [&](Gas amount) {
        gas_used += amount;
        return gas_used <= max_gas;
    };
    auto out_of_gas = [&]() { return CallResult{CallStatus::kOutOfGas, max_gas, "out of gas"}; };

    while (!script.empty()) {
        const auto end{script.find(';')};
        std::string_view command{script.substr(0, end)};
        const std::string_view rest{end == std::string_view::npos ? std::string_view{} : script.substr(end + 1)};
        script = rest;

        if (!consume(1)) return out_of_gas();
        const auto op{next_word(command)};
        if (op.empty()) {
            continue;
        } else if (op == "emit") {
            host.emit_event(std::string{command});
        } else if (op == "set") {
            const auto key{next_word(command)};
            host.set_data(to_bytes(key), to_bytes(command));
        } else if (op == "del") {
            host.delete_data(to_bytes(next_word(command)));
        } else if (op == "transfer") {
            const auto to{hash_from_hex<Address>(next_word(command))};
            const auto coins{parse_number(next_word(command))};
            if (!to || !coins) return CallResult{CallStatus::kTrap, gas_used, "malformed transfer"};
            if (!host.transfer_coins(*to, *Amount::from_coins(*coins))) {
                return CallResult{CallStatus::kTrap, gas_used, "transfer failed"};
            }
        } else if (op == "gas") {
            const auto amount{parse_number(command)};
            if (!amount) return CallResult{CallStatus::kTrap, gas_used, "malformed gas"};
            if (!consume(*amount)) return out_of_gas();
        } else if (op == "trap") {
            return CallResult{CallStatus::kTrap, gas_used, std::string{command}};
        } else if (op == "call") {
            const auto target{hash_from_hex<Address>(next_word(command))};
            const auto function{next_word(command)};
            if (!target) return CallResult{CallStatus::kTrap, gas_used, "malformed call"};
            const auto result{host.call(*target, function, {}, max_gas - gas_used, Amount{})};
            if (!consume(result.gas_used)) return out_of_gas();
            if (!result.success()) return CallResult{result.status, gas_used, result.message};
        } else if (op == "counter") {
            host.emit_event(std::to_string(call_count_.load()));
        } else if (op == "deploy") {
            // The contract may contain ';' so it takes the rest of the script
            std::string contract{command};
            if (!rest.empty()) {
                contract += ";";
                contract += rest;
            }
            const auto address{host.create_sc(to_bytes(contract))};
            host.emit_event(address.to_hex());
            break;
        } else {
            return CallResult{CallStatus::kTrap, gas_used, "unknown command " + std::string{op}};
        }
    }
    return CallResult{CallStatus::kSuccess, gas_used, {}};
}

}  // namespace cocoon::execution::test_util
