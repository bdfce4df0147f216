// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

namespace cocoon::cmd {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->capture_default_str()
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log_settings.log_verbosity);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_execution_options(CLI::App& cli, execution::ExecutionSettings& settings) {
    auto& exec_opts = *cli.add_option_group("Execution", "Execution settings");
    exec_opts
        .add_option_function<uint32_t>(
            "--threads", [&settings](uint32_t value) { settings.thread_count = static_cast<uint8_t>(value); },
            "Number of block production threads")
        ->check(CLI::Range(1, 255));
    exec_opts.add_option("--periods.per.cycle", settings.periods_per_cycle, "Number of periods in a roll cycle")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    exec_opts.add_option("--cycle.history", settings.cycle_history_length, "Number of roll cycles kept in history")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    exec_opts.add_option("--gas.block", settings.max_gas_per_block, "Maximum gas booked by the operations of a block")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    exec_opts.add_option("--gas.readonly", settings.max_read_only_gas, "Maximum gas of a read-only request")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    exec_opts.add_option_function<std::string>(
        "--block.reward",
        [&settings](const std::string& value) {
            const auto reward{Amount::from_string(value)};
            if (!reward) throw CLI::ValidationError("--block.reward", "invalid amount " + value);
            settings.block_reward = *reward;
        },
        "Coins minted for each produced block (e.g. 0.3)");
    exec_opts.add_option_function<std::string>(
        "--roll.price",
        [&settings](const std::string& value) {
            const auto price{Amount::from_string(value)};
            if (!price || price->is_zero()) throw CLI::ValidationError("--roll.price", "invalid amount " + value);
            settings.roll_price = *price;
        },
        "Price of one roll in coins");
    exec_opts.add_flag("!--no.verify.determinism", settings.verify_determinism,
                       "Skip re-execution of speculative slots upon finalization");
}

}  // namespace cocoon::cmd
