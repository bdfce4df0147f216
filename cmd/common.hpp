// Copyright 2025 The Cocoon Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <cocoon/execution/settings.hpp>
#include <cocoon/infra/common/log.hpp>

namespace cocoon::cmd {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up options to populate the consensus and gas settings of the execution worker
void add_execution_options(CLI::App& cli, execution::ExecutionSettings& settings);

}  // namespace cocoon::cmd
