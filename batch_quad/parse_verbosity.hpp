/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "absl/strings/string_view.h"
#include "spdlog/common.h"

namespace spdlog::level {

/**
 * @brief Parse a logging verbosity level from a command line flag.
 *
 * Accepts the spdlog level names ("trace", "debug", "info", "warning", "error", "critical", "off") and the short
 * forms "warn" and "err".
 *
 * @param[in] text   Flag value.
 * @param[out] level Parsed verbosity level.
 * @param[out] error Error message if parsing fails.
 *
 * @returns True if the level was recognized, false otherwise.
 */
bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error);

/**
 * @brief Convert a verbosity level to its flag form.
 */
std::string AbslUnparseFlag(level_enum level);

}; /* namespace spdlog::level */
