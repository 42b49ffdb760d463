/*
 * Copyright (c) 2025 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <string>

#include "spdlog/fmt/fmt.h"

#include "batch_quad/parse_verbosity.hpp"

namespace spdlog::level {

bool AbslParseFlag(absl::string_view text, level_enum *level, std::string *error) {
    const std::string name(text);

    /* from_str() maps unknown names to off */
    const level_enum parsed = from_str(name);
    if (parsed == off && name != "off") {
        *error = fmt::format("Invalid verbosity {}", name);
        return false;
    }

    *level = parsed;
    return true;
}

std::string AbslUnparseFlag(level_enum level) {
    const auto name = to_string_view(level);
    return std::string(name.data(), name.size());
}

}; /* namespace spdlog::level */
