// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "options.hpp"
#include <charconv>

namespace merkle
{
SetOptionResult set_option(TreeConfig& config, std::string_view name, std::string_view value)
{
    if (name == "max_height")
    {
        size_t max_height = 0;
        const auto end = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(value.data(), end, max_height);
        if (value.empty() || ec != std::errc{} || ptr != end || max_height > MAX_HEIGHT_LIMIT)
            return SetOptionResult::invalid_value;
        config.max_height = max_height;
        return SetOptionResult::success;
    }
    else if (name == "trace")
    {
        if (value == "yes")
            config.trace = true;
        else if (value == "no")
            config.trace = false;
        else
            return SetOptionResult::invalid_value;
        return SetOptionResult::success;
    }
    return SetOptionResult::invalid_name;
}
}  // namespace merkle
