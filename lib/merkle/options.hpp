// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string_view>

namespace merkle
{
/// The default bound of the tree height: 2^21 - 1 nodes, 64 MiB of digests.
constexpr size_t DEFAULT_MAX_HEIGHT = 20;

/// The absolute bound of the tree height. Also bounds the length of a verifiable opening.
constexpr size_t MAX_HEIGHT_LIMIT = 30;

/// The tree construction configuration.
struct TreeConfig
{
    /// Trees higher than this are rejected with INVALID_HEIGHT.
    size_t max_height = DEFAULT_MAX_HEIGHT;

    /// Attach the update tracer writing to std::clog to every built tree.
    bool trace = false;
};

enum class SetOptionResult
{
    success,
    invalid_name,
    invalid_value,
};

/// Sets the configuration option by name.
///
/// Known options:
/// - "max_height": decimal number in [0, MAX_HEIGHT_LIMIT],
/// - "trace": "yes" or "no".
SetOptionResult set_option(TreeConfig& config, std::string_view name, std::string_view value);

}  // namespace merkle
