// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <merkle/errors.hpp>
#include <merkle/hash.hpp>
#include <merkle/opening.hpp>
#include <merkle/options.hpp>
#include <merkle/tracing.hpp>
#include <merkle/tree.hpp>

/// The library version string, e.g. "0.1.0".
#define MERKLE_VERSION PROJECT_VERSION

namespace merkle
{
/// Returns the library version.
const char* version() noexcept;
}  // namespace merkle
