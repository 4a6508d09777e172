// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include <merkle/merkle.hpp>

namespace merkle
{
const char* version() noexcept
{
    return MERKLE_VERSION;
}
}  // namespace merkle
