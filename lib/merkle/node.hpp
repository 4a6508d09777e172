// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash.hpp"
#include <cstddef>

namespace merkle
{
/// The tree node: a single slot of the complete binary tree.
///
/// Nodes are stored in level order: the root at index 0 and the children of the node i
/// at 2i+1 (left) and 2i+2 (right). Whether a node is a leaf follows from its index
/// and the tree height.
struct Node
{
    hash256 digest;

    /// The digest of an internal node is outdated by a leaf write below it.
    bool stale = false;
};

/// Level-order index arithmetic.
namespace level_order
{
[[nodiscard]] constexpr size_t left_child(size_t i) noexcept
{
    return 2 * i + 1;
}

[[nodiscard]] constexpr size_t right_child(size_t i) noexcept
{
    return 2 * i + 2;
}

[[nodiscard]] constexpr size_t parent(size_t i) noexcept
{
    return (i - 1) / 2;
}

/// The sibling of a non-root node.
[[nodiscard]] constexpr size_t sibling(size_t i) noexcept
{
    return (i % 2 != 0) ? i + 1 : i - 1;
}

[[nodiscard]] constexpr bool is_left_child(size_t i) noexcept
{
    return i % 2 != 0;
}

/// The number of leaves of a tree of the given height.
[[nodiscard]] constexpr size_t leaf_count(size_t height) noexcept
{
    return size_t{1} << height;
}

/// The number of nodes of a tree of the given height.
[[nodiscard]] constexpr size_t node_count(size_t height) noexcept
{
    return 2 * leaf_count(height) - 1;
}

/// The node index of the first (leftmost) leaf.
[[nodiscard]] constexpr size_t first_leaf(size_t height) noexcept
{
    return leaf_count(height) - 1;
}
}  // namespace level_order
}  // namespace merkle
