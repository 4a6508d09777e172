// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include "hash.hpp"
#include <variant>
#include <vector>

namespace merkle
{
/// The position of a sibling relative to the node on the opening path.
enum class Side : uint8_t
{
    left,
    right,
};

/// A single step of the opening path.
struct PathEntry
{
    hash256 sibling;
    Side side = Side::left;

    friend bool operator==(const PathEntry&, const PathEntry&) = default;
};

/// The inclusion proof of a single leaf.
///
/// The opening is self-contained: it can be verified against a root digest
/// without access to the tree it was taken from.
struct Opening
{
    uint64_t leaf_index = 0;

    /// The raw leaf data (the digest is recomputed by the verifier).
    bytes leaf_value;

    /// The sibling digests ordered from the leaf level up to the level below the root.
    std::vector<PathEntry> sibling_path;

    friend bool operator==(const Opening&, const Opening&) = default;
};

/// Checks the opening structure without hashing.
///
/// The opening is malformed if the path is longer than MAX_HEIGHT_LIMIT, the leaf index does not
/// fit the path length, or a side of a path entry disagrees with the bit of the leaf index
/// for this level.
///
/// @return  SUCCESS or MALFORMED_OPENING.
[[nodiscard]] std::error_code validate_opening(const Opening& opening) noexcept;

/// Verifies the opening against the root digest.
///
/// Never reports an error: a malformed opening (see validate_opening()) is not valid.
[[nodiscard]] bool verify_opening(
    const HashFunction& hash, const Opening& opening, const hash256& expected_root);

/// Verifies the opening against the root digest of a tree of the given height.
/// Openings with the path length different from the height are not valid.
[[nodiscard]] bool verify_opening(const HashFunction& hash, const Opening& opening,
    const hash256& expected_root, size_t height);

/// Encodes the opening as RLP list [leaf_index, leaf_value, [[sibling, side]...]].
/// The side is encoded as 0 (left) or 1 (right).
[[nodiscard]] bytes encode_opening(const Opening& opening);

/// Decodes the opening from the RLP encoding.
///
/// @return  The opening or MALFORMED_OPENING in case the input is not an exact encoding
///          of a structurally valid opening.
[[nodiscard]] std::variant<Opening, std::error_code> decode_opening(bytes_view input);

}  // namespace merkle
