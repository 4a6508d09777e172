// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include "hash.hpp"
#include "node.hpp"
#include "opening.hpp"
#include "options.hpp"
#include "tracing.hpp"
#include <memory>
#include <span>
#include <variant>
#include <vector>

namespace merkle
{
/// The dense binary Merkle tree of a fixed height.
///
/// The tree has 2^height leaves. Leaves not written explicitly hold the default value:
/// the empty byte string.
///
/// Writing a leaf is a two-phase protocol: insert() replaces the leaf digest and only marks the
/// leaf ancestors as stale, update_internal_nodes() recomputes them. Between the phases
/// get_root() and get_opening() return the stale digests. This makes batches of writes
/// cheap: call insert() for every leaf and a single update_internal_nodes() at the end.
/// Use set() when every write must be immediately visible.
///
/// The tree is not synchronized. A sequence of insert() and update_internal_nodes() must not
/// be interleaved with any other access to the tree.
class MerkleTree
{
    std::shared_ptr<const HashFunction> m_hash;
    size_t m_height = 0;

    /// One past the highest leaf index written so far.
    size_t m_size = 0;

    /// All nodes in level order.
    std::vector<Node> m_nodes;

    /// The raw data of the leaves, kept to be embedded in openings.
    std::vector<bytes> m_values;

    /// The number of stale nodes.
    size_t m_num_stale = 0;

    std::unique_ptr<Tracer> m_first_tracer;

    MerkleTree(std::shared_ptr<const HashFunction> hash, size_t height);

    /// Recomputes the digest of the internal node out of its children.
    void update_node(size_t node_index);

    void set_stale(size_t node_index, bool stale) noexcept;

public:
    MerkleTree(MerkleTree&&) noexcept = default;
    MerkleTree& operator=(MerkleTree&&) noexcept = default;

    /// Builds the tree of the given height out of the leaves.
    ///
    /// The leaves are written at indexes 0, 1, 2, ..., the remaining leaves get the default value.
    /// All internal digests are computed bottom-up in a single pass.
    ///
    /// @param hash    The hash function shared with the tree.
    /// @param height  The number of levels below the root. Height 0 is a single leaf.
    /// @param leaves  The leaf data, at most 2^height items.
    /// @param config  The configuration.
    /// @return        The tree, INVALID_HEIGHT if the height is above config.max_height
    ///                (or MAX_HEIGHT_LIMIT), or TOO_MANY_LEAVES.
    /// @throws std::invalid_argument if the hash function is null.
    [[nodiscard]] static std::variant<MerkleTree, std::error_code> build_from_height(
        std::shared_ptr<const HashFunction> hash, size_t height, std::span<const bytes> leaves = {},
        const TreeConfig& config = {});

    /// Writes the leaf without updating its ancestors.
    ///
    /// @return  SUCCESS or INDEX_OUT_OF_BOUNDS.
    std::error_code insert(size_t index, bytes_view data);

    /// Recomputes the ancestors of the leaf, from the leaf parent up to the root.
    ///
    /// @return  SUCCESS or INDEX_OUT_OF_BOUNDS.
    std::error_code update_internal_nodes(size_t index);

    /// Recomputes all stale internal nodes.
    void update_internal_nodes();

    /// Writes the leaf and recomputes its ancestors.
    std::error_code set(size_t index, bytes_view data);

    /// Writes the leaf at the index size() and recomputes its ancestors.
    ///
    /// @return  The index of the written leaf or TREE_FULL.
    std::variant<size_t, std::error_code> append(bytes_view data);

    [[nodiscard]] const hash256& get_root() const noexcept { return m_nodes[0].digest; }

    /// Returns the digest of the leaf or INDEX_OUT_OF_BOUNDS.
    [[nodiscard]] std::variant<hash256, std::error_code> get_value(size_t index) const;

    /// Creates the opening of the leaf or returns INDEX_OUT_OF_BOUNDS.
    [[nodiscard]] std::variant<Opening, std::error_code> get_opening(size_t index) const;

    [[nodiscard]] bool has_pending_updates() const noexcept { return m_num_stale != 0; }

    [[nodiscard]] size_t height() const noexcept { return m_height; }
    [[nodiscard]] size_t capacity() const noexcept { return level_order::leaf_count(m_height); }
    [[nodiscard]] size_t size() const noexcept { return m_size; }
    [[nodiscard]] const HashFunction& hash_function() const noexcept { return *m_hash; }

    void add_tracer(std::unique_ptr<Tracer> tracer) noexcept
    {
        // Find the first empty unique_ptr and assign the new tracer to it.
        auto* end = &m_first_tracer;
        while (*end)
            end = &(*end)->m_next_tracer;
        *end = std::move(tracer);
    }

    [[nodiscard]] Tracer* get_tracer() const noexcept { return m_first_tracer.get(); }
};
}  // namespace merkle
