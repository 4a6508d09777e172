// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tree.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace merkle
{
MerkleTree::MerkleTree(std::shared_ptr<const HashFunction> hash, size_t height)
  : m_hash{std::move(hash)},
    m_height{height},
    m_nodes(level_order::node_count(height)),
    m_values(level_order::leaf_count(height))
{}

std::variant<MerkleTree, std::error_code> MerkleTree::build_from_height(
    std::shared_ptr<const HashFunction> hash, size_t height, std::span<const bytes> leaves,
    const TreeConfig& config)
{
    if (hash == nullptr)
        throw std::invalid_argument("build_from_height: null hash function");

    if (height > config.max_height || height > MAX_HEIGHT_LIMIT)
        return make_error_code(INVALID_HEIGHT);
    if (leaves.size() > level_order::leaf_count(height))
        return make_error_code(TOO_MANY_LEAVES);

    MerkleTree tree{std::move(hash), height};
    if (config.trace)
        tree.add_tracer(create_update_tracer(std::clog));

    const auto& h = *tree.m_hash;
    const auto first_leaf = level_order::first_leaf(height);
    const auto default_leaf = h.hash_leaf({});

    for (size_t i = 0; i < tree.capacity(); ++i)
    {
        if (i < leaves.size())
        {
            tree.m_values[i] = leaves[i];
            tree.m_nodes[first_leaf + i].digest = h.hash_leaf(leaves[i]);
        }
        else
            tree.m_nodes[first_leaf + i].digest = default_leaf;
    }

    // Every child has a higher index than its parent.
    for (auto i = first_leaf; i-- > 0;)
    {
        tree.m_nodes[i].digest = h.hash_internal(tree.m_nodes[level_order::left_child(i)].digest,
            tree.m_nodes[level_order::right_child(i)].digest);
    }

    tree.m_size = leaves.size();

    if (tree.m_first_tracer)
        tree.m_first_tracer->notify_build(height, leaves.size(), tree.get_root());
    return tree;
}

void MerkleTree::set_stale(size_t node_index, bool stale) noexcept
{
    auto& node = m_nodes[node_index];
    if (node.stale == stale)
        return;
    node.stale = stale;
    if (stale)
        ++m_num_stale;
    else
        --m_num_stale;
}

void MerkleTree::update_node(size_t node_index)
{
    const auto& left = m_nodes[level_order::left_child(node_index)];
    const auto& right = m_nodes[level_order::right_child(node_index)];
    m_nodes[node_index].digest = m_hash->hash_internal(left.digest, right.digest);

    // The node stays stale while any subtree still waits for an update.
    set_stale(node_index, left.stale || right.stale);

    if (m_first_tracer)
        m_first_tracer->notify_internal_update(node_index, m_nodes[node_index].digest);
}

std::error_code MerkleTree::insert(size_t index, bytes_view data)
{
    if (index >= capacity())
        return make_error_code(INDEX_OUT_OF_BOUNDS);

    const auto node_index = level_order::first_leaf(m_height) + index;
    m_nodes[node_index].digest = m_hash->hash_leaf(data);
    m_values[index] = data;
    m_size = std::max(m_size, index + 1);

    if (m_first_tracer)
        m_first_tracer->notify_leaf_write(index, m_nodes[node_index].digest);

    // The ancestors of a stale node are already stale.
    for (auto i = node_index; i != 0;)
    {
        i = level_order::parent(i);
        if (m_nodes[i].stale)
            break;
        set_stale(i, true);
    }
    return make_error_code(SUCCESS);
}

std::error_code MerkleTree::update_internal_nodes(size_t index)
{
    if (index >= capacity())
        return make_error_code(INDEX_OUT_OF_BOUNDS);

    for (auto i = level_order::first_leaf(m_height) + index; i != 0;)
    {
        i = level_order::parent(i);
        update_node(i);
    }
    return make_error_code(SUCCESS);
}

void MerkleTree::update_internal_nodes()
{
    for (auto i = level_order::first_leaf(m_height); i-- > 0 && m_num_stale != 0;)
    {
        if (m_nodes[i].stale)
            update_node(i);
    }
}

std::error_code MerkleTree::set(size_t index, bytes_view data)
{
    if (const auto ec = insert(index, data); ec)
        return ec;
    return update_internal_nodes(index);
}

std::variant<size_t, std::error_code> MerkleTree::append(bytes_view data)
{
    if (m_size == capacity())
        return make_error_code(TREE_FULL);

    const auto index = m_size;
    if (const auto ec = set(index, data); ec)
        return ec;
    return index;
}

std::variant<hash256, std::error_code> MerkleTree::get_value(size_t index) const
{
    if (index >= capacity())
        return make_error_code(INDEX_OUT_OF_BOUNDS);
    return m_nodes[level_order::first_leaf(m_height) + index].digest;
}

std::variant<Opening, std::error_code> MerkleTree::get_opening(size_t index) const
{
    if (index >= capacity())
        return make_error_code(INDEX_OUT_OF_BOUNDS);

    Opening opening{index, m_values[index], {}};
    opening.sibling_path.reserve(m_height);
    for (auto i = level_order::first_leaf(m_height) + index; i != 0; i = level_order::parent(i))
    {
        const auto side = level_order::is_left_child(i) ? Side::right : Side::left;
        opening.sibling_path.push_back({m_nodes[level_order::sibling(i)].digest, side});
    }

    if (m_first_tracer)
        m_first_tracer->notify_opening(index);
    return opening;
}
}  // namespace merkle
