// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash.hpp"
#include <memory>
#include <ostream>

namespace merkle
{
class Tracer
{
    friend class MerkleTree;  // Has access the m_next_tracer to traverse the list forward.
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    void notify_build(  // NOLINT(misc-no-recursion)
        size_t height, size_t num_leaves, const hash256& root) noexcept
    {
        on_build(height, num_leaves, root);
        if (m_next_tracer)
            m_next_tracer->notify_build(height, num_leaves, root);
    }

    void notify_leaf_write(size_t index, const hash256& digest) noexcept  // NOLINT(misc-no-recursion)
    {
        on_leaf_write(index, digest);
        if (m_next_tracer)
            m_next_tracer->notify_leaf_write(index, digest);
    }

    void notify_internal_update(  // NOLINT(misc-no-recursion)
        size_t node_index, const hash256& digest) noexcept
    {
        on_internal_update(node_index, digest);
        if (m_next_tracer)
            m_next_tracer->notify_internal_update(node_index, digest);
    }

    void notify_opening(size_t index) noexcept  // NOLINT(misc-no-recursion)
    {
        on_opening(index);
        if (m_next_tracer)
            m_next_tracer->notify_opening(index);
    }

private:
    virtual void on_build(size_t height, size_t num_leaves, const hash256& root) noexcept = 0;
    virtual void on_leaf_write(size_t index, const hash256& digest) noexcept = 0;
    virtual void on_internal_update(size_t node_index, const hash256& digest) noexcept = 0;
    virtual void on_opening(size_t index) noexcept = 0;
};

/// Creates the tracer which reports every tree event as a single-line JSON object.
///
/// @param out  Report output stream.
/// @return     Update tracer object.
std::unique_ptr<Tracer> create_update_tracer(std::ostream& out);

/// Creates the tracer which counts tree events and reports the totals in CSV format
/// when destroyed (together with the tree owning it).
std::unique_ptr<Tracer> create_counting_tracer(std::ostream& out);

}  // namespace merkle
