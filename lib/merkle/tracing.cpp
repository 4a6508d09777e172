// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include <array>

namespace merkle
{
namespace
{
class UpdateTracer : public Tracer
{
    std::ostream& m_out;  ///< Output stream.

    void on_build(size_t height, size_t num_leaves, const hash256& root) noexcept override
    {
        m_out << R"({"event":"build","height":)" << height << R"(,"leaves":)" << num_leaves
              << R"(,"root":"0x)" << hex(root) << "\"}\n";
    }

    void on_leaf_write(size_t index, const hash256& digest) noexcept override
    {
        m_out << R"({"event":"leaf","index":)" << index << R"(,"digest":"0x)" << hex(digest)
              << "\"}\n";
    }

    void on_internal_update(size_t node_index, const hash256& digest) noexcept override
    {
        m_out << R"({"event":"internal","node":)" << node_index << R"(,"digest":"0x)"
              << hex(digest) << "\"}\n";
    }

    void on_opening(size_t index) noexcept override
    {
        m_out << R"({"event":"opening","index":)" << index << "}\n";
    }

public:
    explicit UpdateTracer(std::ostream& out) noexcept : m_out{out} {}
};

/// @see create_counting_tracer()
class CountingTracer : public Tracer
{
    enum Event : size_t
    {
        build,
        leaf,
        internal,
        opening,
    };

    static constexpr std::array<const char*, 4> event_names{"build", "leaf", "internal", "opening"};

    std::array<size_t, event_names.size()> m_counts{};
    std::ostream& m_out;

    void on_build(size_t /*height*/, size_t /*num_leaves*/, const hash256& /*root*/) noexcept override
    {
        ++m_counts[build];
    }

    void on_leaf_write(size_t /*index*/, const hash256& /*digest*/) noexcept override
    {
        ++m_counts[leaf];
    }

    void on_internal_update(size_t /*node_index*/, const hash256& /*digest*/) noexcept override
    {
        ++m_counts[internal];
    }

    void on_opening(size_t /*index*/) noexcept override { ++m_counts[opening]; }

public:
    explicit CountingTracer(std::ostream& out) noexcept : m_out{out} {}

    ~CountingTracer() noexcept override
    {
        m_out << "--- # TREE EVENTS\nevent,count\n";
        for (size_t i = 0; i < m_counts.size(); ++i)
        {
            if (m_counts[i] != 0)
                m_out << event_names[i] << ',' << m_counts[i] << '\n';
        }
    }
};
}  // namespace

std::unique_ptr<Tracer> create_update_tracer(std::ostream& out)
{
    return std::make_unique<UpdateTracer>(out);
}

std::unique_ptr<Tracer> create_counting_tracer(std::ostream& out)
{
    return std::make_unique<CountingTracer>(out);
}
}  // namespace merkle
