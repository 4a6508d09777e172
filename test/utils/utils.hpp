// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/hex.hpp>
#include <merkle/hash.hpp>
#include <atomic>
#include <memory>
#include <string_view>
#include <vector>

namespace merkle::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_spaced_hex;
using evmc::hex;

/// Non-cryptographic 256-bit digest: four FNV-1a lanes with different offset bases.
///
/// Inputs of equal length differing in a single byte always have different digests.
hash256 fnv_digest(bytes_view data) noexcept;

/// The deterministic, domain-separated hash function for tests.
std::shared_ptr<const HashFunction> test_hash();

/// The hash function wrapper counting the calls.
class CountingHash : public HashFunction
{
    std::shared_ptr<const HashFunction> m_inner;

public:
    mutable std::atomic<size_t> num_leaf_calls = 0;
    mutable std::atomic<size_t> num_internal_calls = 0;

    explicit CountingHash(std::shared_ptr<const HashFunction> inner) noexcept
      : m_inner{std::move(inner)}
    {}

    [[nodiscard]] hash256 hash_leaf(bytes_view data) const override
    {
        ++num_leaf_calls;
        return m_inner->hash_leaf(data);
    }

    [[nodiscard]] hash256 hash_internal(const hash256& left, const hash256& right) const override
    {
        ++num_internal_calls;
        return m_inner->hash_internal(left, right);
    }
};

/// Converts a string to bytes by casting individual characters.
inline bytes to_bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

/// Produces bytes out of string literal.
inline bytes operator""_b(const char* data, size_t size)
{
    return to_bytes({data, size});
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

/// Produces n distinct leaves: "leaf0", "leaf1", ...
std::vector<bytes> make_leaves(size_t n);

}  // namespace merkle::test
