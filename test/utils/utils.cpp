// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "utils.hpp"
#include <string>

namespace merkle::test
{
hash256 fnv_digest(bytes_view data) noexcept
{
    static constexpr uint64_t prime = 0x100000001b3;
    static constexpr uint64_t offset_bases[]{
        0xcbf29ce484222325, 0x84222325cbf29ce4, 0x9ce4cbf284222325, 0x2325cbf29ce48422};

    hash256 h;
    for (size_t lane = 0; lane < std::size(offset_bases); ++lane)
    {
        auto state = offset_bases[lane];
        for (const auto b : data)
            state = (state ^ b) * prime;
        for (size_t i = 0; i < sizeof(state); ++i)
            h.bytes[lane * sizeof(state) + i] = static_cast<uint8_t>(state >> (56 - 8 * i));
    }
    return h;
}

std::shared_ptr<const HashFunction> test_hash()
{
    static const auto instance = std::make_shared<const PrefixedHash>(fnv_digest);
    return instance;
}

std::vector<bytes> make_leaves(size_t n)
{
    std::vector<bytes> leaves;
    leaves.reserve(n);
    for (size_t i = 0; i < n; ++i)
        leaves.push_back(to_bytes("leaf" + std::to_string(i)));
    return leaves;
}
}  // namespace merkle::test
