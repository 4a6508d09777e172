// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "hash.hpp"
#include <ethash/keccak.hpp>
#include <openssl/evp.h>
#include <bit>
#include <cstring>
#include <stdexcept>

namespace merkle
{
hash256 PrefixedHash::hash_leaf(bytes_view data) const
{
    bytes input;
    input.reserve(1 + data.size());
    input.push_back(LEAF_PREFIX);
    input += data;
    return m_digest(input);
}

hash256 PrefixedHash::hash_internal(const hash256& left, const hash256& right) const
{
    uint8_t input[1 + 2 * sizeof(hash256)];
    input[0] = INTERNAL_PREFIX;
    std::memcpy(&input[1], left.bytes, sizeof(left));
    std::memcpy(&input[1 + sizeof(left)], right.bytes, sizeof(right));
    return m_digest({input, sizeof(input)});
}

hash256 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<hash256>(ethash::keccak256(data.data(), data.size()));
}

hash256 sha256(bytes_view data)
{
    hash256 h;
    unsigned int size = 0;
    if (EVP_Digest(data.data(), data.size(), h.bytes, &size, EVP_sha256(), nullptr) != 1 ||
        size != sizeof(h))
        throw std::runtime_error("sha256: EVP_Digest failed");
    return h;
}

std::shared_ptr<const HashFunction> keccak256_hash()
{
    static const auto instance = std::make_shared<const PrefixedHash>(keccak256);
    return instance;
}

std::shared_ptr<const HashFunction> sha256_hash()
{
    static const auto instance = std::make_shared<const PrefixedHash>(sha256);
    return instance;
}
}  // namespace merkle

std::ostream& operator<<(std::ostream& out, const merkle::hash256& h)
{
    return out << "0x" << merkle::hex(h);
}
