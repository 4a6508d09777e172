// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <memory>
#include <ostream>
#include <string>

namespace merkle
{
using evmc::bytes;
using evmc::bytes32;
using evmc::bytes_view;
using namespace evmc::literals;

/// The tree digest type. All digests in a tree have this fixed size.
using hash256 = bytes32;

/// The hash primitive consumed by the tree.
///
/// Implementations must be deterministic and must keep leaf hashing and internal node hashing
/// in separate domains, i.e. no leaf input may produce the same hash input as any pair of
/// child digests. Implementations must be safe to call concurrently.
class HashFunction
{
public:
    virtual ~HashFunction() = default;

    /// Computes the digest of a leaf out of the raw leaf data.
    [[nodiscard]] virtual hash256 hash_leaf(bytes_view data) const = 0;

    /// Computes the digest of an internal node out of the digests of its children.
    /// The order of arguments is the position of the children in the tree.
    [[nodiscard]] virtual hash256 hash_internal(
        const hash256& left, const hash256& right) const = 0;
};

/// The HashFunction built out of a plain digest function by prefixing the hash input
/// with a domain byte: 0x00 for leaves, 0x01 for internal nodes (as in RFC 6962).
class PrefixedHash : public HashFunction
{
public:
    using DigestFn = hash256 (*)(bytes_view data);

    static constexpr uint8_t LEAF_PREFIX = 0x00;
    static constexpr uint8_t INTERNAL_PREFIX = 0x01;

    explicit PrefixedHash(DigestFn digest) noexcept : m_digest{digest} {}

    [[nodiscard]] hash256 hash_leaf(bytes_view data) const override;

    [[nodiscard]] hash256 hash_internal(const hash256& left, const hash256& right) const override;

private:
    DigestFn m_digest;
};

/// Computes Keccak-256 hash out of input bytes (wrapper of ethash::keccak256).
[[nodiscard]] hash256 keccak256(bytes_view data) noexcept;

/// Computes SHA-256 hash out of input bytes (OpenSSL EVP).
///
/// @throws std::runtime_error if OpenSSL reports a failure.
[[nodiscard]] hash256 sha256(bytes_view data);

/// Returns the shared domain-separated Keccak-256 hash function.
std::shared_ptr<const HashFunction> keccak256_hash();

/// Returns the shared domain-separated SHA-256 hash function.
std::shared_ptr<const HashFunction> sha256_hash();

/// Hex representation of a digest, without the 0x prefix.
inline std::string hex(const hash256& h)
{
    return evmc::hex({h.bytes, sizeof(h.bytes)});
}

}  // namespace merkle

std::ostream& operator<<(std::ostream& out, const merkle::hash256& h);
