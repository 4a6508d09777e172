// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <merkle/hash.hpp>
#include <test/utils/utils.hpp>
#include <sstream>

using namespace merkle;
using namespace merkle::test;

TEST(merkle_hash, keccak256)
{
    EXPECT_EQ(keccak256({}),
        0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32);
    EXPECT_EQ(keccak256("abc"_b),
        0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45_bytes32);
}

TEST(merkle_hash, sha256)
{
    EXPECT_EQ(sha256({}),
        0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855_bytes32);
    EXPECT_EQ(sha256("abc"_b),
        0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad_bytes32);
}

TEST(merkle_hash, rfc6962_empty_leaf)
{
    // The leaf hash of the empty entry from RFC 6962 test vectors.
    EXPECT_EQ(sha256_hash()->hash_leaf({}),
        0x6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d_bytes32);
}

TEST(merkle_hash, prefixed_leaf)
{
    for (const auto& data : {""_b, "a"_b, "merkle"_b})
    {
        EXPECT_EQ(keccak256_hash()->hash_leaf(data), keccak256(bytes{0x00} + data));
        EXPECT_EQ(sha256_hash()->hash_leaf(data), sha256(bytes{0x00} + data));
    }
}

TEST(merkle_hash, prefixed_internal)
{
    const auto left = keccak256("left"_b);
    const auto right = keccak256("right"_b);
    bytes input{0x01};
    input += bytes_view{left.bytes, sizeof(left)};
    input += bytes_view{right.bytes, sizeof(right)};

    EXPECT_EQ(keccak256_hash()->hash_internal(left, right), keccak256(input));
    EXPECT_NE(keccak256_hash()->hash_internal(right, left), keccak256(input));
}

TEST(merkle_hash, domain_separation)
{
    // A leaf made of two digests must not collide with the internal node of these digests.
    for (const auto& h : {keccak256_hash(), sha256_hash(), test_hash()})
    {
        const auto left = h->hash_leaf("a"_b);
        const auto right = h->hash_leaf("b"_b);
        bytes concatenated(left.bytes, sizeof(left));
        concatenated += bytes_view{right.bytes, sizeof(right)};

        EXPECT_NE(h->hash_leaf(concatenated), h->hash_internal(left, right));
        EXPECT_NE(h->hash_leaf("a"_b), keccak256("a"_b));
    }
}

TEST(merkle_hash, shared_instances)
{
    EXPECT_EQ(keccak256_hash(), keccak256_hash());
    EXPECT_EQ(sha256_hash(), sha256_hash());
    EXPECT_NE(keccak256_hash(), sha256_hash());
}

TEST(merkle_hash, test_hash_single_byte_change)
{
    const auto data = "0123456789abcdef"_b;
    const auto base = fnv_digest(data);
    for (size_t i = 0; i < data.size(); ++i)
    {
        auto changed = data;
        changed[i] ^= 0x01;
        EXPECT_NE(fnv_digest(changed), base) << i;
    }
}

TEST(merkle_hash, hex)
{
    EXPECT_EQ(merkle::hex(0x01_bytes32),
        "0000000000000000000000000000000000000000000000000000000000000001");
    std::ostringstream out;
    out << 0xff_bytes32;
    EXPECT_EQ(out.str(), "0x00000000000000000000000000000000000000000000000000000000000000ff");
}
