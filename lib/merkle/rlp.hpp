// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "hash.hpp"
#include <intx/intx.hpp>
#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <utility>
#include <vector>

/// Recursive Length Prefix (RLP) encoding of the values exchanged between trees and verifiers.
namespace merkle::rlp
{
namespace internal
{
template <uint8_t ShortBase, uint8_t LongBase>
inline bytes encode_length(size_t l)
{
    static constexpr uint8_t short_cutoff = 55;
    static_assert(ShortBase + short_cutoff <= 0xff);
    assert(l <= 0xffffff);

    if (l <= short_cutoff)
        return {static_cast<uint8_t>(ShortBase + l)};
    else if (const auto l0 = static_cast<uint8_t>(l); l <= 0xff)
        return {LongBase + 1, l0};
    else if (const auto l1 = static_cast<uint8_t>(l >> 8); l <= 0xffff)
        return {LongBase + 2, l1, l0};
    else
        return {LongBase + 3, static_cast<uint8_t>(l >> 16), l1, l0};
}

inline bytes wrap_list(const bytes& content)
{
    return internal::encode_length<192, 247>(content.size()) + content;
}
}  // namespace internal

inline bytes_view trim(bytes_view b) noexcept
{
    b.remove_prefix(std::min(b.find_first_not_of(uint8_t{0x00}), b.size()));
    return b;
}

template <typename T>
inline decltype(rlp_encode(std::declval<T>())) encode(const T& v)
{
    return rlp_encode(v);
}

inline bytes encode(bytes_view data)
{
    static constexpr uint8_t short_base = 128;
    if (data.size() == 1 && data[0] < short_base)
        return {data[0]};

    return internal::encode_length<short_base, 183>(data.size()) += data;
}

inline bytes encode(uint64_t x)
{
    uint8_t b[sizeof(x)];
    intx::be::store(b, x);
    return encode(trim({b, sizeof(b)}));
}

inline bytes encode(const hash256& h)
{
    return encode(bytes_view{h.bytes, sizeof(h.bytes)});
}

/// Encodes the vector as RLP list.
template <typename T>
inline bytes encode(const std::vector<T>& v)
{
    bytes content;
    for (const auto& e : v)
        content += encode(e);
    return internal::wrap_list(content);
}

/// Encodes the fixed-size collection of heterogeneous values as RLP list.
template <typename... Types>
inline bytes encode_tuple(const Types&... elements)
{
    return internal::wrap_list((encode(elements) + ...));
}

struct Header
{
    uint64_t payload_length = 0;
    bool is_list = false;
};

/// Decodes the item header and removes it from the input.
///
/// @throws std::runtime_error if the header is truncated, is not in the canonical (shortest) form,
///         or the payload does not fit the input.
[[nodiscard]] Header decode_header(bytes_view& input);

/// Decodes the header of a list and returns the view of the list payload.
/// The whole list is removed from the input.
[[nodiscard]] bytes_view decode_list(bytes_view& input);

void decode(bytes_view& from, uint64_t& to);
void decode(bytes_view& from, bytes& to);

/// Decodes exactly 32 bytes.
void decode(bytes_view& from, hash256& to);

}  // namespace merkle::rlp
