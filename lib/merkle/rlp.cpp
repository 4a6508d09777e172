// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "rlp.hpp"
#include <algorithm>

namespace merkle::rlp
{
namespace
{
/// Loads big-endian unsigned integer of at most 8 bytes.
uint64_t load_uint64(bytes_view input)
{
    if (input.size() > sizeof(uint64_t))
        throw std::runtime_error("load: input too big");
    if (!input.empty() && input[0] == 0)
        throw std::runtime_error("load: leading zero");

    uint8_t b[sizeof(uint64_t)]{};
    std::copy(input.begin(), input.end(), &b[sizeof(b) - input.size()]);
    return intx::be::load<uint64_t>(b);
}

/// Returns the payload and removes the non-list item from the input.
bytes_view take_string(bytes_view& from)
{
    const auto h = decode_header(from);
    if (h.is_list)
        throw std::runtime_error("rlp decoding error: unexpected list type");

    const auto payload = from.substr(0, static_cast<size_t>(h.payload_length));
    from.remove_prefix(static_cast<size_t>(h.payload_length));
    return payload;
}
}  // namespace

Header decode_header(bytes_view& input)
{
    const auto input_len = input.size();

    if (input_len == 0)
        throw std::runtime_error("rlp decoding error: input is empty");

    const auto prefix = input[0];

    if (prefix < 0x80)
        return {1, false};
    else if (prefix < 0xb8)  // [0x80, 0xb7]
    {
        const uint8_t len = prefix - 0x80;
        if (len >= input_len)
            throw std::runtime_error("rlp decoding error: input too short");
        if (len == 1 && input[1] < 0x80)
            throw std::runtime_error("rlp decoding error: non-canonical single byte");

        input.remove_prefix(1);
        return {len, false};
    }
    else if (prefix < 0xc0)  // [0xb8, 0xbf]
    {
        const uint8_t len_of_str_len = prefix - 0xb7;
        if (len_of_str_len >= input_len)
            throw std::runtime_error("rlp decoding error: input too short");

        const auto str_len = load_uint64(input.substr(1, len_of_str_len));
        if (str_len <= 55)
            throw std::runtime_error("rlp decoding error: non-canonical string length");
        if (str_len >= input_len - len_of_str_len)
            throw std::runtime_error("rlp decoding error: input too short");

        input.remove_prefix(1 + len_of_str_len);
        return {str_len, false};
    }
    else if (prefix < 0xf8)  // [0xc0, 0xf7]
    {
        const uint8_t list_len = prefix - 0xc0;
        if (list_len >= input_len)
            throw std::runtime_error("rlp decoding error: input too short");

        input.remove_prefix(1);
        return {list_len, true};
    }
    else  // [0xf8, 0xff]
    {
        const uint8_t len_of_list_len = prefix - 0xf7;
        if (len_of_list_len >= input_len)
            throw std::runtime_error("rlp decoding error: input too short");

        const auto list_len = load_uint64(input.substr(1, len_of_list_len));
        if (list_len <= 55)
            throw std::runtime_error("rlp decoding error: non-canonical list length");
        if (list_len >= input_len - len_of_list_len)
            throw std::runtime_error("rlp decoding error: input too short");

        input.remove_prefix(1 + len_of_list_len);
        return {list_len, true};
    }
}

bytes_view decode_list(bytes_view& input)
{
    const auto h = decode_header(input);
    if (!h.is_list)
        throw std::runtime_error("rlp decoding error: unexpected type. list expected");

    const auto payload = input.substr(0, static_cast<size_t>(h.payload_length));
    input.remove_prefix(static_cast<size_t>(h.payload_length));
    return payload;
}

void decode(bytes_view& from, uint64_t& to)
{
    to = load_uint64(take_string(from));
}

void decode(bytes_view& from, bytes& to)
{
    to = take_string(from);
}

void decode(bytes_view& from, hash256& to)
{
    const auto payload = take_string(from);
    if (payload.size() != sizeof(to))
        throw std::runtime_error("rlp decoding error: unexpected hash size");
    std::copy(payload.begin(), payload.end(), to.bytes);
}

}  // namespace merkle::rlp
