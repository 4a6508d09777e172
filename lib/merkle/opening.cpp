// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0

#include "opening.hpp"
#include "options.hpp"
#include "rlp.hpp"

namespace merkle
{
namespace
{
/// The side of the sibling at the given level of the path to the leaf.
constexpr Side sibling_side(uint64_t leaf_index, size_t level) noexcept
{
    return ((leaf_index >> level) & 1) != 0 ? Side::left : Side::right;
}
}  // namespace

bytes rlp_encode(const PathEntry& entry)
{
    return rlp::encode_tuple(entry.sibling, static_cast<uint64_t>(entry.side));
}

std::error_code validate_opening(const Opening& opening) noexcept
{
    const auto& path = opening.sibling_path;
    if (path.size() > MAX_HEIGHT_LIMIT || (opening.leaf_index >> path.size()) != 0)
        return make_error_code(MALFORMED_OPENING);

    for (size_t level = 0; level < path.size(); ++level)
    {
        if (path[level].side != sibling_side(opening.leaf_index, level))
            return make_error_code(MALFORMED_OPENING);
    }
    return make_error_code(SUCCESS);
}

bool verify_opening(const HashFunction& hash, const Opening& opening, const hash256& expected_root)
{
    if (validate_opening(opening))
        return false;

    auto acc = hash.hash_leaf(opening.leaf_value);
    for (const auto& [sibling, side] : opening.sibling_path)
    {
        acc = (side == Side::left) ? hash.hash_internal(sibling, acc) :
                                     hash.hash_internal(acc, sibling);
    }
    return acc == expected_root;
}

bool verify_opening(const HashFunction& hash, const Opening& opening,
    const hash256& expected_root, size_t height)
{
    return opening.sibling_path.size() == height && verify_opening(hash, opening, expected_root);
}

bytes encode_opening(const Opening& opening)
{
    return rlp::encode_tuple(opening.leaf_index, opening.leaf_value, opening.sibling_path);
}

std::variant<Opening, std::error_code> decode_opening(bytes_view input)
{
    Opening opening;
    try
    {
        auto payload = rlp::decode_list(input);
        if (!input.empty())
            return make_error_code(MALFORMED_OPENING);  // Trailing bytes.

        rlp::decode(payload, opening.leaf_index);
        rlp::decode(payload, opening.leaf_value);
        auto path = rlp::decode_list(payload);
        if (!payload.empty())
            return make_error_code(MALFORMED_OPENING);

        while (!path.empty())
        {
            auto entry = rlp::decode_list(path);
            PathEntry e;
            uint64_t side = 0;
            rlp::decode(entry, e.sibling);
            rlp::decode(entry, side);
            if (!entry.empty() || side > 1)
                return make_error_code(MALFORMED_OPENING);
            e.side = static_cast<Side>(side);
            opening.sibling_path.push_back(e);
        }
    }
    catch (const std::runtime_error&)
    {
        return make_error_code(MALFORMED_OPENING);
    }

    if (const auto ec = validate_opening(opening); ec)
        return ec;
    return opening;
}

}  // namespace merkle
