// merkle: Dense binary Merkle tree with inclusion openings
// Copyright 2026 The merkle Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cassert>
#include <string>
#include <system_error>

namespace merkle
{

enum ErrorCode : int
{
    SUCCESS = 0,
    INVALID_HEIGHT,
    TOO_MANY_LEAVES,
    INDEX_OUT_OF_BOUNDS,
    MALFORMED_OPENING,
    TREE_FULL,
};

/// Obtains a reference to the static error category object for merkle errors.
inline const std::error_category& merkle_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "merkle"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case INVALID_HEIGHT:
                return "tree height above the configured limit";
            case TOO_MANY_LEAVES:
                return "more leaves than the tree capacity";
            case INDEX_OUT_OF_BOUNDS:
                return "leaf index out of bounds";
            case MALFORMED_OPENING:
                return "malformed opening";
            case TREE_FULL:
                return "tree is full";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of a merkle error code value.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, merkle_category()};
}

}  // namespace merkle

template <>
struct std::is_error_code_enum<merkle::ErrorCode> : std::true_type
{};
