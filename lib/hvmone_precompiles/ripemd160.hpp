// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>

namespace hvmone::crypto
{
/// The size (20 bytes) of the RIPEMD-160 message digest.
static constexpr std::size_t RIPEMD160_HASH_SIZE = 160 / 8;

/// Computes the RIPEMD-160 hash function.
///
/// @param[out] hash  The result message digest is written to the provided memory.
/// @param      data  The input data.
/// @param      size  The size of the input data.
/// @return           False if the digest could not be computed by the crypto backend.
[[nodiscard]] bool ripemd160(
    std::byte hash[RIPEMD160_HASH_SIZE], const std::byte* data, std::size_t size) noexcept;
}  // namespace hvmone::crypto
