// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <span>

namespace hvmone::crypto
{
/// Computes base^exp % mod for big-endian byte strings of any length.
///
/// @param      base    The base.
/// @param      exp     The exponent.
/// @param      mod     The modulus, must not be zero.
/// @param[out] output  The result, left-padded with zeros to the size of @p mod.
void expmod(std::span<const uint8_t> base, std::span<const uint8_t> exp,
    std::span<const uint8_t> mod, uint8_t* output) noexcept;
}  // namespace hvmone::crypto
