// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <algorithm>

namespace hvmone::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_hex;
using evmc::from_spaced_hex;
using evmc::hex;

/// Converts a string to bytes by casting individual characters.
inline bytes to_bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

/// Produces bytes out of string literal.
inline bytes operator""_b(const char* data, size_t size)
{
    return to_bytes({data, size});
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

/// Encodes the value as the 32-byte big-endian word.
inline bytes word(const intx::uint256& v)
{
    bytes r(32, 0);
    intx::be::unsafe::store(r.data(), v);
    return r;
}

/// The 32-byte boolean words returned by the verification precompiles.
inline const bytes true32 = word(1);
inline const bytes false32 = word(0);
}  // namespace hvmone::test
