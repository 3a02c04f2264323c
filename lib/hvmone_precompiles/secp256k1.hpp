// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ecc.hpp"
#include <ethash/hash_types.hpp>
#include <evmc/evmc.hpp>
#include <optional>

namespace hvmmax::secp256k1
{
using namespace intx;

/// The secp256k1 curve y² = x³ + 7 parameters.
struct Curve
{
    using uint_type = uint256;

    /// The field prime number (P).
    static constexpr auto FIELD_PRIME =
        0xfffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f_u256;

    /// The curve group order (N).
    static constexpr auto ORDER =
        0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_u256;

    static constexpr auto B = 7;
};

struct FpConfig
{
    using uint_type = uint256;
    static constexpr auto MODULUS = Curve::FIELD_PRIME;
};

struct FnConfig
{
    using uint_type = uint256;
    static constexpr auto MODULUS = Curve::ORDER;
};

/// The base field element.
using Fp = FieldElement<FpConfig>;

/// The scalar field element.
using Fn = FieldElement<FnConfig>;

using Point = ecc::Point<uint256>;

/// The generator point.
inline constexpr Point G{0x79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798_u256,
    0x483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8_u256};

/// Square root in the base field: x^((P+1)/4), valid because P ≡ 3 (mod 4).
/// Returns std::nullopt if x is not a quadratic residue.
std::optional<Fp> field_sqrt(const Fp& x) noexcept;

/// Finds y of the curve point with the given x and the parity of y.
std::optional<Fp> calculate_y(const Fp& x, bool y_parity) noexcept;

/// Adds two curve points.
Point add(const Point& p, const Point& q) noexcept;

/// Computes [c]P.
Point mul(const Point& p, const uint256& c) noexcept;

/// Converts the public key to the address: the last 20 bytes of keccak256(x || y).
evmc::address to_address(const Point& pt) noexcept;

/// Recovers the public key from the message hash @p e and the signature (r, s, v).
/// @p v is the parity of the y coordinate of the point R.
std::optional<Point> secp256k1_ecdsa_recover(
    const ethash::hash256& e, const uint256& r, const uint256& s, bool v) noexcept;

/// Recovers the signer address. Returns std::nullopt for an invalid signature.
std::optional<evmc::address> ecrecover(
    const ethash::hash256& e, const uint256& r, const uint256& s, bool v) noexcept;
}  // namespace hvmmax::secp256k1
