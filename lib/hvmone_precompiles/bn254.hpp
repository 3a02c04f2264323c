// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "ecc.hpp"
#include <span>
#include <utility>

namespace hvmmax::bn254
{
using namespace intx;

/// The BN254 (alt_bn128) curve y² = x³ + 3 parameters.
struct Curve
{
    using uint_type = uint256;

    /// The base field prime (P).
    static constexpr auto FIELD_PRIME =
        0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47_u256;

    /// The order of the G1 group, i.e. the scalar field prime (N).
    static constexpr auto ORDER =
        0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001_u256;

    /// The scalar field arithmetic.
    static constexpr ModArith Fr{ORDER};

    static constexpr auto B = 3;
};

/// The G1 point with plain (non-Montgomery) coordinates.
using Point = ecc::Point<uint256>;

/// The G2 point over Fq² with plain coordinates. Each coordinate is the (real, imaginary) pair.
/// The precompile ABI encodes the imaginary part first.
using ExtPoint = ecc::Point<std::pair<uint256, uint256>>;

/// Checks if the value is a canonical base field element (< P).
constexpr bool is_field_element(const uint256& v) noexcept
{
    return v < Curve::FIELD_PRIME;
}

/// Checks if the coordinates, reduced modulo P, satisfy y² = x³ + 3.
/// The (0, 0) infinity passes the check.
bool is_on_curve(const Point& pt) noexcept;

/// Checks if the coordinates, reduced modulo P, are on the twisted curve and the point
/// is in the G2 subgroup. The all-zero infinity passes the check.
bool is_on_curve(const ExtPoint& pt) noexcept;

/// Validates the G1 point: on the curve and both coordinates are field elements.
bool validate(const Point& pt) noexcept;

/// Validates the G2 point: on the twisted curve, in G2 and all coordinates are field elements.
bool validate(const ExtPoint& pt) noexcept;

/// Adds two valid G1 points.
Point add(const Point& p, const Point& q) noexcept;

/// Computes [c]P for a valid G1 point. The scalar may be any 256-bit value.
Point mul(const Point& pt, const uint256& c) noexcept;

/// Optimal ate pairing check as in https://eips.ethereum.org/EIPS/eip-197.
///
/// @param pairs  Validated (G1, G2) point pairs.
/// @return       `true` when ∏e(pairs[i].G1, pairs[i].G2) == 1, also for empty @p pairs.
bool pairing_check(std::span<const std::pair<Point, ExtPoint>> pairs) noexcept;
}  // namespace hvmmax::bn254
