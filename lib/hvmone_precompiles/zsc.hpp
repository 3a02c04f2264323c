// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "bn254.hpp"
#include <span>
#include <vector>

namespace hvmone::crypto
{
using hvmmax::bn254::Point;
using intx::uint256;

/// The number of points in the public generator table.
inline constexpr size_t ZSC_GENERATORS_SIZE = 64;

/// The number of folding rounds of the proofs accepted by the zscverify precompile.
inline constexpr size_t ZSC_ROUNDS = 5;

/// The length of the committed vectors, 2^ZSC_ROUNDS.
inline constexpr size_t ZSC_VECTOR_SIZE = size_t{1} << ZSC_ROUNDS;

/// The public generator table, the "G" basis of the inner-product argument.
std::span<const Point, ZSC_GENERATORS_SIZE> zsc_generators() noexcept;

/// The inner-product argument proof: P = <a, G> + <b, H> + <a, b>⋅U folded by L/R rounds.
struct InnerProductProof
{
    uint256 salt;          ///< The initial Fiat–Shamir seed.
    std::vector<Point> h;  ///< The "H" basis, 2^k points.
    Point u;               ///< The inner product base point.
    Point p;               ///< The commitment.
    std::vector<Point> l;  ///< The left fold points, k points.
    std::vector<Point> r;  ///< The right fold points, k points.
    uint256 a;             ///< The final folded a scalar.
    uint256 b;             ///< The final folded b scalar.
};

/// Computes the round challenge keccak256(seed || L.x || L.y || R.x || R.y) mod N,
/// all values as 32-byte big-endian words.
uint256 zsc_challenge(const uint256& seed, const Point& l, const Point& r) noexcept;

/// Verifies the inner-product argument against the first 2^k entries of @p generators.
///
/// The round i challenge x_i folds the commitment P' = P + Σ x_i²⋅L_i + x_i⁻²⋅R_i.
/// The proof is accepted iff P' == <s, G>⋅a + <s', H>⋅b + U⋅(a⋅b) where
/// s_j = ∏ x_i^(±1), the sign being the bit (k-1-i) of j, and s'_j = s_(2^k-1-j).
///
/// All points must be valid G1 points. A proof with inconsistent vector sizes is rejected.
bool verify_inner_product(
    std::span<const Point> generators, const InnerProductProof& proof) noexcept;
}  // namespace hvmone::crypto
