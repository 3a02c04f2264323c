// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <hvmmax/hvmmax.hpp>

/// Group law of short Weierstrass curves y² = x³ + b.
///
/// The point arithmetic is generic over the coordinate field. The FieldT type must provide
/// the +, -, * and == operators, is_zero(), inv() and the static one().
namespace hvmmax::ecc
{
/// The affine point. The (0, 0) pair encodes the point at infinity.
template <typename ValueT>
struct Point
{
    ValueT x = {};
    ValueT y = {};

    friend constexpr bool operator==(const Point& a, const Point& b) noexcept = default;

    /// Checks if the point represents the special "infinity" value.
    [[nodiscard]] constexpr bool is_inf() const noexcept { return *this == Point{}; }
};

static_assert(Point<unsigned>{}.is_inf());

/// The point in Jacobian coordinates: (X, Y, Z) ~ (X/Z², Y/Z³). Z = 0 is the infinity.
template <typename FieldT>
struct JacobianPoint
{
    FieldT x = FieldT::one();
    FieldT y = FieldT::one();
    FieldT z = {};

    [[nodiscard]] constexpr bool is_inf() const noexcept { return z.is_zero(); }
};

/// Lifts the affine point. (0, 0) maps to the infinity.
template <typename FieldT>
constexpr JacobianPoint<FieldT> from_affine(const Point<FieldT>& p) noexcept
{
    if (p.is_inf())
        return {};
    return {p.x, p.y, FieldT::one()};
}

/// Normalizes the point. The infinity maps to (0, 0).
template <typename FieldT>
constexpr Point<FieldT> to_affine(const JacobianPoint<FieldT>& p) noexcept
{
    if (p.is_inf())
        return {};
    const auto z_inv = p.z.inv();
    const auto z_inv2 = z_inv * z_inv;
    return {p.x * z_inv2, p.y * z_inv2 * z_inv};
}

/// Point doubling, the "dbl-2009-l" formulas of the Explicit-Formulas Database
/// (https://hyperelliptic.org/EFD/g1p/auto-shortw-jacobian-0.html).
template <typename FieldT>
constexpr JacobianPoint<FieldT> dbl(const JacobianPoint<FieldT>& p) noexcept
{
    if (p.is_inf())
        return p;

    const auto& [x, y, z] = p;
    const auto a = x * x;
    const auto b = y * y;
    const auto c = b * b;
    const auto xb = x + b;
    auto d = xb * xb - a - c;
    d = d + d;
    const auto e = a + a + a;
    const auto f = e * e;

    const auto x3 = f - (d + d);
    auto c8 = c + c;
    c8 = c8 + c8;
    c8 = c8 + c8;
    const auto y3 = e * (d - x3) - c8;
    const auto yz = y * z;
    return {x3, y3, yz + yz};
}

/// Point addition, the "add-2007-bl" formulas of the Explicit-Formulas Database.
/// Handles the infinity, equal and opposite arguments.
template <typename FieldT>
constexpr JacobianPoint<FieldT> add(
    const JacobianPoint<FieldT>& p, const JacobianPoint<FieldT>& q) noexcept
{
    if (p.is_inf())
        return q;
    if (q.is_inf())
        return p;

    const auto z1z1 = p.z * p.z;
    const auto z2z2 = q.z * q.z;
    const auto u1 = p.x * z2z2;
    const auto u2 = q.x * z1z1;
    const auto s1 = p.y * q.z * z2z2;
    const auto s2 = q.y * p.z * z1z1;

    const auto h = u2 - u1;
    auto r = s2 - s1;
    if (h.is_zero())
        return r.is_zero() ? dbl(p) : JacobianPoint<FieldT>{};

    const auto h2 = h + h;
    const auto i = h2 * h2;
    const auto j = h * i;
    r = r + r;
    const auto v = u1 * i;

    const auto x3 = r * r - j - (v + v);
    const auto s1j = s1 * j;
    const auto y3 = r * (v - x3) - (s1j + s1j);
    const auto zz = p.z + q.z;
    const auto z3 = (zz * zz - z1z1 - z2z2) * h;
    return {x3, y3, z3};
}

/// Computes [c]P, left-to-right double-and-add.
template <typename FieldT, typename ScalarT>
constexpr JacobianPoint<FieldT> mul(const JacobianPoint<FieldT>& p, const ScalarT& c) noexcept
{
    JacobianPoint<FieldT> r;
    for (auto i = ScalarT::num_bits - intx::clz(c); i != 0; --i)
    {
        r = dbl(r);
        if (((c >> (i - 1)) & 1) != 0)
            r = add(r, p);
    }
    return r;
}
}  // namespace hvmmax::ecc
