// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bn254.hpp"
#include "bn254_tower.hpp"

namespace hvmmax::bn254
{
namespace
{
using G1 = ecc::JacobianPoint<Fq>;

G1 to_jacobian(const Point& p) noexcept
{
    return ecc::from_affine(ecc::Point<Fq>{Fq{p.x}, Fq{p.y}});
}

Point to_point(const G1& p) noexcept
{
    const auto a = ecc::to_affine(p);
    return {a.x.value(), a.y.value()};
}
}  // namespace

bool is_on_curve(const Point& pt) noexcept
{
    if (pt.is_inf())
        return true;

    const Fq x{pt.x};
    const Fq y{pt.y};
    return y * y == x * x * x + Fq{Curve::B};
}

bool is_on_curve(const ExtPoint& pt) noexcept
{
    if (pt.is_inf())
        return true;

    const auto q = to_fq2_point(pt);
    if (q.y * q.y != q.x * q.x * q.x + TWIST_B)
        return false;

    // The twist has points of orders other than r, only [r]Q = O identifies G2.
    return ecc::mul(ecc::from_affine(q), Curve::ORDER).is_inf();
}

bool validate(const Point& pt) noexcept
{
    return is_field_element(pt.x) && is_field_element(pt.y) && is_on_curve(pt);
}

bool validate(const ExtPoint& pt) noexcept
{
    return is_field_element(pt.x.first) && is_field_element(pt.x.second) &&
           is_field_element(pt.y.first) && is_field_element(pt.y.second) && is_on_curve(pt);
}

Point add(const Point& p, const Point& q) noexcept
{
    return to_point(ecc::add(to_jacobian(p), to_jacobian(q)));
}

Point mul(const Point& pt, const uint256& c) noexcept
{
    return to_point(ecc::mul(to_jacobian(pt), c));
}
}  // namespace hvmmax::bn254
