// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1.hpp"
#include <ethash/keccak.hpp>
#include <cstring>

namespace hvmmax::secp256k1
{
namespace
{
using Jacobian = ecc::JacobianPoint<Fp>;

Jacobian to_jacobian(const Point& p) noexcept
{
    return ecc::from_affine(ecc::Point<Fp>{Fp{p.x}, Fp{p.y}});
}

Point to_point(const Jacobian& p) noexcept
{
    const auto a = ecc::to_affine(p);
    return {a.x.value(), a.y.value()};
}
}  // namespace

std::optional<Fp> field_sqrt(const Fp& x) noexcept
{
    const auto z = x.pow((Curve::FIELD_PRIME + 1) >> 2);
    if (z * z != x)
        return std::nullopt;
    return z;
}

std::optional<Fp> calculate_y(const Fp& x, bool y_parity) noexcept
{
    const auto y = field_sqrt(x * x * x + Fp{Curve::B});
    if (!y.has_value())
        return std::nullopt;

    const auto odd = (y->value() & 1) != 0;
    return (odd == y_parity) ? *y : -*y;
}

Point add(const Point& p, const Point& q) noexcept
{
    return to_point(ecc::add(to_jacobian(p), to_jacobian(q)));
}

Point mul(const Point& p, const uint256& c) noexcept
{
    return to_point(ecc::mul(to_jacobian(p), c));
}

evmc::address to_address(const Point& pt) noexcept
{
    uint8_t serialized[64];
    be::unsafe::store(serialized, pt.x);
    be::unsafe::store(serialized + 32, pt.y);

    const auto hashed = ethash::keccak256(serialized, sizeof(serialized));
    evmc::address ret{};
    std::memcpy(ret.bytes, hashed.bytes + 12, sizeof(ret.bytes));
    return ret;
}

std::optional<Point> secp256k1_ecdsa_recover(
    const ethash::hash256& e, const uint256& r, const uint256& s, bool v) noexcept
{
    // SEC 1 v2, 4.1.6 Public Key Recovery Operation: Q = r⁻¹(sR - zG).
    if (r == 0 || r >= Curve::ORDER || s == 0 || s >= Curve::ORDER)
        return std::nullopt;

    // r < N < P so r is the x coordinate candidate of R.
    const Fp rx{r};
    const auto ry = calculate_y(rx, v);
    if (!ry.has_value())
        return std::nullopt;

    // The hash is reduced modulo N by the conversion.
    const Fn z{be::load<uint256>(e.bytes)};
    const auto r_inv = Fn{r}.inv();
    const auto u1 = -(z * r_inv);
    const auto u2 = Fn{s} * r_inv;

    const auto q = ecc::add(ecc::mul(to_jacobian(G), u1.value()),
        ecc::mul(Jacobian{rx, *ry, Fp::one()}, u2.value()));
    if (q.is_inf())
        return std::nullopt;
    return to_point(q);
}

std::optional<evmc::address> ecrecover(
    const ethash::hash256& e, const uint256& r, const uint256& s, bool v) noexcept
{
    const auto point = secp256k1_ecdsa_recover(e, r, s, v);
    if (!point.has_value())
        return std::nullopt;
    return to_address(*point);
}
}  // namespace hvmmax::secp256k1
