// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "bn254.hpp"

/// The BN254 extension field tower used by the G2 group and the pairing:
///
///     Fq2  = Fq[u]  / (u² + 1)
///     Fq6  = Fq2[v] / (v³ - ξ),  ξ = 9 + u
///     Fq12 = Fq6[w] / (w² - v)
namespace hvmmax::bn254
{
struct FqConfig
{
    using uint_type = uint256;
    static constexpr auto MODULUS = Curve::FIELD_PRIME;
};

using Fq = FieldElement<FqConfig>;

struct Fq2
{
    Fq re;
    Fq im;

    static constexpr Fq2 one() noexcept { return {Fq::one(), {}}; }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return re.is_zero() && im.is_zero(); }

    /// The conjugate re - im⋅u. Equal to the Frobenius map x^p.
    [[nodiscard]] constexpr Fq2 conjugate() const noexcept { return {re, -im}; }

    /// Multiplies by ξ = 9 + u: (a + bu)(9 + u) = (9a - b) + (a + 9b)u.
    [[nodiscard]] constexpr Fq2 mul_by_xi() const noexcept
    {
        const auto nine = [](const Fq& a) noexcept {
            const auto a2 = a + a;
            const auto a4 = a2 + a2;
            return a4 + a4 + a;
        };
        return {nine(re) - im, re + nine(im)};
    }

    [[nodiscard]] constexpr Fq2 inv() const noexcept
    {
        const auto t = (re * re + im * im).inv();
        return {re * t, -(im * t)};
    }

    [[nodiscard]] constexpr Fq2 pow(const uint256& exponent) const noexcept
    {
        auto result = one();
        auto b = *this;
        for (auto e = exponent; e != 0; e >>= 1)
        {
            if ((e & 1) != 0)
                result = result * b;
            b = b * b;
        }
        return result;
    }

    friend constexpr bool operator==(const Fq2&, const Fq2&) noexcept = default;

    friend constexpr Fq2 operator+(const Fq2& a, const Fq2& b) noexcept
    {
        return {a.re + b.re, a.im + b.im};
    }

    friend constexpr Fq2 operator-(const Fq2& a, const Fq2& b) noexcept
    {
        return {a.re - b.re, a.im - b.im};
    }

    friend constexpr Fq2 operator-(const Fq2& a) noexcept { return {-a.re, -a.im}; }

    /// Karatsuba: three base field multiplications.
    friend constexpr Fq2 operator*(const Fq2& a, const Fq2& b) noexcept
    {
        const auto v0 = a.re * b.re;
        const auto v1 = a.im * b.im;
        return {v0 - v1, (a.re + a.im) * (b.re + b.im) - v0 - v1};
    }

    friend constexpr Fq2 operator*(const Fq2& a, const Fq& s) noexcept
    {
        return {a.re * s, a.im * s};
    }
};

/// The element c0 + c1⋅v + c2⋅v².
struct Fq6
{
    Fq2 c0;
    Fq2 c1;
    Fq2 c2;

    static constexpr Fq6 one() noexcept { return {Fq2::one(), {}, {}}; }

    /// Multiplies by v, using v³ = ξ.
    [[nodiscard]] constexpr Fq6 mul_by_v() const noexcept { return {c2.mul_by_xi(), c0, c1}; }

    [[nodiscard]] constexpr Fq6 inv() const noexcept
    {
        const auto a = c0 * c0 - (c1 * c2).mul_by_xi();
        const auto b = (c2 * c2).mul_by_xi() - c0 * c1;
        const auto c = c1 * c1 - c0 * c2;
        const auto t = (c0 * a + (c2 * b + c1 * c).mul_by_xi()).inv();
        return {a * t, b * t, c * t};
    }

    friend constexpr bool operator==(const Fq6&, const Fq6&) noexcept = default;

    friend constexpr Fq6 operator+(const Fq6& a, const Fq6& b) noexcept
    {
        return {a.c0 + b.c0, a.c1 + b.c1, a.c2 + b.c2};
    }

    friend constexpr Fq6 operator-(const Fq6& a, const Fq6& b) noexcept
    {
        return {a.c0 - b.c0, a.c1 - b.c1, a.c2 - b.c2};
    }

    friend constexpr Fq6 operator-(const Fq6& a) noexcept { return {-a.c0, -a.c1, -a.c2}; }

    /// Karatsuba over three coefficients, six Fq2 multiplications.
    friend constexpr Fq6 operator*(const Fq6& a, const Fq6& b) noexcept
    {
        const auto t0 = a.c0 * b.c0;
        const auto t1 = a.c1 * b.c1;
        const auto t2 = a.c2 * b.c2;
        return {
            t0 + ((a.c1 + a.c2) * (b.c1 + b.c2) - t1 - t2).mul_by_xi(),
            (a.c0 + a.c1) * (b.c0 + b.c1) - t0 - t1 + t2.mul_by_xi(),
            (a.c0 + a.c2) * (b.c0 + b.c2) - t0 - t2 + t1,
        };
    }
};

/// The element c0 + c1⋅w.
struct Fq12
{
    Fq6 c0;
    Fq6 c1;

    static constexpr Fq12 one() noexcept { return {Fq6::one(), {}}; }

    /// The conjugate c0 - c1⋅w. Equal to the Frobenius map x^(p⁶).
    [[nodiscard]] constexpr Fq12 conjugate() const noexcept { return {c0, -c1}; }

    [[nodiscard]] constexpr Fq12 inv() const noexcept
    {
        const auto t = (c0 * c0 - (c1 * c1).mul_by_v()).inv();
        return {c0 * t, -(c1 * t)};
    }

    friend constexpr bool operator==(const Fq12&, const Fq12&) noexcept = default;

    friend constexpr Fq12 operator*(const Fq12& a, const Fq12& b) noexcept
    {
        const auto t0 = a.c0 * b.c0;
        const auto t1 = a.c1 * b.c1;
        return {t0 + t1.mul_by_v(), (a.c0 + a.c1) * (b.c0 + b.c1) - t0 - t1};
    }
};

/// The sextic twist E'(Fq2): y² = x³ + 3/ξ.
inline constexpr Fq2 TWIST_B{
    Fq{0x2b149d40ceb8aaae81be18991be06ac3b5b4c5e559dbefa33267e6dc24a138e5_u256},
    Fq{0x009713b03af0fed4cd2cafadeed8fdf4a74fa084e52d1852e4a2bd0685c315d2_u256},
};

/// Converts the G2 point with plain coordinates to the field representation.
constexpr ecc::Point<Fq2> to_fq2_point(const ExtPoint& q) noexcept
{
    return {{Fq{q.x.first}, Fq{q.x.second}}, {Fq{q.y.first}, Fq{q.y.second}}};
}
}  // namespace hvmmax::bn254
