// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "bn254.hpp"
#include "bn254_tower.hpp"
#include <array>

namespace hvmmax::bn254
{
namespace
{
using TwistPoint = ecc::Point<Fq2>;

/// The BN parameter u. The optimal ate Miller loop runs over 6u + 2.
constexpr auto BN_U = 4965661367192848881_u256;
constexpr auto ATE_LOOP_COUNT = BN_U * 6 + 2;

/// The hard part (p⁴ - p² + 1) / r of the final exponent, little-endian words.
constexpr std::array<uint64_t, 12> HARD_EXPONENT{
    0xe81bb482ccdf42b1,
    0x5abf5cc4f49c36d4,
    0xf1154e7e1da014fd,
    0xdcc7b44c87cdbacf,
    0xaaa441e3954bcf8a,
    0x6b887d56d5095f23,
    0x79581e16f3fd90c6,
    0x3b1b1355d189227d,
    0x4e529a5861876f6b,
    0x6c0eb522d5b12278,
    0x331ec15183177faf,
    0x01baaa710b0759ad,
};

/// The powers γᵉ, e = 0..5, of γ = ξ^((p-1)/6). Since w⁶ = ξ, (wᵉ)^p = γᵉ⋅wᵉ.
const std::array<Fq2, 6>& frobenius_gammas() noexcept
{
    static const auto gammas = [] {
        std::array<Fq2, 6> g;
        g[0] = Fq2::one();
        const auto gamma = Fq2{Fq{9}, Fq{1}}.pow((Curve::FIELD_PRIME - 1) / 6);
        for (size_t e = 1; e < g.size(); ++e)
            g[e] = g[e - 1] * gamma;
        return g;
    }();
    return gammas;
}

/// The Frobenius map f^p. The Fq2 coefficient of v^j⋅w^k is the coefficient of w^(2j+k).
Fq12 frobenius(const Fq12& f) noexcept
{
    const auto& g = frobenius_gammas();
    return {
        {f.c0.c0.conjugate(), f.c0.c1.conjugate() * g[2], f.c0.c2.conjugate() * g[4]},
        {f.c1.c0.conjugate() * g[1], f.c1.c1.conjugate() * g[3], f.c1.c2.conjugate() * g[5]},
    };
}

/// The Frobenius endomorphism of the twist: untwist, raise the coordinates to p, twist back.
TwistPoint frobenius(const TwistPoint& q) noexcept
{
    const auto& g = frobenius_gammas();
    return {q.x.conjugate() * g[2], q.y.conjugate() * g[3]};
}

/// The line through T with the slope λ (on the twist) evaluated at the G1 point P.
///
/// With the untwisting (x, y) -> (x⋅w², y⋅w³) the line is
/// yP - λ⋅xP⋅w + (λ⋅xT - yT)⋅w³. Factors from proper subfields are dropped,
/// the final exponentiation maps them to 1.
Fq12 line_value(const Fq2& lambda, const TwistPoint& t, const ecc::Point<Fq>& p) noexcept
{
    return {
        {{p.y, {}}, {}, {}},
        {-(lambda * p.x), lambda * t.x - t.y, {}},
    };
}

/// Doubles T in place and returns the tangent line at P.
Fq12 double_step(TwistPoint& t, const ecc::Point<Fq>& p) noexcept
{
    const auto xx = t.x * t.x;
    const auto lambda = (xx + xx + xx) * (t.y + t.y).inv();
    const auto line = line_value(lambda, t, p);
    const auto x3 = lambda * lambda - t.x - t.x;
    t = {x3, lambda * (t.x - x3) - t.y};
    return line;
}

/// Adds Q to T in place and returns the chord line at P.
/// T ≠ ±Q holds for all additions of the Miller loop.
Fq12 add_step(TwistPoint& t, const TwistPoint& q, const ecc::Point<Fq>& p) noexcept
{
    const auto lambda = (q.y - t.y) * (q.x - t.x).inv();
    const auto line = line_value(lambda, t, p);
    const auto x3 = lambda * lambda - t.x - q.x;
    t = {x3, lambda * (t.x - x3) - t.y};
    return line;
}

/// The optimal ate Miller loop f_{6u+2,Q}(P) ⋅ l_{[6u+2]Q,π(Q)}(P) ⋅ l_{..,-π²(Q)}(P),
/// see Vercauteren "Optimal pairings", https://eprint.iacr.org/2008/096.
Fq12 miller_loop(const TwistPoint& q, const ecc::Point<Fq>& p) noexcept
{
    auto t = q;
    auto f = Fq12::one();

    for (auto i = 256 - clz(ATE_LOOP_COUNT) - 1; i != 0; --i)
    {
        f = f * f * double_step(t, p);
        if (((ATE_LOOP_COUNT >> (i - 1)) & 1) != 0)
            f = f * add_step(t, q, p);
    }

    const auto q1 = frobenius(q);
    const auto q2 = frobenius(q1);
    f = f * add_step(t, q1, p);
    f = f * add_step(t, {q2.x, -q2.y}, p);
    return f;
}

/// Raises f to (p¹² - 1) / r.
Fq12 final_exponentiation(const Fq12& f) noexcept
{
    // The easy part: f^((p⁶ - 1)(p² + 1)).
    auto g = f.conjugate() * f.inv();
    g = frobenius(frobenius(g)) * g;

    auto result = Fq12::one();
    for (auto w = HARD_EXPONENT.size(); w != 0; --w)
    {
        for (auto b = 64; b != 0; --b)
        {
            result = result * result;
            if (((HARD_EXPONENT[w - 1] >> (b - 1)) & 1) != 0)
                result = result * g;
        }
    }
    return result;
}
}  // namespace

bool pairing_check(std::span<const std::pair<Point, ExtPoint>> pairs) noexcept
{
    auto f = Fq12::one();
    for (const auto& [p, q] : pairs)
    {
        // e(P, Q) = 1 if either of the points is the infinity.
        if (p.is_inf() || q.is_inf())
            continue;

        f = f * miller_loop(to_fq2_point(q), {Fq{p.x}, Fq{p.y}});
    }
    return final_exponentiation(f) == Fq12::one();
}
}  // namespace hvmmax::bn254
