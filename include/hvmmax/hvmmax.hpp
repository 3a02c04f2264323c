// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>

namespace hvmmax
{
/// Modular arithmetic in the Montgomery domain for a fixed odd modulus m.
///
/// A value a is represented as aR mod m where R = 2^num_bits.
/// mul() and inv() take and return values in this form.
/// add() and sub() do not depend on the representation.
template <typename UintT>
class ModArith
{
    static constexpr auto S = UintT::num_words;

    /// The product width plus one word for the carries of the reduction.
    using WideT = intx::uint<2 * UintT::num_bits + 64>;

public:
    const UintT mod;  ///< The modulus.

private:
    const UintT m_r2;          ///< R² mod m.
    const uint64_t m_neg_inv;  ///< -m⁻¹ mod 2⁶⁴.

    /// Computes -m₀⁻¹ mod 2⁶⁴ by Newton iteration.
    /// An odd m₀ is its own inverse mod 2³ and every step doubles the number of correct bits.
    static constexpr uint64_t neg_inv64(uint64_t m0) noexcept
    {
        uint64_t inv = m0;
        for (int i = 0; i < 5; ++i)
            inv *= 2 - m0 * inv;
        return 0 - inv;
    }

    static constexpr UintT r_squared(const UintT& m) noexcept
    {
        return intx::udivrem(WideT{1} << (2 * UintT::num_bits), m).rem;
    }

    /// Computes a/2 mod m for a < m.
    constexpr UintT half(const UintT& a) const noexcept
    {
        if ((a & 1) == 0)
            return a >> 1;
        const auto [s, carry] = intx::addc(a, mod);
        return (s >> 1) | (UintT{static_cast<uint64_t>(carry)} << (UintT::num_bits - 1));
    }

public:
    constexpr explicit ModArith(const UintT& modulus) noexcept
      : mod{modulus}, m_r2{r_squared(modulus)}, m_neg_inv{neg_inv64(modulus[0])}
    {}

    /// Converts x to the Montgomery form. Any x < 2^num_bits is accepted and reduced.
    constexpr UintT to_mont(const UintT& x) const noexcept { return mul(x, m_r2); }

    /// Converts x from the Montgomery form.
    constexpr UintT from_mont(const UintT& x) const noexcept { return mul(x, 1); }

    /// The Montgomery form of 1.
    constexpr UintT one() const noexcept { return to_mont(1); }

    /// Computes xyR⁻¹ mod m.
    ///
    /// Separated operand scanning: the full product is computed first and then reduced
    /// by one word per step, see Koç, Acar, Kaliski "Analyzing and comparing Montgomery
    /// multiplication algorithms", section 3.
    constexpr UintT mul(const UintT& x, const UintT& y) const noexcept
    {
        WideT t{intx::umul(x, y)};

        for (size_t i = 0; i != S; ++i)
        {
            const uint64_t q = t[i] * m_neg_inv;
            uint64_t carry = 0;
            for (size_t j = 0; j != S; ++j)
            {
                const auto p = intx::umul(q, mod[j]) + t[i + j] + carry;
                t[i + j] = p[0];
                carry = p[1];
            }
            for (size_t k = i + S; carry != 0; ++k)
            {
                const auto s = intx::addc(t[k], carry);
                t[k] = s.value;
                carry = s.carry;
            }
        }

        // The low S words are zero now. The rest is below 2m.
        intx::uint<UintT::num_bits + 64> r;
        for (size_t i = 0; i != S + 1; ++i)
            r[i] = t[S + i];
        if (r >= mod)
            r -= mod;
        return static_cast<UintT>(r);
    }

    /// Modular addition. Requires x < m and y < m.
    constexpr UintT add(const UintT& x, const UintT& y) const noexcept
    {
        const auto [s, carry] = intx::addc(x, y);
        return (carry || s >= mod) ? s - mod : s;
    }

    /// Modular subtraction. Requires x < m and y < m.
    constexpr UintT sub(const UintT& x, const UintT& y) const noexcept
    {
        return (x >= y) ? x - y : x - y + mod;
    }

    /// Computes x⁻¹ for x in Montgomery form. Returns 0 if x has no inverse.
    ///
    /// Binary extended Euclidean algorithm on the plain value,
    /// "Guide to Elliptic Curve Cryptography", Algorithm 2.22.
    constexpr UintT inv(const UintT& x) const noexcept
    {
        auto u = from_mont(x);
        auto v = mod;
        UintT x1 = 1;
        UintT x2 = 0;

        while (u != 1 && v != 1)
        {
            if (u == 0 || v == 0)
                return 0;  // gcd(x, m) > 1.

            while ((u & 1) == 0)
            {
                u >>= 1;
                x1 = half(x1);
            }
            while ((v & 1) == 0)
            {
                v >>= 1;
                x2 = half(x2);
            }

            if (u >= v)
            {
                u -= v;
                x1 = sub(x1, x2);
            }
            else
            {
                v -= u;
                x2 = sub(x2, x1);
            }
        }

        return to_mont(u == 1 ? x1 : x2);
    }
};

/// Computes base^exponent, right-to-left binary method. base and the result are
/// in Montgomery form.
template <typename UintT>
constexpr UintT pow(const ModArith<UintT>& m, const UintT& base, const UintT& exponent) noexcept
{
    auto result = m.one();
    auto b = base;
    for (auto e = exponent; e != 0; e >>= 1)
    {
        if ((e & 1) != 0)
            result = m.mul(result, b);
        b = m.mul(b, b);
    }
    return result;
}

/// The element of the prime field of Config::MODULUS.
///
/// The value is kept in Montgomery form, the arithmetic operators act on it directly.
template <typename Config>
class FieldElement
{
public:
    using uint_type = typename Config::uint_type;

    static constexpr ModArith<uint_type> Arith{Config::MODULUS};

private:
    uint_type m_mont{};

public:
    constexpr FieldElement() noexcept = default;

    /// Creates the element of the integer @p v, reduced modulo the field prime.
    constexpr explicit FieldElement(const uint_type& v) noexcept : m_mont{Arith.to_mont(v)} {}

    /// Creates the element out of its Montgomery form.
    static constexpr FieldElement from_mont(const uint_type& mont) noexcept
    {
        FieldElement e;
        e.m_mont = mont;
        return e;
    }

    static constexpr FieldElement one() noexcept { return from_mont(Arith.one()); }

    /// Returns the canonical integer value.
    [[nodiscard]] constexpr uint_type value() const noexcept { return Arith.from_mont(m_mont); }

    [[nodiscard]] constexpr const uint_type& mont() const noexcept { return m_mont; }

    [[nodiscard]] constexpr bool is_zero() const noexcept { return m_mont == 0; }

    /// The multiplicative inverse. Zero maps to zero.
    [[nodiscard]] constexpr FieldElement inv() const noexcept
    {
        return from_mont(Arith.inv(m_mont));
    }

    [[nodiscard]] constexpr FieldElement pow(const uint_type& exponent) const noexcept
    {
        return from_mont(hvmmax::pow(Arith, m_mont, exponent));
    }

    friend constexpr bool operator==(const FieldElement&, const FieldElement&) noexcept = default;

    friend constexpr FieldElement operator+(const FieldElement& a, const FieldElement& b) noexcept
    {
        return from_mont(Arith.add(a.m_mont, b.m_mont));
    }

    friend constexpr FieldElement operator-(const FieldElement& a, const FieldElement& b) noexcept
    {
        return from_mont(Arith.sub(a.m_mont, b.m_mont));
    }

    friend constexpr FieldElement operator-(const FieldElement& a) noexcept
    {
        return from_mont(Arith.sub(0, a.m_mont));
    }

    friend constexpr FieldElement operator*(const FieldElement& a, const FieldElement& b) noexcept
    {
        return from_mont(Arith.mul(a.m_mont, b.m_mont));
    }
};
}  // namespace hvmmax
