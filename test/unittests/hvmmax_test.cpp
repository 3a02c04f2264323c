// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <hvmmax/hvmmax.hpp>
#include <array>

using namespace intx;
using namespace hvmmax;

constexpr auto P23 = 23_u256;
constexpr auto BN254Mod = 0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47_u256;
constexpr auto BN254Order =
    0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001_u256;
constexpr auto Secp256k1Mod =
    0xfffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f_u256;
constexpr auto M256 = 0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff_u256;

template <const uint256& Mod>
struct ModA : ModArith<uint256>
{
    ModA() : ModArith<uint256>{Mod} {}
};

template <typename>
class hvmmax_test : public testing::Test
{};

using test_types = testing::Types<ModA<P23>, ModA<BN254Mod>, ModA<BN254Order>,
    ModA<Secp256k1Mod>, ModA<M256>>;
TYPED_TEST_SUITE(hvmmax_test, test_types);

static auto get_test_values(const ModArith<uint256>& m) noexcept
{
    return std::array{
        m.mod - 1,
        m.mod - 2,
        m.mod / 2 + 1,
        m.mod / 2,
        m.mod / 2 - 1,
        uint256{2},
        uint256{1},
        uint256{0},
    };
}

[[maybe_unused]] static void constexpr_test()
{
    // ModArith works in constexpr.
    static constexpr ModArith m{BN254Mod};
    static_assert(m.mod == BN254Mod);

    static constexpr auto a = m.to_mont(3);
    static constexpr auto b = m.to_mont(11);
    static_assert(m.add(a, b) == m.to_mont(14));
    static_assert(m.sub(a, b) == m.to_mont(BN254Mod - 8));
    static_assert(m.mul(a, b) == m.to_mont(33));
    static_assert(m.one() == m.to_mont(1));
}

TYPED_TEST(hvmmax_test, to_from_mont)
{
    const TypeParam m;
    for (const auto& v : get_test_values(m))
        EXPECT_EQ(m.from_mont(m.to_mont(v)), v);

    EXPECT_EQ(m.to_mont(0), 0);
    EXPECT_EQ(m.from_mont(0), 0);
}

TYPED_TEST(hvmmax_test, to_mont_reduces)
{
    // Values above the modulus are reduced by the conversion.
    const TypeParam m;
    const auto x = m.mod + 5;
    if (x < m.mod)  // overflow
        return;
    EXPECT_EQ(m.from_mont(m.to_mont(x)), 5);
}

TYPED_TEST(hvmmax_test, add)
{
    const TypeParam m;
    const auto values = get_test_values(m);

    for (const auto& x : values)
    {
        for (const auto& y : values)
        {
            const auto expected = udivrem(intx::uint<320>{x} + y, m.mod).rem;
            const auto s = m.from_mont(m.add(m.to_mont(x), m.to_mont(y)));
            EXPECT_EQ(s, expected);

            // Addition works without the conversion to Montgomery form.
            EXPECT_EQ(m.add(x, y), expected);
        }
    }
}

TYPED_TEST(hvmmax_test, sub)
{
    const TypeParam m;
    const auto values = get_test_values(m);

    for (const auto& x : values)
    {
        for (const auto& y : values)
        {
            const auto expected = udivrem(intx::uint<320>{x} + m.mod - y, m.mod).rem;
            const auto d = m.from_mont(m.sub(m.to_mont(x), m.to_mont(y)));
            EXPECT_EQ(d, expected);
            EXPECT_EQ(m.sub(x, y), expected);
        }
    }
}

TYPED_TEST(hvmmax_test, mul)
{
    const TypeParam m;
    const auto values = get_test_values(m);

    for (const auto& x : values)
    {
        for (const auto& y : values)
        {
            const auto expected = udivrem(umul(x, y), m.mod).rem;
            const auto p = m.from_mont(m.mul(m.to_mont(x), m.to_mont(y)));
            EXPECT_EQ(p, expected);
        }
    }
}

TYPED_TEST(hvmmax_test, inv)
{
    const TypeParam m;
    for (const auto& x : get_test_values(m))
    {
        const auto xm = m.to_mont(x);
        const auto xm_inv = m.inv(xm);
        if (xm_inv == 0)  // not invertible
        {
            if (m.mod != M256)  // mod is prime
            {
                EXPECT_EQ(x, 0);
            }
            continue;
        }
        EXPECT_EQ(m.from_mont(m.mul(xm, xm_inv)), 1);
    }
}

TEST(hvmmax, pow)
{
    const ModArith m{P23};

    EXPECT_EQ(m.from_mont(pow(m, m.to_mont(3), 0_u256)), 1);
    EXPECT_EQ(m.from_mont(pow(m, m.to_mont(3), 1_u256)), 3);
    EXPECT_EQ(m.from_mont(pow(m, m.to_mont(3), 5_u256)), 243 % 23);
    EXPECT_EQ(m.from_mont(pow(m, m.to_mont(0), 5_u256)), 0);

    // Fermat's little theorem.
    for (const auto& x : {1_u256, 2_u256, 5_u256, 22_u256})
        EXPECT_EQ(m.from_mont(pow(m, m.to_mont(x), P23 - 1)), 1);
}

TEST(hvmmax, pow_inverse)
{
    // x^(N-2) is the inverse of x in the BN254 scalar field.
    const ModArith m{BN254Order};
    for (const auto& x :
        {2_u256, 0x5a17_u256, BN254Order - 1, 0x1c76476f4def4bb94541d57ebba1193381ffa7aa_u256})
    {
        const auto xm = m.to_mont(x);
        const auto x_inv = pow(m, xm, BN254Order - 2);
        EXPECT_EQ(x_inv, m.inv(xm));
        EXPECT_EQ(m.from_mont(m.mul(xm, x_inv)), 1);
    }
}

namespace
{
struct P23Config
{
    using uint_type = uint256;
    static constexpr auto MODULUS = P23;
};
}  // namespace

TEST(hvmmax, field_element)
{
    using F = FieldElement<P23Config>;

    const F a{5};
    const F b{20};
    EXPECT_EQ((a + b).value(), 2);
    EXPECT_EQ((a - b).value(), 8);
    EXPECT_EQ((b - a).value(), 15);
    EXPECT_EQ((-a).value(), 18);
    EXPECT_EQ((a * b).value(), 100 % 23);
    EXPECT_TRUE(a * a.inv() == F::one());
    EXPECT_TRUE(a.pow(P23 - 1) == F::one());

    EXPECT_TRUE(F{}.is_zero());
    EXPECT_TRUE(F{}.inv().is_zero());
    EXPECT_TRUE((-F{}).is_zero());
    EXPECT_EQ(F{P23 + 4}.value(), 4);
    EXPECT_TRUE(F::from_mont(a.mont()) == a);
}
