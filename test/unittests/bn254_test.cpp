// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <hvmone_precompiles/bn254.hpp>
#include <hvmone_precompiles/bn254_tower.hpp>
#include <vector>

using namespace hvmmax::bn254;
using namespace intx;

namespace
{
constexpr Point G1{1, 2};

constexpr Point neg(const Point& p) noexcept
{
    return {p.x, Curve::FIELD_PRIME - p.y};
}

constexpr Point P1{0x0f25929bcb43d5a57391564615c9e70a992b10eafa4db109709649cf48c50dd2_u256,
    0x16da2f5cb6be7a0aa72c440c53c9bbdfec6c36c7d515536431b3a865468acbba_u256};
constexpr Point P1_2{0x1de49a4b0233273bba8146af82042d004f2085ec982397db0d97da17204cc286_u256,
    0x0217327ffc463919bef80cc166d09c6172639d8589799928761bcd9f22c903d4_u256};
constexpr Point P1_3{0x1f4d1d80177b1377743d1901f70d7389be7f7a35a35bfd234a8aaee615b88c49_u256,
    0x018683193ae021a2f8920fed186cde5d9b1365116865281ccf884c1f28b1df8f_u256};

/// The G2 generator.
constexpr ExtPoint G2{
    {0x1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed_u256,
        0x198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2_u256},
    {0x12c85ea5db8c6deb4aab71808dcb408fe3d1e7690c43d37b4ce6cc0166fa7daa_u256,
        0x090689d0585ff075ec9e99ad690c3395bc4b313370b38ef355acdadcd122975b_u256},
};
}  // namespace

TEST(bn254, is_on_curve)
{
    EXPECT_TRUE(is_on_curve(Point{}));
    EXPECT_TRUE(is_on_curve(G1));
    EXPECT_TRUE(is_on_curve(P1));
    EXPECT_FALSE(is_on_curve(Point{1, 3}));
    EXPECT_FALSE(is_on_curve(Point{0, 1}));

    // The coordinates are reduced before the check.
    EXPECT_TRUE(is_on_curve(Point{1 + Curve::FIELD_PRIME, 2}));
}

TEST(bn254, validate)
{
    EXPECT_TRUE(validate(Point{}));
    EXPECT_TRUE(validate(G1));
    EXPECT_TRUE(validate(P1_3));
    EXPECT_FALSE(validate(Point{1, 3}));
    EXPECT_FALSE(validate(Point{1 + Curve::FIELD_PRIME, 2}));
    EXPECT_FALSE(validate(Point{G1.x, G1.y + Curve::FIELD_PRIME}));
}

TEST(bn254, validate_twist)
{
    EXPECT_TRUE(validate(ExtPoint{}));
    EXPECT_TRUE(validate(G2));

    auto q = G2;
    q.x.first += 1;
    EXPECT_FALSE(validate(q));

    q = G2;
    q.y.second += Curve::FIELD_PRIME;
    EXPECT_TRUE(is_on_curve(q));
    EXPECT_FALSE(validate(q));

    // On the twisted curve but not in the G2 subgroup.
    const ExtPoint small_order{
        {0x13d841ba7ff3c6efd6870c3fea13a3ecab0423af5e4db9c5d28a6b46a05cd57b_u256,
            0x1a2b1eaa7b20faae36d26eff4db6e336c34434b66eded3cc5303d51ae353f478_u256},
        {0x2d3e8808aa7a7fffa8f871f10df8d59c6dd725889c46e9136e01cb2465b20723_u256,
            0x1d5224817b8714531fc77e20b975178b1b3044f4b729fa3230db03dc0088ebdb_u256},
    };
    EXPECT_FALSE(is_on_curve(small_order));
    EXPECT_FALSE(validate(small_order));
}

TEST(bn254, add)
{
    EXPECT_EQ(add(P1, Point{}), P1);
    EXPECT_EQ(add(Point{}, P1), P1);
    EXPECT_EQ(add(Point{}, Point{}), Point{});
    EXPECT_EQ(add(P1, P1), P1_2);
    EXPECT_EQ(add(P1, P1_2), P1_3);
    EXPECT_EQ(add(P1_2, P1), P1_3);
    EXPECT_EQ(add(P1, neg(P1)), Point{});

    const Point G1_2{0x030644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd3_u256,
        0x15ed738c0e0a7c92e7845f96b2ae9c0a68a6a449e3538fc7ff3ebf7a5a18a2c4_u256};
    EXPECT_EQ(add(G1, G1), G1_2);
}

TEST(bn254, mul)
{
    EXPECT_EQ(mul(P1, 0), Point{});
    EXPECT_EQ(mul(P1, 1), P1);
    EXPECT_EQ(mul(P1, 2), P1_2);
    EXPECT_EQ(mul(P1, 3), P1_3);
    EXPECT_EQ(mul(P1, Curve::ORDER), Point{});
    EXPECT_EQ(mul(P1, Curve::ORDER + 1), P1);
    EXPECT_EQ(mul(P1, Curve::ORDER - 1), neg(P1));
    EXPECT_EQ(mul(Point{}, 3), Point{});

    const Point G1_7{0x17072b2ed3bb8d759a5325f477629386cb6fc6ecb801bd76983a6b86abffe078_u256,
        0x168ada6cd130dd52017bb54bfa19377aadfe3bf05d18f41b77809f7f60d4af9e_u256};
    EXPECT_EQ(mul(G1, 7), G1_7);
}

TEST(bn254, pairing_check)
{
    const Point p1{0x1c76476f4def4bb94541d57ebba1193381ffa7aa76ada664dd31c16024c43f59_u256,
        0x3034dd2920f673e204fee2811c678745fc819b55d3e9d294e45c9b03a76aef41_u256};
    const auto np1 = neg(p1);
    const Point p1_17{0x22980b2e458ec77e258b19ca3a7b46181f63c6536307acae03eea236f6919eeb_u256,
        0x4eab993e2ba2cca2b08c216645e3fbcf80ae67515b2c49806c17b90c9d3cad3_u256};

    const ExtPoint q1{
        {0x04bf11ca01483bfa8b34b43561848d28905960114c8ac04049af4b6315a41678_u256,
            0x209dd15ebff5d46c4bd888e51a93cf99a7329636c63514396b4a452003a35bf7_u256},
        {0x120a2a4cf30c1bf9845f20c6fe39e07ea2cce61f0c9bb048165fe5e4de877550_u256,
            0x2bb8324af6cfc93537a2ad1a445cfd0ca2a71acd7ac41fadbf933c2a51be344d_u256},
    };
    const ExtPoint nq1{q1.x, {Curve::FIELD_PRIME - q1.y.first, Curve::FIELD_PRIME - q1.y.second}};
    const ExtPoint nq1_16{
        {0x14191bd65f51663a1d4ad71d8480c3c3260d598aab6ed95681f773abade7fd7a_u256,
            0x299c79589dfb51fd6925fce3a7fc15c441fdafaa24f0d09b7c443befdddde4e5_u256},
        {0x1d710ac19a995c6395f33be7f3dcd75e0632a006d196da6b4c9ba78708b6bb78_u256,
            0xcae1001513ae5ddf742aa6dc2f52457d9b14e17765dd74fc098ad06045d434e_u256},
    };
    const ExtPoint nq1_17{
        {0x11eeb08db4fe0df9d7617f11f5f8f488d643510f825f3730ffb038c84c9260fd_u256,
            0x12bf46039aa40a61762bf97b1bb028cebc6d42e46bbbe67f715eda54808b74c4_u256},
        {0x42b65e62de1fd24534db81fd72e7ee832637948c1c466ccb08171e503f23e72_u256,
            0x197a5efb333448885788690df5af2211c1697dd8b7b1f8845b4e30a909d2b0f5_u256},
    };

    using Pairs = std::vector<std::pair<Point, ExtPoint>>;
    EXPECT_TRUE(pairing_check(Pairs{}));
    EXPECT_TRUE(pairing_check(Pairs{{p1, q1}, {np1, q1}}));
    EXPECT_TRUE(pairing_check(Pairs{{p1, q1}, {p1, nq1}}));
    EXPECT_TRUE(pairing_check(Pairs{{p1_17, q1}, {p1, nq1_17}}));
    EXPECT_FALSE(pairing_check(Pairs{{p1_17, q1}, {p1, nq1_16}}));
    EXPECT_FALSE(pairing_check(Pairs{{p1_17, q1}}));

    // Pairs with the point at infinity do not contribute.
    EXPECT_TRUE(pairing_check(Pairs{{Point{}, q1}}));
    EXPECT_TRUE(pairing_check(Pairs{{p1, ExtPoint{}}}));
    EXPECT_TRUE(pairing_check(Pairs{{p1, q1}, {Point{}, q1}, {np1, q1}}));
}

TEST(bn254, pairing_check_generators)
{
    using Pairs = std::vector<std::pair<Point, ExtPoint>>;
    EXPECT_FALSE(pairing_check(Pairs{{G1, G2}}));
    EXPECT_TRUE(pairing_check(Pairs{{G1, G2}, {neg(G1), G2}}));
    EXPECT_TRUE(pairing_check(
        Pairs{{mul(G1, 5), G2}, {neg(mul(G1, 2)), G2}, {neg(mul(G1, 3)), G2}}));
}

TEST(bn254, tower_inverse)
{
    const Fq2 a{Fq{3}, Fq{0x1c76476f4def4bb94541d57ebba1193381ffa7aa76ada664dd31c16024c43f59_u256}};
    const Fq2 b{Fq{Curve::FIELD_PRIME - 1}, Fq{7}};
    const Fq2 c{Fq{11}, Fq{}};

    EXPECT_TRUE(a * a.inv() == Fq2::one());
    EXPECT_TRUE(a.conjugate().conjugate() == a);
    EXPECT_TRUE((a * c).mul_by_xi() == a * (c * Fq2{Fq{9}, Fq{1}}));

    const Fq6 x{a, b, c};
    EXPECT_TRUE(x * x.inv() == Fq6::one());
    EXPECT_TRUE(x.mul_by_v() == x * Fq6{{}, Fq2::one(), {}});

    const Fq12 y{x, Fq6{c, a, b}};
    EXPECT_TRUE(y * y.inv() == Fq12::one());
    EXPECT_TRUE(y.conjugate() * y == y * y.conjugate());
}
