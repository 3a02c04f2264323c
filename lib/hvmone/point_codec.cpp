// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "point_codec.hpp"
#include <initializer_list>

namespace hvmone
{
using intx::uint256;
namespace bn254 = hvmmax::bn254;

std::variant<Point, ErrorCode> decode_point(const uint8_t* input) noexcept
{
    const Point pt{
        intx::be::unsafe::load<uint256>(input),
        intx::be::unsafe::load<uint256>(input + 32),
    };

    if (pt.is_inf())
        return pt;
    if (!bn254::is_on_curve(pt))
        return NOT_ON_CURVE;
    if (!bn254::is_field_element(pt.x) || !bn254::is_field_element(pt.y))
        return INVALID_CURVE_POINT;
    return pt;
}

std::variant<ExtPoint, ErrorCode> decode_twist_point(const uint8_t* input) noexcept
{
    // The imaginary part goes first.
    const ExtPoint pt{
        {intx::be::unsafe::load<uint256>(input + 32), intx::be::unsafe::load<uint256>(input)},
        {intx::be::unsafe::load<uint256>(input + 96), intx::be::unsafe::load<uint256>(input + 64)},
    };

    if (pt.is_inf())
        return pt;
    if (!bn254::is_on_curve(pt))
        return NOT_ON_CURVE;
    for (const auto& v : {pt.x.first, pt.x.second, pt.y.first, pt.y.second})
    {
        if (!bn254::is_field_element(v))
            return INVALID_CURVE_POINT;
    }
    return pt;
}

void encode_point(uint8_t* output, const Point& pt) noexcept
{
    intx::be::unsafe::store(output, pt.x);
    intx::be::unsafe::store(output + 32, pt.y);
}
}  // namespace hvmone
