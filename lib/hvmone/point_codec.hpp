// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include <hvmone_precompiles/bn254.hpp>
#include <variant>

namespace hvmone
{
using hvmmax::bn254::ExtPoint;
using hvmmax::bn254::Point;

/// The size of the encoded G1 point: x ‖ y, 32-byte big-endian each.
inline constexpr size_t POINT_SIZE = 64;

/// The size of the encoded G2 point: x_im ‖ x_re ‖ y_im ‖ y_re, 32-byte big-endian each.
inline constexpr size_t TWIST_POINT_SIZE = 128;

/// Decodes and validates the G1 point from POINT_SIZE bytes.
///
/// The all-zero encoding is the point at infinity. Otherwise the curve equation is checked
/// first (NOT_ON_CURVE) and then the coordinates must be below the field prime
/// (INVALID_CURVE_POINT).
std::variant<Point, ErrorCode> decode_point(const uint8_t* input) noexcept;

/// Decodes and validates the G2 point from TWIST_POINT_SIZE bytes.
///
/// Same rules as decode_point() applied to all four components. Twisted curve points
/// outside of the G2 subgroup are NOT_ON_CURVE.
std::variant<ExtPoint, ErrorCode> decode_twist_point(const uint8_t* input) noexcept;

/// Encodes the G1 point to POINT_SIZE bytes. The infinity is encoded as zeros.
void encode_point(uint8_t* output, const Point& pt) noexcept;
}  // namespace hvmone
