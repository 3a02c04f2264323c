// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <limits>
#include <string_view>

namespace hvmone
{
/// The cost reported for a call that can never be paid for.
inline constexpr auto GasCostMax = std::numeric_limits<int64_t>::max();

/// The protocol gas constants of the precompiled contracts.
///
/// The schedule is fixed at process start and passed by value to the Registry.
struct GasSchedule
{
    int64_t ecrecover = 3000;

    int64_t sha256_base = 60;
    int64_t sha256_word = 12;

    int64_t ripemd160_base = 600;
    int64_t ripemd160_word = 120;

    int64_t identity_base = 15;
    int64_t identity_word = 3;

    /// The divisor of the EIP-198 modexp cost formula.
    int64_t modexp_quad_divisor = 20;

    int64_t bn256_add = 500;
    int64_t bn256_scalar_mul = 40000;
    int64_t bn256_pairing_base = 100000;
    int64_t bn256_pairing_per_pair = 80000;

    int64_t zsc_verify = 500000;

    /// The costs as introduced in Byzantium.
    static constexpr GasSchedule byzantium() noexcept { return {}; }

    /// The Byzantium costs with the EIP-1108 reduction of the BN254 operations.
    static constexpr GasSchedule istanbul() noexcept
    {
        GasSchedule s;
        s.bn256_add = 150;
        s.bn256_scalar_mul = 6000;
        s.bn256_pairing_base = 45000;
        s.bn256_pairing_per_pair = 34000;
        return s;
    }

    friend constexpr bool operator==(const GasSchedule&, const GasSchedule&) noexcept = default;
};

/// Returns the named preset ("byzantium" or "istanbul").
/// @throws std::invalid_argument for an unknown name.
GasSchedule gas_schedule_preset(std::string_view name);

/// Loads the gas schedule from JSON.
///
/// The document is an object with the optional "preset" name to start from and any of the
/// GasSchedule fields given as integers or as strings of decimal digits or of "0x"-prefixed
/// hex digits, e.g. {"preset": "istanbul", "zsc_verify": "0x7a120"}.
///
/// @throws std::invalid_argument  for unknown keys, malformed or negative values.
/// @throws std::out_of_range      for values not fitting int64.
/// @throws nlohmann::json::exception for malformed JSON.
GasSchedule load_gas_schedule(std::istream& input);

/// Loads the gas schedule from the JSON file.
/// @throws std::runtime_error when the file cannot be opened.
GasSchedule load_gas_schedule(const std::filesystem::path& path);
}  // namespace hvmone
