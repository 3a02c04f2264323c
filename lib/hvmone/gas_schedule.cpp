// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "gas_schedule.hpp"
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>

namespace hvmone
{
namespace json = nlohmann;

namespace
{
struct Field
{
    std::string_view name;
    int64_t GasSchedule::*member;
};

constexpr Field fields[]{
    {"ecrecover", &GasSchedule::ecrecover},
    {"sha256_base", &GasSchedule::sha256_base},
    {"sha256_word", &GasSchedule::sha256_word},
    {"ripemd160_base", &GasSchedule::ripemd160_base},
    {"ripemd160_word", &GasSchedule::ripemd160_word},
    {"identity_base", &GasSchedule::identity_base},
    {"identity_word", &GasSchedule::identity_word},
    {"modexp_quad_divisor", &GasSchedule::modexp_quad_divisor},
    {"bn256_add", &GasSchedule::bn256_add},
    {"bn256_scalar_mul", &GasSchedule::bn256_scalar_mul},
    {"bn256_pairing_base", &GasSchedule::bn256_pairing_base},
    {"bn256_pairing_per_pair", &GasSchedule::bn256_pairing_per_pair},
    {"zsc_verify", &GasSchedule::zsc_verify},
};

/// Parses the decimal or the "0x"-prefixed hex digits. Signs, whitespace and empty digit
/// strings are rejected. "010" is decimal.
uint64_t parse_gas_string(const std::string& s, std::string_view key)
{
    const auto is_hex = s.starts_with("0x");
    const std::string_view digits{s.data() + (is_hex ? 2 : 0), s.size() - (is_hex ? 2 : 0)};
    const auto is_digit = [is_hex](char c) noexcept {
        const auto u = static_cast<unsigned char>(c);
        return (is_hex ? std::isxdigit(u) : std::isdigit(u)) != 0;
    };
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit))
        throw std::invalid_argument(
            "gas schedule: " + std::string{key} + " must be integer or string of integer");

    // 19 decimal digits always fit uint64.
    if (!is_hex && digits.size() > 19)
        throw std::out_of_range("gas schedule: value of " + std::string{key} + " too big");

    try
    {
        return intx::from_string<uint64_t>(s);
    }
    catch (const std::out_of_range&)
    {
        throw std::out_of_range("gas schedule: value of " + std::string{key} + " too big");
    }
}

int64_t gas_from_json(const json::json& j, std::string_view key)
{
    int64_t v = 0;
    if (j.is_number_unsigned())
    {
        const auto u = j.get<uint64_t>();
        if (u > static_cast<uint64_t>(GasCostMax))
            throw std::out_of_range("gas schedule: value of " + std::string{key} + " too big");
        v = static_cast<int64_t>(u);
    }
    else if (j.is_number_integer())
        v = j.get<int64_t>();
    else if (j.is_string())
    {
        const auto u = parse_gas_string(j.get<std::string>(), key);
        if (u > static_cast<uint64_t>(GasCostMax))
            throw std::out_of_range("gas schedule: value of " + std::string{key} + " too big");
        v = static_cast<int64_t>(u);
    }
    else
        throw std::invalid_argument(
            "gas schedule: " + std::string{key} + " must be integer or string of integer");

    if (v < 0)
        throw std::invalid_argument("gas schedule: " + std::string{key} + " must not be negative");
    return v;
}
}  // namespace

GasSchedule gas_schedule_preset(std::string_view name)
{
    if (name == "byzantium")
        return GasSchedule::byzantium();
    if (name == "istanbul")
        return GasSchedule::istanbul();
    throw std::invalid_argument("unknown gas schedule preset: " + std::string{name});
}

GasSchedule load_gas_schedule(std::istream& input)
{
    const auto j = json::json::parse(input);
    if (!j.is_object())
        throw std::invalid_argument("gas schedule: JSON object expected");

    GasSchedule schedule;
    if (const auto it = j.find("preset"); it != j.end())
        schedule = gas_schedule_preset(it->get<std::string>());

    for (const auto& [key, value] : j.items())
    {
        if (key == "preset")
            continue;

        const auto field = std::find_if(std::begin(fields), std::end(fields),
            [&key](const Field& f) { return f.name == key; });
        if (field == std::end(fields))
            throw std::invalid_argument("gas schedule: unknown key " + key);

        schedule.*(field->member) = gas_from_json(value, key);
    }

    // Division by zero in the modexp cost formula.
    if (schedule.modexp_quad_divisor == 0)
        throw std::invalid_argument("gas schedule: modexp_quad_divisor must not be zero");

    return schedule;
}

GasSchedule load_gas_schedule(const std::filesystem::path& path)
{
    std::ifstream file{path};
    if (!file)
        throw std::runtime_error("cannot open gas schedule file " + path.string());
    return load_gas_schedule(file);
}
}  // namespace hvmone
