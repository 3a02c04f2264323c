// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "gas_schedule.hpp"
#include "tracing.hpp"
#include <evmc/evmc.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

namespace hvmone
{
/// The precompile identifiers and their corresponding addresses.
enum class PrecompileId : uint8_t
{
    ecrecover = 0x01,
    sha256 = 0x02,
    ripemd160 = 0x03,
    identity = 0x04,
    expmod = 0x05,
    ecadd = 0x06,
    ecmul = 0x07,
    ecpairing = 0x08,
    zscverify = 0x09,

    latest = zscverify  ///< The latest introduced precompile (highest address).
};

/// The total number of known precompiles ids, including 0.
inline constexpr std::size_t NumPrecompiles = static_cast<std::size_t>(PrecompileId::latest) + 1;

/// Checks if the address @p addr is a precompiled contract.
bool is_precompile(const evmc::address& addr) noexcept;

/// Returns the address of the precompile.
constexpr evmc::address precompile_address(PrecompileId id) noexcept
{
    return evmc::address{static_cast<uint64_t>(id)};
}

/// Returns the lowercase name of the precompile, e.g. "ecpairing".
std::string_view precompile_name(PrecompileId id) noexcept;

/// Finds the precompile by its name.
std::optional<PrecompileId> find_precompile(std::string_view name) noexcept;

/// The gas accounting capability of the calling execution context.
class GasMeter
{
public:
    virtual ~GasMeter() = default;

    /// Deducts the @p amount of gas.
    /// @return False if the amount exceeds the gas left. Nothing is deducted in such case.
    [[nodiscard]] virtual bool use_gas(int64_t amount) noexcept = 0;
};

/// The simple gas meter with a fixed gas limit.
class GasCounter : public GasMeter
{
    int64_t m_gas_left;

public:
    explicit GasCounter(int64_t gas_limit) noexcept : m_gas_left{gas_limit} {}

    [[nodiscard]] bool use_gas(int64_t amount) noexcept override
    {
        if (amount > m_gas_left)
            return false;
        m_gas_left -= amount;
        return true;
    }

    [[nodiscard]] int64_t gas_left() const noexcept { return m_gas_left; }
};

/// The outcome of the precompile execution.
struct PrecompileOutput
{
    /// The hvmone error. Falsy for success.
    std::error_code error;

    /// The output bytes. Empty when the execution failed.
    evmc::bytes output;
};

/// The precompiled contracts bound to the gas schedule.
///
/// The registry is immutable after construction (except for attaching tracers)
/// and can be used from multiple threads if the attached tracers allow that.
class Registry
{
    GasSchedule m_gas_schedule;
    std::unique_ptr<Tracer> m_first_tracer;

public:
    explicit Registry(const GasSchedule& gas_schedule = GasSchedule::byzantium()) noexcept
      : m_gas_schedule{gas_schedule}
    {}

    [[nodiscard]] const GasSchedule& gas_schedule() const noexcept { return m_gas_schedule; }

    /// Appends the tracer to the end of the tracer list.
    void add_tracer(std::unique_ptr<Tracer> tracer) noexcept;

    /// Checks if the address @p addr is a precompiled contract in this registry.
    [[nodiscard]] bool contains(const evmc::address& addr) const noexcept
    {
        return is_precompile(addr);
    }

    /// Computes the gas cost of the call. Returns std::nullopt for an unknown address.
    [[nodiscard]] std::optional<int64_t> required_gas(
        const evmc::address& addr, evmc::bytes_view input) const noexcept;

    /// Charges the gas from the @p gas_meter and executes the precompile.
    ///
    /// The meter is charged at most once and the precompile is not executed when the charge
    /// fails (OUT_OF_GAS).
    ///
    /// @return The precompile outcome or std::nullopt if @p addr is not a precompile.
    [[nodiscard]] std::optional<PrecompileOutput> run(
        const evmc::address& addr, evmc::bytes_view input, GasMeter& gas_meter) const;

    /// Executes the message to a precompiled contract (msg.code_address must be a precompile).
    [[nodiscard]] evmc::Result call(const evmc_message& msg) const noexcept;
};
}  // namespace hvmone
