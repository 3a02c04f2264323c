// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include "gas_schedule.hpp"
#include <evmc/evmc.hpp>

namespace hvmone
{
struct ExecutionResult
{
    ErrorCode error;
    size_t output_size;
};

struct PrecompileAnalysis
{
    int64_t gas_cost;
    size_t max_output_size;
};

PrecompileAnalysis ecrecover_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis sha256_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis ripemd160_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis identity_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis expmod_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis ecadd_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis ecmul_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis ecpairing_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;
PrecompileAnalysis zscverify_analyze(evmc::bytes_view input, const GasSchedule& gas) noexcept;

ExecutionResult ecrecover_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult sha256_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult ripemd160_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult identity_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult expmod_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult ecadd_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult ecmul_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult ecpairing_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
ExecutionResult zscverify_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept;
}  // namespace hvmone
