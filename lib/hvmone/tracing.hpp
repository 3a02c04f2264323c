// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "errors.hpp"
#include <evmc/evmc.hpp>
#include <memory>
#include <ostream>

namespace hvmone
{
enum class PrecompileId : uint8_t;

class Tracer
{
    friend class Registry;  // Has access the m_next_tracer to traverse the list forward.
    std::unique_ptr<Tracer> m_next_tracer;

public:
    virtual ~Tracer() = default;

    void notify_precompile_start(  // NOLINT(misc-no-recursion)
        PrecompileId id, evmc::bytes_view input, int64_t gas_cost) noexcept
    {
        on_precompile_start(id, input, gas_cost);
        if (m_next_tracer)
            m_next_tracer->notify_precompile_start(id, input, gas_cost);
    }

    void notify_precompile_end(  // NOLINT(misc-no-recursion)
        PrecompileId id, ErrorCode error, evmc::bytes_view output) noexcept
    {
        on_precompile_end(id, error, output);
        if (m_next_tracer)
            m_next_tracer->notify_precompile_end(id, error, output);
    }

private:
    virtual void on_precompile_start(
        PrecompileId id, evmc::bytes_view input, int64_t gas_cost) noexcept = 0;
    virtual void on_precompile_end(
        PrecompileId id, ErrorCode error, evmc::bytes_view output) noexcept = 0;
};

/// Creates the tracer reporting every precompile call as two JSON lines:
/// {"address":"0x..","name":"..","input_size":N,"gas_cost":N} at start
/// and {"name":"..","status":"..","output":"0x.."} at the end.
///
/// @param out  Report output stream.
/// @return     Precompile tracer object.
std::unique_ptr<Tracer> create_precompile_tracer(std::ostream& out);
}  // namespace hvmone
