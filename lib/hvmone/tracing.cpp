// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "tracing.hpp"
#include "precompiles.hpp"
#include <evmc/hex.hpp>

namespace hvmone
{
namespace
{
/// @see create_precompile_tracer()
class PrecompileTracer : public Tracer
{
    std::ostream& m_out;  ///< Output stream.

    void on_precompile_start(
        PrecompileId id, evmc::bytes_view input, int64_t gas_cost) noexcept override
    {
        m_out << "{";
        const auto addr = precompile_address(id);
        m_out << R"("address":"0x)" << evmc::hex({addr.bytes, sizeof(addr.bytes)}) << '"';
        m_out << R"(,"name":")" << precompile_name(id) << '"';
        m_out << R"(,"input_size":)" << input.size();
        m_out << R"(,"gas_cost":)" << gas_cost;
        m_out << "}\n";
    }

    void on_precompile_end(
        PrecompileId id, ErrorCode error, evmc::bytes_view output) noexcept override
    {
        m_out << "{";
        m_out << R"("name":")" << precompile_name(id) << '"';
        const auto status = (error == SUCCESS) ? "success" : make_error_code(error).message();
        m_out << R"(,"status":")" << status << '"';
        m_out << R"(,"output":"0x)" << evmc::hex(output) << '"';
        m_out << "}\n";
    }

public:
    explicit PrecompileTracer(std::ostream& out) noexcept : m_out{out}
    {
        m_out << std::dec;  // Set number formatting to dec, JSON does not support other forms.
    }
};
}  // namespace

std::unique_ptr<Tracer> create_precompile_tracer(std::ostream& out)
{
    return std::make_unique<PrecompileTracer>(out);
}
}  // namespace hvmone
