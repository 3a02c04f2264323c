// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "precompiles.hpp"
#include "point_codec.hpp"
#include "precompiles_internal.hpp"
#include <hvmone_precompiles/bn254.hpp>
#include <hvmone_precompiles/expmod.hpp>
#include <hvmone_precompiles/ripemd160.hpp>
#include <hvmone_precompiles/secp256k1.hpp>
#include <hvmone_precompiles/sha256.hpp>
#include <hvmone_precompiles/zsc.hpp>
#include <intx/intx.hpp>
#include <algorithm>
#include <array>
#include <bit>
#include <cassert>
#include <cstring>
#include <limits>
#include <memory>
#include <span>
#include <vector>

namespace hvmone
{
using evmc::bytes_view;
using intx::uint256;

namespace
{
constexpr int64_t num_words(size_t size_in_bytes) noexcept
{
    return static_cast<int64_t>((size_in_bytes + 31) / 32);
}

constexpr int64_t saturate(const uint256& gas) noexcept
{
    return static_cast<int64_t>(std::min(gas, uint256{GasCostMax}));
}

/// Computes base + per_unit⋅units, saturated to GasCostMax.
constexpr int64_t linear_cost(int64_t base, int64_t per_unit, int64_t units) noexcept
{
    return saturate(uint256{static_cast<uint64_t>(base)} +
                    uint256{static_cast<uint64_t>(per_unit)} * static_cast<uint64_t>(units));
}

int64_t cost_per_input_word(int64_t base, int64_t word, size_t input_size) noexcept
{
    return linear_cost(base, word, num_words(input_size));
}

constexpr size_t ECPAIRING_PAIR_SIZE = POINT_SIZE + TWIST_POINT_SIZE;

/// The zscverify transcript layout.
namespace zsc_layout
{
constexpr size_t SALT = 64;
constexpr size_t H = 128;
constexpr size_t U = H + crypto::ZSC_VECTOR_SIZE * POINT_SIZE;
constexpr size_t P = U + POINT_SIZE;
constexpr size_t L = P + POINT_SIZE + 32;  // P is followed by the 32-byte pad.
constexpr size_t R = L + crypto::ZSC_ROUNDS * POINT_SIZE;
constexpr size_t A = R + crypto::ZSC_ROUNDS * POINT_SIZE;
constexpr size_t B = A + 32;
constexpr size_t SIZE = B + 32;
static_assert(SIZE == 3040);
}  // namespace zsc_layout

/// Returns the first N input bytes. The bytes missing in the input are zeros.
template <size_t N>
std::array<uint8_t, N> padded_input(const uint8_t* input, size_t input_size) noexcept
{
    std::array<uint8_t, N> buffer{};
    if (input_size != 0)
        std::copy_n(input, std::min(input_size, N), buffer.begin());
    return buffer;
}

/// The expmod input header: the lengths of the base, the exponent and the modulus.
struct ExpmodHeader
{
    static constexpr size_t SIZE = 3 * sizeof(uint256);

    uint256 base_len;
    uint256 exp_len;
    uint256 mod_len;

    static ExpmodHeader read(bytes_view input) noexcept
    {
        const auto h = padded_input<SIZE>(input.data(), input.size());
        return {intx::be::unsafe::load<uint256>(&h[0]), intx::be::unsafe::load<uint256>(&h[32]),
            intx::be::unsafe::load<uint256>(&h[64])};
    }
};

/// The lengths above this are not addressable.
constexpr uint256 LEN_LIMIT{std::numeric_limits<size_t>::max()};

/// The EIP-198 multiplication complexity of the max(base, modulus) length x.
constexpr uint256 expmod_mult_complexity(const uint256& x) noexcept
{
    if (x <= 64)
        return x * x;
    if (x <= 1024)
        return x * x / 4 + x * 96 - 3072;
    return x * x / 16 + x * 480 - 199680;
}

/// The EIP-198 adjusted exponent length: the index of the top set bit of the exponent head
/// (the first 32 bytes), increased by 8 for every exponent byte past the head. At least 1.
uint256 adjusted_exponent_length(bytes_view body, const ExpmodHeader& header) noexcept
{
    const auto exp_len = static_cast<size_t>(header.exp_len);
    uint256 result = 0;
    if (exp_len > 32)
        result = uint256{exp_len - 32} * 8;

    const auto head_len = std::min(exp_len, size_t{32});
    const auto exp_begin = static_cast<size_t>(std::min(header.base_len, uint256{body.size()}));
    const auto head = body.substr(exp_begin, head_len);
    const auto top = std::find_if(head.begin(), head.end(), [](uint8_t b) { return b != 0; });
    if (top != head.end())
    {
        const auto top_index = static_cast<size_t>(top - head.begin());
        result += (head_len - top_index - 1) * 8 + static_cast<size_t>(std::bit_width(*top)) - 1;
    }
    return std::max(result, uint256{1});
}

/// Writes the 32-byte boolean word.
void store_bool(uint8_t* output, bool value) noexcept
{
    std::fill_n(output, 31, 0);
    output[31] = value ? 1 : 0;
}
}  // namespace

PrecompileAnalysis ecrecover_analyze(bytes_view /*input*/, const GasSchedule& gas) noexcept
{
    return {gas.ecrecover, 32};
}

PrecompileAnalysis sha256_analyze(bytes_view input, const GasSchedule& gas) noexcept
{
    return {cost_per_input_word(gas.sha256_base, gas.sha256_word, input.size()), 32};
}

PrecompileAnalysis ripemd160_analyze(bytes_view input, const GasSchedule& gas) noexcept
{
    return {cost_per_input_word(gas.ripemd160_base, gas.ripemd160_word, input.size()), 32};
}

PrecompileAnalysis identity_analyze(bytes_view input, const GasSchedule& gas) noexcept
{
    return {cost_per_input_word(gas.identity_base, gas.identity_word, input.size()), input.size()};
}

PrecompileAnalysis ecadd_analyze(bytes_view /*input*/, const GasSchedule& gas) noexcept
{
    return {gas.bn256_add, 64};
}

PrecompileAnalysis ecmul_analyze(bytes_view /*input*/, const GasSchedule& gas) noexcept
{
    return {gas.bn256_scalar_mul, 64};
}

PrecompileAnalysis ecpairing_analyze(bytes_view input, const GasSchedule& gas) noexcept
{
    const auto num_pairs = static_cast<int64_t>(input.size() / ECPAIRING_PAIR_SIZE);
    return {linear_cost(gas.bn256_pairing_base, gas.bn256_pairing_per_pair, num_pairs), 32};
}

PrecompileAnalysis zscverify_analyze(bytes_view /*input*/, const GasSchedule& gas) noexcept
{
    return {gas.zsc_verify, 32};
}

PrecompileAnalysis expmod_analyze(bytes_view input, const GasSchedule& gas) noexcept
{
    const auto header = ExpmodHeader::read(input);
    if (header.base_len == 0 && header.mod_len == 0)
        return {0, 0};

    if (header.base_len > LEN_LIMIT || header.exp_len > LEN_LIMIT || header.mod_len > LEN_LIMIT)
        return {GasCostMax, 0};

    const auto body = input.substr(std::min(input.size(), ExpmodHeader::SIZE));
    const auto cost = expmod_mult_complexity(std::max(header.base_len, header.mod_len)) *
                      adjusted_exponent_length(body, header) /
                      static_cast<uint64_t>(gas.modexp_quad_divisor);
    return {saturate(cost), static_cast<size_t>(header.mod_len)};
}

ExecutionResult ecrecover_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    assert(output_size >= 32);

    const auto in = padded_input<128>(input, input_size);

    ethash::hash256 h{};
    std::copy_n(in.begin(), sizeof(h), h.bytes);

    // Only the recovery ids 27 and 28 are accepted, other values give the empty output.
    const auto v = intx::be::unsafe::load<uint256>(&in[32]);
    if (v != 27 && v != 28)
        return {SUCCESS, 0};

    const auto r = intx::be::unsafe::load<uint256>(&in[64]);
    const auto s = intx::be::unsafe::load<uint256>(&in[96]);
    const auto res = hvmmax::secp256k1::ecrecover(h, r, s, v == 28);
    if (!res)
        return {SUCCESS, 0};

    std::memset(output, 0, 12);
    std::memcpy(output + 12, res->bytes, 20);
    return {SUCCESS, 32};
}

ExecutionResult sha256_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    assert(output_size >= 32);
    if (!crypto::sha256(reinterpret_cast<std::byte*>(output),
            reinterpret_cast<const std::byte*>(input), input_size))
        return {UNKNOWN_ERROR, 0};
    return {SUCCESS, 32};
}

ExecutionResult ripemd160_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    assert(output_size >= 32);
    output = std::fill_n(output, 12, std::uint8_t{0});
    if (!crypto::ripemd160(reinterpret_cast<std::byte*>(output),
            reinterpret_cast<const std::byte*>(input), input_size))
        return {UNKNOWN_ERROR, 0};
    return {SUCCESS, 32};
}

ExecutionResult identity_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    assert(output_size >= input_size);
    std::copy_n(input, input_size, output);
    return {SUCCESS, input_size};
}

ExecutionResult expmod_execute(
    const uint8_t* input, size_t input_size, uint8_t* output, size_t output_size) noexcept
{
    // The output size is the modulus length.
    const auto zero_result = [output, output_size]() noexcept -> ExecutionResult {
        std::fill_n(output, output_size, 0);
        return {SUCCESS, output_size};
    };

    // No body bytes: the modulus is zero.
    if (output_size == 0 || input_size <= ExpmodHeader::SIZE) [[unlikely]]
        return zero_result();

    const auto header = ExpmodHeader::read({input, input_size});
    const auto body_size = header.base_len + header.exp_len + output_size;
    static constexpr uint256 BODY_SIZE_LIMIT{std::numeric_limits<std::ptrdiff_t>::max()};
    if (header.base_len > LEN_LIMIT || header.exp_len > LEN_LIMIT || body_size > BODY_SIZE_LIMIT)
        [[unlikely]]
        return {UNKNOWN_ERROR, 0};

    // The body with the missing bytes being zeros.
    const auto size = static_cast<size_t>(body_size);
    const std::unique_ptr<uint8_t[]> buffer{new (std::nothrow) uint8_t[size]{}};
    if (buffer == nullptr) [[unlikely]]
        return {UNKNOWN_ERROR, 0};
    std::copy_n(input + ExpmodHeader::SIZE, std::min(input_size - ExpmodHeader::SIZE, size),
        buffer.get());

    const std::span<const uint8_t> body{buffer.get(), size};
    const auto base_size = static_cast<size_t>(header.base_len);
    const auto mod = body.last(output_size);
    if (std::all_of(mod.begin(), mod.end(), [](uint8_t b) { return b == 0; }))
        return zero_result();

    crypto::expmod(body.first(base_size),
        body.subspan(base_size, static_cast<size_t>(header.exp_len)), mod, output);
    return {SUCCESS, output_size};
}

ExecutionResult ecadd_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    assert(output_size >= 64);

    const auto in = padded_input<2 * POINT_SIZE>(input, input_size);

    const auto p = decode_point(in.data());
    if (const auto err = std::get_if<ErrorCode>(&p))
        return {*err, 0};
    const auto q = decode_point(&in[POINT_SIZE]);
    if (const auto err = std::get_if<ErrorCode>(&q))
        return {*err, 0};

    encode_point(output, hvmmax::bn254::add(std::get<Point>(p), std::get<Point>(q)));
    return {SUCCESS, 64};
}

ExecutionResult ecmul_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    assert(output_size >= 64);

    const auto in = padded_input<POINT_SIZE + 32>(input, input_size);

    const auto p = decode_point(in.data());
    if (const auto err = std::get_if<ErrorCode>(&p))
        return {*err, 0};
    const auto c = intx::be::unsafe::load<uint256>(&in[POINT_SIZE]);

    encode_point(output, hvmmax::bn254::mul(std::get<Point>(p), c));
    return {SUCCESS, 64};
}

ExecutionResult ecpairing_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    static constexpr auto OUTPUT_SIZE = 32;
    assert(output_size >= OUTPUT_SIZE);

    if (input_size % ECPAIRING_PAIR_SIZE != 0)
        return {INVALID_INPUT_ENCODING, 0};

    std::vector<std::pair<Point, ExtPoint>> pairs;
    pairs.reserve(input_size / ECPAIRING_PAIR_SIZE);
    for (auto input_ptr = input; input_ptr != input + input_size; input_ptr += ECPAIRING_PAIR_SIZE)
    {
        const auto p = decode_point(input_ptr);
        if (const auto err = std::get_if<ErrorCode>(&p))
            return {*err, 0};
        const auto q = decode_twist_point(input_ptr + POINT_SIZE);
        if (const auto err = std::get_if<ErrorCode>(&q))
            return {*err, 0};
        pairs.emplace_back(std::get<Point>(p), std::get<ExtPoint>(q));
    }

    store_bool(output, hvmmax::bn254::pairing_check(pairs));
    return {SUCCESS, OUTPUT_SIZE};
}

ExecutionResult zscverify_execute(const uint8_t* input, size_t input_size, uint8_t* output,
    [[maybe_unused]] size_t output_size) noexcept
{
    static constexpr auto OUTPUT_SIZE = 32;
    assert(output_size >= OUTPUT_SIZE);

    // The transcript too short to hold a proof: echo the first byte.
    if (input_size < zsc_layout::SIZE)
    {
        std::fill_n(output, OUTPUT_SIZE, 0);
        if (input_size != 0)
            output[OUTPUT_SIZE - 1] = input[0];
        return {SUCCESS, OUTPUT_SIZE};
    }

    crypto::InnerProductProof proof;
    ErrorCode error = SUCCESS;
    const auto load_point = [&](size_t offset) noexcept {
        const auto pt = decode_point(input + offset);
        if (const auto err = std::get_if<ErrorCode>(&pt))
        {
            if (error == SUCCESS)
                error = *err;
            return Point{};
        }
        return std::get<Point>(pt);
    };

    proof.salt = intx::be::unsafe::load<uint256>(input + zsc_layout::SALT);
    proof.h.reserve(crypto::ZSC_VECTOR_SIZE);
    for (size_t i = 0; i < crypto::ZSC_VECTOR_SIZE; ++i)
        proof.h.push_back(load_point(zsc_layout::H + i * POINT_SIZE));
    proof.u = load_point(zsc_layout::U);
    proof.p = load_point(zsc_layout::P);
    proof.l.reserve(crypto::ZSC_ROUNDS);
    proof.r.reserve(crypto::ZSC_ROUNDS);
    for (size_t i = 0; i < crypto::ZSC_ROUNDS; ++i)
    {
        proof.l.push_back(load_point(zsc_layout::L + i * POINT_SIZE));
        proof.r.push_back(load_point(zsc_layout::R + i * POINT_SIZE));
    }
    proof.a = intx::be::unsafe::load<uint256>(input + zsc_layout::A);
    proof.b = intx::be::unsafe::load<uint256>(input + zsc_layout::B);

    if (error != SUCCESS)
        return {error, 0};

    const auto generators = crypto::zsc_generators().first<crypto::ZSC_VECTOR_SIZE>();
    store_bool(output, crypto::verify_inner_product(generators, proof));
    return {SUCCESS, OUTPUT_SIZE};
}

namespace
{
struct PrecompileTraits
{
    std::string_view name;
    decltype(identity_analyze)* analyze = nullptr;
    decltype(identity_execute)* execute = nullptr;
};

inline constexpr std::array<PrecompileTraits, NumPrecompiles> traits{{
    {},  // undefined for 0
    {"ecrecover", ecrecover_analyze, ecrecover_execute},
    {"sha256", sha256_analyze, sha256_execute},
    {"ripemd160", ripemd160_analyze, ripemd160_execute},
    {"identity", identity_analyze, identity_execute},
    {"expmod", expmod_analyze, expmod_execute},
    {"ecadd", ecadd_analyze, ecadd_execute},
    {"ecmul", ecmul_analyze, ecmul_execute},
    {"ecpairing", ecpairing_analyze, ecpairing_execute},
    {"zscverify", zscverify_analyze, zscverify_execute},
}};
}  // namespace

bool is_precompile(const evmc::address& addr) noexcept
{
    static constexpr auto address_boundary = precompile_address(PrecompileId::latest);
    return !evmc::is_zero(addr) && addr <= address_boundary;
}

std::string_view precompile_name(PrecompileId id) noexcept
{
    const auto index = static_cast<size_t>(id);
    return (index != 0 && index < traits.size()) ? traits[index].name : "unknown";
}

std::optional<PrecompileId> find_precompile(std::string_view name) noexcept
{
    for (size_t i = 1; i < traits.size(); ++i)
    {
        if (traits[i].name == name)
            return static_cast<PrecompileId>(i);
    }
    return std::nullopt;
}

void Registry::add_tracer(std::unique_ptr<Tracer> tracer) noexcept
{
    // Find the first empty unique_ptr and assign the new tracer to it.
    auto* end = &m_first_tracer;
    while (*end)
        end = &(*end)->m_next_tracer;
    *end = std::move(tracer);
}

std::optional<int64_t> Registry::required_gas(
    const evmc::address& addr, bytes_view input) const noexcept
{
    if (!is_precompile(addr))
        return std::nullopt;
    return traits[addr.bytes[19]].analyze(input, m_gas_schedule).gas_cost;
}

std::optional<PrecompileOutput> Registry::run(
    const evmc::address& addr, bytes_view input, GasMeter& gas_meter) const
{
    if (!is_precompile(addr))
        return std::nullopt;

    const auto id = static_cast<PrecompileId>(addr.bytes[19]);
    const auto [name, analyze, execute] = traits[addr.bytes[19]];

    const auto [gas_cost, max_output_size] = analyze(input, m_gas_schedule);
    if (m_first_tracer)
        m_first_tracer->notify_precompile_start(id, input, gas_cost);

    // GasCostMax is never paid, even by the meter having exactly that much gas.
    if (gas_cost == GasCostMax || !gas_meter.use_gas(gas_cost))
    {
        if (m_first_tracer)
            m_first_tracer->notify_precompile_end(id, OUT_OF_GAS, {});
        return PrecompileOutput{make_error_code(OUT_OF_GAS), {}};
    }

    evmc::bytes output(max_output_size, 0);
    const auto [error, output_size] =
        execute(input.data(), input.size(), output.data(), output.size());
    output.resize(error == SUCCESS ? output_size : 0);

    if (m_first_tracer)
        m_first_tracer->notify_precompile_end(id, error, output);

    if (error != SUCCESS)
        return PrecompileOutput{make_error_code(error), {}};
    return PrecompileOutput{{}, std::move(output)};
}

evmc::Result Registry::call(const evmc_message& msg) const noexcept
{
    assert(msg.gas >= 0);

    if (!is_precompile(msg.code_address))
        return evmc::Result{EVMC_REJECTED};

    const auto id = static_cast<PrecompileId>(msg.code_address.bytes[19]);
    const auto [name, analyze, execute] = traits[msg.code_address.bytes[19]];

    const bytes_view input{msg.input_data, msg.input_size};
    const auto [gas_cost, max_output_size] = analyze(input, m_gas_schedule);
    if (m_first_tracer)
        m_first_tracer->notify_precompile_start(id, input, gas_cost);

    const auto gas_left = msg.gas - gas_cost;
    if (gas_cost == GasCostMax || gas_left < 0)
    {
        if (m_first_tracer)
            m_first_tracer->notify_precompile_end(id, OUT_OF_GAS, {});
        return evmc::Result{EVMC_OUT_OF_GAS};
    }

    // Allocate buffer for the precompile's output and pass its ownership to evmc::Result.
    const auto output_data = new (std::nothrow) uint8_t[max_output_size];
    if (output_data == nullptr) [[unlikely]]
        return evmc::Result{EVMC_OUT_OF_MEMORY};

    const auto [error, output_size] =
        execute(msg.input_data, msg.input_size, output_data, max_output_size);
    if (m_first_tracer)
        m_first_tracer->notify_precompile_end(id, error, {output_data, output_size});

    const auto status_code = to_status_code(error);
    const evmc_result result{status_code, status_code == EVMC_SUCCESS ? gas_left : 0, 0,
        output_data, status_code == EVMC_SUCCESS ? output_size : 0,
        [](const evmc_result* res) noexcept { delete[] res->output_data; }};
    return evmc::Result{result};
}
}  // namespace hvmone
