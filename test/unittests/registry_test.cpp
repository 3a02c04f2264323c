// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <hvmone/precompiles.hpp>
#include <test/utils/utils.hpp>

using namespace hvmone;
using namespace hvmone::test;
using namespace evmc::literals;

namespace
{
constexpr auto ECRECOVER = precompile_address(PrecompileId::ecrecover);
constexpr auto SHA256 = precompile_address(PrecompileId::sha256);
constexpr auto RIPEMD160 = precompile_address(PrecompileId::ripemd160);
constexpr auto IDENTITY = precompile_address(PrecompileId::identity);
constexpr auto EXPMOD = precompile_address(PrecompileId::expmod);
constexpr auto ECADD = precompile_address(PrecompileId::ecadd);
constexpr auto ECPAIRING = precompile_address(PrecompileId::ecpairing);
constexpr auto ZSCVERIFY = precompile_address(PrecompileId::zscverify);

/// The gas meter recording all charges.
class RecordingGasMeter : public GasMeter
{
public:
    int64_t gas_left;
    std::vector<int64_t> charges;

    explicit RecordingGasMeter(int64_t limit) noexcept : gas_left{limit} {}

    [[nodiscard]] bool use_gas(int64_t amount) noexcept override
    {
        charges.push_back(amount);
        if (amount > gas_left)
            return false;
        gas_left -= amount;
        return true;
    }
};

evmc_message make_message(const evmc::address& addr, const bytes& input, int64_t gas) noexcept
{
    evmc_message msg{};
    msg.kind = EVMC_CALL;
    msg.gas = gas;
    msg.code_address = addr;
    msg.recipient = addr;
    msg.input_data = input.data();
    msg.input_size = input.size();
    return msg;
}
}  // namespace

TEST(registry, addresses)
{
    EXPECT_EQ(ECRECOVER, 0x0000000000000000000000000000000000000001_address);
    EXPECT_EQ(ZSCVERIFY, 0x0000000000000000000000000000000000000009_address);

    EXPECT_FALSE(is_precompile({}));
    for (uint8_t i = 1; i <= 9; ++i)
        EXPECT_TRUE(is_precompile(evmc::address{i})) << int{i};
    EXPECT_FALSE(is_precompile(0x000000000000000000000000000000000000000a_address));
    EXPECT_FALSE(is_precompile(0x0100000000000000000000000000000000000001_address));
    EXPECT_FALSE(is_precompile(0x0000000000000000000000000000000000000101_address));
}

TEST(registry, names)
{
    EXPECT_EQ(precompile_name(PrecompileId::ecrecover), "ecrecover");
    EXPECT_EQ(precompile_name(PrecompileId::expmod), "expmod");
    EXPECT_EQ(precompile_name(PrecompileId::zscverify), "zscverify");
    EXPECT_EQ(precompile_name(PrecompileId{0}), "unknown");
    EXPECT_EQ(precompile_name(PrecompileId{10}), "unknown");

    for (uint8_t i = 1; i < NumPrecompiles; ++i)
    {
        const auto id = static_cast<PrecompileId>(i);
        EXPECT_EQ(find_precompile(precompile_name(id)), id);
    }
    EXPECT_EQ(find_precompile("unknown"), std::nullopt);
    EXPECT_EQ(find_precompile(""), std::nullopt);
    EXPECT_EQ(find_precompile("SHA256"), std::nullopt);
}

TEST(registry, unknown_address)
{
    const Registry registry;
    GasCounter gas{1'000'000};

    const auto addr = 0x000000000000000000000000000000000000000a_address;
    EXPECT_FALSE(registry.contains(addr));
    EXPECT_EQ(registry.required_gas(addr, {}), std::nullopt);
    EXPECT_FALSE(registry.run(addr, {}, gas).has_value());
    EXPECT_EQ(gas.gas_left(), 1'000'000);
}

TEST(registry, required_gas)
{
    const Registry byzantium;
    const Registry istanbul{GasSchedule::istanbul()};

    EXPECT_EQ(byzantium.required_gas(ECRECOVER, {}), 3000);
    EXPECT_EQ(byzantium.required_gas(IDENTITY, bytes(33, 0)), 21);
    EXPECT_EQ(byzantium.required_gas(ECADD, {}), 500);
    EXPECT_EQ(istanbul.required_gas(ECADD, {}), 150);
    EXPECT_EQ(istanbul.required_gas(ECPAIRING, bytes(192, 0)), 79000);
    EXPECT_EQ(byzantium.required_gas(ZSCVERIFY, {}), 500000);

    // The cost does not depend on the validity of the input.
    EXPECT_EQ(byzantium.required_gas(ECPAIRING, bytes(191, 0)), 100000);
}

TEST(registry, required_gas_is_pure)
{
    const Registry registry;
    const auto input = word(1) + word(32) + word(32) + "03"_hex + bytes(64, 0xff);
    const auto gas1 = registry.required_gas(EXPMOD, input);
    const auto gas2 = registry.required_gas(EXPMOD, input);
    ASSERT_TRUE(gas1.has_value());
    EXPECT_EQ(gas1, gas2);
    EXPECT_EQ(*gas1, 13056);
}

TEST(registry, required_gas_is_monotonic)
{
    const Registry registry;
    for (const auto& addr : {SHA256, RIPEMD160, IDENTITY, ECPAIRING})
    {
        int64_t prev = 0;
        for (size_t size = 0; size <= 4 * 192; size += 16)
        {
            const auto gas = registry.required_gas(addr, bytes(size, 0x01));
            ASSERT_TRUE(gas.has_value());
            EXPECT_GE(*gas, prev) << int{addr.bytes[19]} << " " << size;
            prev = *gas;
        }
    }
}

TEST(registry, expmod_required_gas_is_monotonic)
{
    // The header stays fixed, the base, exponent and modulus bytes are filled in one by one.
    // The exponent head grows with every byte in its first 32 bytes.
    const Registry registry;
    const auto header = word(1) + word(64) + word(64);
    const auto first = *registry.required_gas(EXPMOD, header);

    int64_t prev = first;
    for (size_t body_size = 1; body_size <= 1 + 64 + 64; ++body_size)
    {
        const auto gas = registry.required_gas(EXPMOD, header + bytes(body_size, 0xff));
        ASSERT_TRUE(gas.has_value());
        EXPECT_GE(*gas, prev) << body_size;
        prev = *gas;
    }
    EXPECT_GT(prev, first);
}

TEST(registry, run_identity)
{
    const Registry registry;
    GasCounter gas{100};

    const auto input = "cafe0001"_hex;
    const auto result = registry.run(IDENTITY, input, gas);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->error);
    EXPECT_EQ(result->output, input);
    EXPECT_EQ(gas.gas_left(), 100 - 18);
}

TEST(registry, run_out_of_gas)
{
    const Registry registry;
    const auto input = word(1) + word(32) + word(32) + "03"_hex + bytes(64, 0xff);

    RecordingGasMeter gas{13055};
    const auto result = registry.run(EXPMOD, input, gas);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->error, make_error_code(OUT_OF_GAS));
    EXPECT_TRUE(result->output.empty());
    EXPECT_EQ(gas.gas_left, 13055);
    EXPECT_EQ(gas.charges, std::vector<int64_t>{13056});

    RecordingGasMeter exact_gas{13056};
    const auto exact = registry.run(EXPMOD, input, exact_gas);
    ASSERT_TRUE(exact.has_value());
    EXPECT_FALSE(exact->error);
    EXPECT_EQ(exact->output.size(), 32);
    EXPECT_EQ(exact_gas.gas_left, 0);
}

TEST(registry, run_max_gas_cost_is_never_paid)
{
    const Registry registry;
    const auto input = word(1) + word(1) + word(intx::uint256{1} << 255);
    ASSERT_EQ(registry.required_gas(EXPMOD, input), GasCostMax);

    RecordingGasMeter gas{GasCostMax};
    const auto result = registry.run(EXPMOD, input, gas);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->error, make_error_code(OUT_OF_GAS));
    EXPECT_EQ(gas.gas_left, GasCostMax);
    EXPECT_TRUE(gas.charges.empty());
}

TEST(registry, run_error)
{
    const Registry registry;
    GasCounter gas{1'000'000};

    const auto result = registry.run(ECADD, word(1) + word(3), gas);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->error, make_error_code(NOT_ON_CURVE));
    EXPECT_EQ(result->error.message(), "point not on elliptic curve");
    EXPECT_EQ(result->error.category().name(), std::string_view{"hvmone"});
    EXPECT_TRUE(result->output.empty());

    // The gas is consumed.
    EXPECT_EQ(gas.gas_left(), 1'000'000 - 500);

    const auto pairing = registry.run(ECPAIRING, bytes(100, 0), gas);
    ASSERT_TRUE(pairing.has_value());
    EXPECT_EQ(pairing->error, make_error_code(INVALID_INPUT_ENCODING));
}

TEST(registry, run_recoverable_no_result)
{
    const Registry registry;
    GasCounter gas{3000};

    // Invalid signature: no output and no error.
    const auto result = registry.run(ECRECOVER, bytes(128, 0), gas);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->error);
    EXPECT_TRUE(result->output.empty());
    EXPECT_EQ(gas.gas_left(), 0);
}

TEST(registry, call)
{
    const Registry registry;

    const auto input = "0102"_hex;
    const auto result = registry.call(make_message(IDENTITY, input, 1000));
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(result.gas_left, 1000 - 18);
    EXPECT_EQ((bytes{result.output_data, result.output_size}), input);
}

TEST(registry, call_out_of_gas)
{
    const Registry registry;
    const auto result = registry.call(make_message(ECADD, {}, 499));
    EXPECT_EQ(result.status_code, EVMC_OUT_OF_GAS);
    EXPECT_EQ(result.gas_left, 0);
    EXPECT_EQ(result.output_size, 0);
}

TEST(registry, call_failure)
{
    const Registry registry;
    const auto input = word(1) + word(3);
    const auto result = registry.call(make_message(ECADD, input, 1000));
    EXPECT_EQ(result.status_code, EVMC_PRECOMPILE_FAILURE);
    EXPECT_EQ(result.gas_left, 0);
    EXPECT_EQ(result.output_size, 0);
}

TEST(registry, call_not_precompile)
{
    const Registry registry;
    const auto result =
        registry.call(make_message(0x000000000000000000000000000000000000000a_address, {}, 1000));
    EXPECT_EQ(result.status_code, EVMC_REJECTED);
}

TEST(registry, call_zscverify_short_input)
{
    const Registry registry;
    const auto input = "01"_hex;
    const auto result = registry.call(make_message(ZSCVERIFY, input, 500000));
    EXPECT_EQ(result.status_code, EVMC_SUCCESS);
    EXPECT_EQ(result.gas_left, 0);
    EXPECT_EQ((bytes{result.output_data, result.output_size}), true32);
}

TEST(registry, error_status_codes)
{
    static_assert(to_status_code(SUCCESS) == EVMC_SUCCESS);
    static_assert(to_status_code(OUT_OF_GAS) == EVMC_OUT_OF_GAS);
    static_assert(to_status_code(INVALID_INPUT_ENCODING) == EVMC_PRECOMPILE_FAILURE);
    static_assert(to_status_code(NOT_ON_CURVE) == EVMC_PRECOMPILE_FAILURE);
    static_assert(to_status_code(INVALID_CURVE_POINT) == EVMC_PRECOMPILE_FAILURE);
    static_assert(to_status_code(UNKNOWN_ERROR) == EVMC_PRECOMPILE_FAILURE);

    EXPECT_FALSE(make_error_code(SUCCESS));
    EXPECT_TRUE(make_error_code(UNKNOWN_ERROR));
    EXPECT_EQ(make_error_code(OUT_OF_GAS).message(), "out of gas");
}
