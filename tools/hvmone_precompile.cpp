// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>
#include <evmc/hex.hpp>
#include <hvmone/gas_schedule.hpp>
#include <hvmone/precompiles.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace
{
constexpr auto PROGRAM_NAME = "hvmone-precompile";

/// The exit codes.
enum ExitCode : int
{
    EXIT_OK = 0,
    EXIT_PRECOMPILE_FAILURE = 1,
    EXIT_USAGE = 2,
    EXIT_UNKNOWN_ADDRESS = 3,
};

/// Resolves the precompile given by its name, its number (1..9) or its full hex address.
std::optional<evmc::address> resolve_address(const std::string& arg)
{
    if (const auto id = hvmone::find_precompile(arg); id.has_value())
        return hvmone::precompile_address(*id);

    if (arg.size() > 2 && arg[0] == '0' && (arg[1] == 'x' || arg[1] == 'X'))
        return evmc::from_hex<evmc::address>(arg);

    const auto is_digit = [](char c) noexcept { return c >= '0' && c <= '9'; };
    if (arg.empty() || !std::all_of(arg.begin(), arg.end(), is_digit))
        return std::nullopt;
    const auto n = std::stoull(arg);
    if (n > 0xff)
        return std::nullopt;
    return evmc::address{n};
}

std::string read_hex_file(const std::string& path)
{
    std::ifstream file{path};
    if (!file)
        throw std::runtime_error("cannot open input file " + path);

    // Whitespace and line breaks are allowed.
    std::string hex;
    for (std::string word; file >> word;)
        hex += word;
    return hex;
}
}  // namespace

int main(int argc, char* argv[])
{
    CLI::App app{"hvmone precompiled contract runner"};

    std::string address_arg;
    app.add_option("-a,--address", address_arg, "Precompile address (1..9, 0x-address or name)")
        ->required();

    std::string input_hex;
    std::string input_file;
    const auto input_opt = app.add_option("-i,--input", input_hex, "Input bytes in hex");
    app.add_option("--input-file", input_file, "File with the input bytes in hex")
        ->check(CLI::ExistingFile)
        ->excludes(input_opt);

    int64_t gas = 10'000'000;
    app.add_option("-g,--gas", gas, "Gas limit")->check(CLI::NonNegativeNumber);

    std::string schedule_file;
    const auto schedule_opt = app.add_option("--schedule", schedule_file, "Gas schedule JSON file")
                                  ->check(CLI::ExistingFile);

    std::string preset = "byzantium";
    app.add_option("--preset", preset, "Gas schedule preset")
        ->check(CLI::IsMember({"byzantium", "istanbul"}))
        ->excludes(schedule_opt);

    bool trace = false;
    app.add_flag("--trace", trace, "Print the JSON trace to stderr");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        const auto exit_code = app.exit(e);
        return exit_code == 0 ? EXIT_OK : EXIT_USAGE;
    }

    hvmone::GasSchedule schedule;
    evmc::bytes input;
    std::optional<evmc::address> address;
    try
    {
        schedule = schedule_file.empty() ? hvmone::gas_schedule_preset(preset) :
                                           hvmone::load_gas_schedule(schedule_file);

        if (!input_file.empty())
            input_hex = read_hex_file(input_file);
        auto decoded_input = evmc::from_hex(input_hex);
        if (!decoded_input)
            throw std::invalid_argument("invalid hex input");
        input = std::move(*decoded_input);

        address = resolve_address(address_arg);
    }
    catch (const std::exception& ex)
    {
        std::cerr << PROGRAM_NAME << ": " << ex.what() << "\n";
        return EXIT_USAGE;
    }

    hvmone::Registry registry{schedule};
    if (!address.has_value() || !registry.contains(*address))
    {
        std::cerr << PROGRAM_NAME << ": not a precompile: " << address_arg << "\n";
        return EXIT_UNKNOWN_ADDRESS;
    }

    if (trace)
        registry.add_tracer(hvmone::create_precompile_tracer(std::cerr));

    hvmone::GasCounter gas_counter{gas};
    const auto result = registry.run(*address, input, gas_counter);

    auto& out = std::cout;
    out << "Status:   " << (result->error ? result->error.message() : "success") << "\n";
    out << "Gas used: " << (gas - gas_counter.gas_left()) << "\n";
    out << "Output:   " << evmc::hex(result->output) << "\n";
    return result->error ? EXIT_PRECOMPILE_FAILURE : EXIT_OK;
}
