// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "expmod.hpp"
#include <gmp.h>
#include <algorithm>
#include <cassert>

namespace hvmone::crypto
{
void expmod(std::span<const uint8_t> base, std::span<const uint8_t> exp,
    std::span<const uint8_t> mod, uint8_t* output) noexcept
{
    mpz_t b, e, m, r;  // NOLINT(*-isolate-declaration)
    mpz_inits(b, e, m, r, nullptr);
    mpz_import(b, base.size(), 1, 1, 0, 0, base.data());
    mpz_import(e, exp.size(), 1, 1, 0, 0, exp.data());
    mpz_import(m, mod.size(), 1, 1, 0, 0, mod.data());
    assert(mpz_sgn(m) != 0);

    mpz_powm(r, b, e, m);

    // The result is below the modulus so it fits in mod.size() bytes.
    size_t export_size = 0;
    mpz_export(output, &export_size, 1, 1, 0, 0, r);
    mpz_clears(b, e, m, r, nullptr);

    std::copy_backward(output, output + export_size, output + mod.size());
    std::fill_n(output, mod.size() - export_size, 0);
}
}  // namespace hvmone::crypto
