// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.h>
#include <cassert>
#include <string>
#include <system_error>

namespace hvmone
{
/// The precompile failure reasons. Negative outcomes which are not faults (failed signature
/// recovery, rejected proof) are reported as SUCCESS with the corresponding output.
enum ErrorCode : int
{
    SUCCESS = 0,
    OUT_OF_GAS,
    INVALID_INPUT_ENCODING,
    NOT_ON_CURVE,
    INVALID_CURVE_POINT,
    UNKNOWN_ERROR,
};

/// Obtains a reference to the static error category object for hvmone errors.
inline const std::error_category& hvmone_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "hvmone"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case OUT_OF_GAS:
                return "out of gas";
            case INVALID_INPUT_ENCODING:
                return "bad elliptic curve pairing size";
            case NOT_ON_CURVE:
                return "point not on elliptic curve";
            case INVALID_CURVE_POINT:
                return "invalid elliptic curve point";
            case UNKNOWN_ERROR:
                return "Unknown error";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of an hvmone error code value.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, hvmone_category()};
}

/// Maps the error code to the EVMC status code reported to the VM.
constexpr evmc_status_code to_status_code(ErrorCode errc) noexcept
{
    switch (errc)
    {
    case SUCCESS:
        return EVMC_SUCCESS;
    case OUT_OF_GAS:
        return EVMC_OUT_OF_GAS;
    default:
        return EVMC_PRECOMPILE_FAILURE;
    }
}
}  // namespace hvmone
