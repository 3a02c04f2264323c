// hvmone: HVM precompiled contracts
// Copyright 2025 The hvmone Authors.
// SPDX-License-Identifier: Apache-2.0

#include "ripemd160.hpp"
#include "sha256.hpp"
#include <openssl/evp.h>

namespace hvmone::crypto
{
namespace
{
/// One-shot digest through the OpenSSL EVP interface.
bool evp_digest(const EVP_MD* md, std::byte* hash, std::size_t hash_size, const std::byte* data,
    std::size_t size) noexcept
{
    if (md == nullptr || static_cast<std::size_t>(EVP_MD_get_size(md)) != hash_size)
        return false;

    unsigned int out_size = 0;
    return EVP_Digest(data, size, reinterpret_cast<unsigned char*>(hash), &out_size, md,
               nullptr) == 1 &&
           out_size == hash_size;
}
}  // namespace

bool sha256(std::byte hash[SHA256_HASH_SIZE], const std::byte* data, std::size_t size) noexcept
{
    return evp_digest(EVP_sha256(), hash, SHA256_HASH_SIZE, data, size);
}

bool ripemd160(
    std::byte hash[RIPEMD160_HASH_SIZE], const std::byte* data, std::size_t size) noexcept
{
    return evp_digest(EVP_ripemd160(), hash, RIPEMD160_HASH_SIZE, data, size);
}
}  // namespace hvmone::crypto
