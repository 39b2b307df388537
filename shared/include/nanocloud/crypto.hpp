/**
 * NanoCloud - Hashing helpers built on libsodium (BLAKE2b generic hash).
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace nanocloud::crypto
{

    inline constexpr std::size_t kDefaultDigestSize = 32;

    // Hex-encoded BLAKE2b digest; digest_size must lie within libsodium's
    // crypto_generichash_BYTES_MIN..crypto_generichash_BYTES_MAX.
    std::string hash_bytes(std::span<const std::byte> data, std::size_t digest_size = kDefaultDigestSize);

} // namespace nanocloud::crypto
