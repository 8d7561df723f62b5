/**
 * fetchvault - Digest and identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace fetchvault::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_text(std::string_view text);

    // Random identifier of the form "<prefix>-<32 hex digits>".
    std::string random_id(std::string_view prefix);

} // namespace fetchvault::crypto
