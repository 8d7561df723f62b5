#include "fetchvault/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace fetchvault::crypto
{

    namespace
    {

        template <std::size_t N>
        std::string hex_of(const std::array<unsigned char, N> &raw)
        {
            std::array<char, N * 2 + 1> hex{};
            sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
            return std::string(hex.data(), N * 2);
        }

    } // namespace

    void ensure_sodium_init()
    {
        static std::once_flag flag;
        std::call_once(flag, []
                       {
                           if (sodium_init() < 0)
                           {
                               throw std::runtime_error("libsodium initialization failed");
                           } });
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_sodium_init();
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return hex_of(digest);
    }

    std::string hash_text(std::string_view text)
    {
        return hash_bytes(std::as_bytes(std::span<const char>(text.data(), text.size())));
    }

    std::string random_id(std::string_view prefix)
    {
        ensure_sodium_init();
        std::array<unsigned char, 16> raw{};
        randombytes_buf(raw.data(), raw.size());
        std::string id(prefix);
        id.push_back('-');
        id += hex_of(raw);
        return id;
    }

} // namespace fetchvault::crypto
