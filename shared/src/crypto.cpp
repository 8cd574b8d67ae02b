#include "xferstat/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace xferstat::crypto
{

    namespace
    {

        void ensure_initialized()
        {
            static std::once_flag flag;
            std::call_once(flag, []
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

        std::string to_hex(std::span<const unsigned char> digest)
        {
            std::string hex(digest.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
            hex.pop_back();
            return hex;
        }

    } // namespace

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized();
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char *>(data.data()),
                               data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        ensure_initialized();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }

        std::array<char, 64 * 1024> buffer{};
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(input.gcount());
            if (count > 0 &&
                crypto_generichash_update(&state, reinterpret_cast<const unsigned char *>(buffer.data()), count) != 0)
            {
                throw std::runtime_error("crypto_generichash_update failed");
            }
        }

        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash_final(&state, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return to_hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

} // namespace xferstat::crypto
