#include "securebox/crypto/KeyDerivation.hpp"

#include "securebox/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace securebox::crypto
{

[[nodiscard]] securebox::security::SecureBuffer deriveMasterKeyArgon2id(std::span<const std::byte> password,
                                                                       std::span<const std::byte> salt,
                                                                       Argon2idParams params)
{
    if (password.empty())
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: empty password");
    }
    if (salt.size() != g_kdfSaltBytes)
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: invalid salt size");
    }
    requireArgon2idParamsSafe(params);

    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveMasterKeyArgon2id: password too large");
    }

    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, securebox::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    securebox::security::SecureBuffer masterKey{};
    masterKey.resize(g_kMasterKeyBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = reinterpret_cast<const std::uint8_t*>(salt.data()),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(masterKey.data(), static_cast<std::uint32_t>(masterKey.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return masterKey;
}

} // namespace securebox::crypto
