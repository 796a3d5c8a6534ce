#include "securebox/core/KdfPolicy.hpp"
#include "securebox/security/SecureRandom.hpp"
#include <span>

namespace securebox::core
{

[[nodiscard]] securebox::crypto::Argon2idParams defaultArgon2idParams() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 3U };
    constexpr std::uint32_t kDefaultMemoryMiB{ 64U };
    constexpr std::uint32_t kKiBPerMiB{ 1024U };
    constexpr std::uint32_t kDefaultParallelism{ 1U };

    return securebox::crypto::Argon2idParams{
        .iterations = kDefaultIterations,
        .memoryKiB = kDefaultMemoryMiB * kKiBPerMiB,
        .parallelism = kDefaultParallelism,
    };
}

[[nodiscard]] securebox::crypto::Pbkdf2Params defaultPbkdf2Params() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 600'000U };
    return securebox::crypto::Pbkdf2Params{ .iterations = kDefaultIterations };
}

[[nodiscard]] KdfParams defaultKdfParams() noexcept
{
    return KdfParams{
        .algorithm = securebox::crypto::KdfAlgorithm::Argon2id,
        .argon2id = defaultArgon2idParams(),
        .pbkdf2 = defaultPbkdf2Params(),
    };
}

[[nodiscard]] KdfParams kdfParamsOf(const securebox::crypto::KdfMetadata& meta) noexcept
{
    return KdfParams{
        .algorithm = meta.algorithm,
        .argon2id = meta.argon2id,
        .pbkdf2 = meta.pbkdf2,
    };
}

[[nodiscard]] std::optional<securebox::crypto::KdfMetadata> makeKdfMetadata(const KdfParams& params) noexcept
{
    securebox::crypto::KdfMetadata meta{};
    meta.algorithm = params.algorithm;
    meta.argon2id = params.argon2id;
    meta.pbkdf2 = params.pbkdf2;

    if (!securebox::security::secureRandomFill(std::span<std::uint8_t>{ meta.salt }))
    {
        return std::nullopt;
    }

    return meta;
}

} // namespace securebox::core
