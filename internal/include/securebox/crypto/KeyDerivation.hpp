#ifndef INTERNAL_INCLUDE_SECUREBOX_CRYPTO_KEYDERIVATION_HPP
#define INTERNAL_INCLUDE_SECUREBOX_CRYPTO_KEYDERIVATION_HPP

#include "securebox/crypto/KdfMetadata.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include <span>
#include <stdexcept>

namespace securebox::crypto
{

// Shared metadata checks for every provider. All of them throw std::invalid_argument.

inline void requirePolicySupported(const KdfMetadata& meta)
{
    if (meta.policyVersion != g_kKdfPolicyVersion)
    {
        throw std::invalid_argument("deriveMasterKey: unsupported policyVersion");
    }
    if (meta.derivedKeyBytes != g_kMasterKeyBytes)
    {
        throw std::invalid_argument("deriveMasterKey: unsupported derivedKeyBytes");
    }
    if (meta.algorithm == KdfAlgorithm::Argon2id && meta.argon2Version != g_kArgon2VersionV13)
    {
        throw std::invalid_argument("deriveMasterKey: unsupported Argon2 version");
    }
    if (meta.algorithm != KdfAlgorithm::Argon2id && meta.algorithm != KdfAlgorithm::Pbkdf2HmacSha256)
    {
        throw std::invalid_argument("deriveMasterKey: unsupported algorithm");
    }
}

inline void requireArgon2idParamsSafe(const Argon2idParams& params)
{
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveMasterKey: invalid Argon2id parameters");
    }
    if (params.parallelism > g_kArgon2MaxParallelism || params.memoryKiB > g_kArgon2MaxMemoryKiB ||
        params.iterations > g_kArgon2MaxIterations)
    {
        throw std::invalid_argument("deriveMasterKey: unsafe Argon2id parameters");
    }
    if (const std::uint32_t minMemoryKiB{ params.parallelism * 8U }; params.memoryKiB < minMemoryKiB)
    {
        throw std::invalid_argument("deriveMasterKey: invalid Argon2id parameters");
    }
}

inline void requirePbkdf2ParamsSafe(const Pbkdf2Params& params)
{
    if (params.iterations < g_kPbkdf2MinIterations || params.iterations > g_kPbkdf2MaxIterations)
    {
        throw std::invalid_argument("deriveMasterKey: unsafe PBKDF2 parameters");
    }
}

// Monocypher backend.
[[nodiscard]] securebox::security::SecureBuffer
deriveMasterKeyArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt, Argon2idParams params);

} // namespace securebox::crypto

#endif // INTERNAL_INCLUDE_SECUREBOX_CRYPTO_KEYDERIVATION_HPP
