#ifndef INCLUDE_SECUREBOX_CRYPTO_KDFMETADATA_HPP
#define INCLUDE_SECUREBOX_CRYPTO_KDFMETADATA_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace securebox::crypto
{

constexpr std::size_t g_kdfSaltBytes{ 16 };
constexpr std::size_t g_kMasterKeyBytes{ 32 };

constexpr std::uint32_t g_kKdfPolicyVersion{ 1 };

// Argon2 version v1.3 (0x13). Monocypher is hardcoded to this.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

enum class KdfAlgorithm : std::uint32_t
{
    Argon2id = 1U,
    Pbkdf2HmacSha256 = 2U,
};

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

struct Pbkdf2Params final
{
    std::uint32_t iterations;
};

using KdfSalt = std::array<std::uint8_t, g_kdfSaltBytes>;

// Everything needed to re-derive the master key except the password. Persisted in the clear.
struct KdfMetadata final
{
    std::uint32_t policyVersion{ g_kKdfPolicyVersion };
    KdfAlgorithm algorithm{ KdfAlgorithm::Argon2id };
    std::uint32_t argon2Version{ g_kArgon2VersionV13 };
    std::uint32_t derivedKeyBytes{ static_cast<std::uint32_t>(g_kMasterKeyBytes) };

    Argon2idParams argon2id{};
    Pbkdf2Params pbkdf2{};
    KdfSalt salt{};
};

// Safety caps shared by every provider. Parameters outside them are refused, not clamped.
constexpr std::uint32_t g_kArgon2MaxIterations{ 10U };
constexpr std::uint32_t g_kArgon2MaxMemoryKiB{ 1024U * 1024U };
constexpr std::uint32_t g_kArgon2MaxParallelism{ 16U };
constexpr std::uint32_t g_kPbkdf2MinIterations{ 1000U };
constexpr std::uint32_t g_kPbkdf2MaxIterations{ 10'000'000U };

} // namespace securebox::crypto

#endif // INCLUDE_SECUREBOX_CRYPTO_KDFMETADATA_HPP
