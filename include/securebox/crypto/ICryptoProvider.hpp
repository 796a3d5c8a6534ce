#ifndef INCLUDE_SECUREBOX_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_SECUREBOX_CRYPTO_ICRYPTOPROVIDER_HPP

#include "securebox/crypto/KdfMetadata.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace securebox::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };
constexpr std::size_t g_macBytes{ 32 };
constexpr std::size_t g_maxSubkeyBytes{ 64 };

using AeadNonce = std::array<std::uint8_t, g_aeadNonceBytes>;
using AeadTag = std::array<std::uint8_t, g_aeadTagBytes>;
using Mac = std::array<std::uint8_t, g_macBytes>;

struct AeadBox final
{
    AeadNonce nonce{};
    AeadTag tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // False when the algorithm is not compiled in or not available at runtime.
    [[nodiscard]] virtual bool supportsKdf(KdfAlgorithm algorithm) const noexcept = 0;

    // Derives the master key from persisted vault metadata.
    // Contract violations (unsupported algorithm/version/params) throw std::invalid_argument.
    [[nodiscard]] virtual securebox::security::SecureBuffer deriveMasterKey(std::span<const std::byte> password,
                                                                            const KdfMetadata& meta) const = 0;

    // Keyed BLAKE2b over `context`; distinct contexts give independent subkeys.
    [[nodiscard]] virtual securebox::security::SecureBuffer
    deriveSubkey(std::span<const std::uint8_t> masterKey, std::span<const std::byte> context,
                 std::size_t outBytes) const = 0;

    // Keyed BLAKE2b, 32-byte output.
    [[nodiscard]] virtual Mac mac(std::span<const std::uint8_t> key, std::span<const std::byte> message) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: ChaCha20-Poly1305 (IETF, 12-byte nonce). The caller owns nonce uniqueness per key.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, const AeadNonce& nonce,
                                              std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure. No plaintext is released in that case.
    [[nodiscard]] virtual std::optional<securebox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace securebox::crypto

#endif // INCLUDE_SECUREBOX_CRYPTO_ICRYPTOPROVIDER_HPP
