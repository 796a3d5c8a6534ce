#include "securebox/crypto/KeyDerivation.hpp"
#include "securebox/crypto/providers/NativeProviderFactory.hpp"
#include "securebox/security/ScopeWipe.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>

namespace securebox::crypto::providers
{
namespace
{

constexpr std::size_t g_kBlake2bMaxKeyBytes{ 64U };

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireBlake2bKey(std::span<const std::uint8_t> key, const char* what)
{
    if (key.empty() || key.size() > g_kBlake2bMaxKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

// Monocypher has no PBKDF2; vaults using it need the OpenSSL provider.
class NativeCryptoProvider final : public securebox::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool supportsKdf(securebox::crypto::KdfAlgorithm algorithm) const noexcept override
    {
        return algorithm == securebox::crypto::KdfAlgorithm::Argon2id;
    }

    [[nodiscard]] securebox::security::SecureBuffer
    deriveMasterKey(std::span<const std::byte> password, const securebox::crypto::KdfMetadata& meta) const override
    {
        securebox::crypto::requirePolicySupported(meta);
        if (meta.algorithm != securebox::crypto::KdfAlgorithm::Argon2id)
        {
            throw std::invalid_argument("deriveMasterKey: algorithm not supported by native provider");
        }

        const auto saltBytes = std::as_bytes(std::span<const std::uint8_t>{ meta.salt });
        return securebox::crypto::deriveMasterKeyArgon2id(password, saltBytes, meta.argon2id);
    }

    [[nodiscard]] securebox::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> masterKey,
                                                                 std::span<const std::byte> context,
                                                                 std::size_t outBytes) const override
    {
        requireBlake2bKey(masterKey, "deriveSubkey: invalid masterKey");
        if (context.empty())
        {
            throw std::invalid_argument("deriveSubkey: empty context");
        }
        if (outBytes == 0U || outBytes > securebox::crypto::g_maxSubkeyBytes)
        {
            throw std::invalid_argument("deriveSubkey: invalid outBytes");
        }

        securebox::security::SecureBuffer out{};
        out.resize(outBytes);
        crypto_blake2b_keyed(out.data(), out.size(), masterKey.data(), masterKey.size(), asU8(context).data(),
                             context.size());
        return out;
    }

    [[nodiscard]] securebox::crypto::Mac mac(std::span<const std::uint8_t> key,
                                             std::span<const std::byte> message) const override
    {
        requireBlake2bKey(key, "mac: invalid key");

        securebox::crypto::Mac out{};
        crypto_blake2b_keyed(out.data(), out.size(), key.data(), key.size(), asU8(message).data(), message.size());
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return securebox::security::secureRandomFill(out);
    }

    [[nodiscard]] securebox::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                         const securebox::crypto::AeadNonce& nonce,
                                                         std::span<const std::byte> plainText,
                                                         std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, securebox::crypto::g_aeadKeyBytes, "aeadEncrypt: key");

        securebox::crypto::AeadBox box{};
        box.nonce = nonce;
        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = securebox::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8(associatedData).data(),
                          associatedData.size(), asU8(plainText).data(), plainText.size());

        return box;
    }

    [[nodiscard]] std::optional<securebox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const securebox::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, securebox::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        if (box.cipherText.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("aeadDecrypt: cipherText too large");
        }

        securebox::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        // crypto_aead_read checks the tag before writing any plaintext.
        crypto_aead_ctx ctx{};
        auto wipeCtx = securebox::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        const int rc = crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8(associatedData).data(),
                                        associatedData.size(), box.cipherText.data(), box.cipherText.size());
        if (rc != 0)
        {
            securebox::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<securebox::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace securebox::crypto::providers
