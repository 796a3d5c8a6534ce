#include "securebox/crypto/KeyDerivation.hpp"
#include "securebox/crypto/providers/OpenSslProviderFactory.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>

namespace securebox::crypto::providers
{
namespace
{

constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };
constexpr char g_kPbkdf2Digest[]{ "SHA256" };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

// Argon2id landed in OpenSSL 3.2; older runtimes report it as unsupported.
EvpKdfPtr fetchKdf(const char* name)
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, name, nullptr), &EVP_KDF_free };
}

EvpMacPtr fetchBlake2bMac()
{
    // OpenSSL MAC algorithm names are string-based. Try common variants.
    constexpr std::array<const char*, 2> kNames{ "BLAKE2BMAC", "BLAKE2B-MAC" };
    for (const char* name : kNames)
    {
        if (EVP_MAC * mac{ EVP_MAC_fetch(nullptr, name, nullptr) }; mac != nullptr)
        {
            return EvpMacPtr{ mac, &EVP_MAC_free };
        }
    }
    return EvpMacPtr{ nullptr, &EVP_MAC_free };
}

class OpenSslCryptoProvider final : public securebox::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider()
        : m_argon2idKdf{ fetchKdf("ARGON2ID") }, m_pbkdf2Kdf{ fetchKdf("PBKDF2") }, m_blake2bMac{ fetchBlake2bMac() }
    {
    }

    [[nodiscard]] bool supportsKdf(securebox::crypto::KdfAlgorithm algorithm) const noexcept override
    {
        switch (algorithm)
        {
        case securebox::crypto::KdfAlgorithm::Argon2id:
            return static_cast<bool>(m_argon2idKdf);
        case securebox::crypto::KdfAlgorithm::Pbkdf2HmacSha256:
            return static_cast<bool>(m_pbkdf2Kdf);
        }
        return false;
    }

    [[nodiscard]] securebox::security::SecureBuffer
    deriveMasterKey(std::span<const std::byte> password, const securebox::crypto::KdfMetadata& meta) const override
    {
        if (password.empty())
        {
            throw std::invalid_argument("deriveMasterKey: empty password");
        }
        securebox::crypto::requirePolicySupported(meta);

        // OSSL_PARAM takes non-const pointers even for read-only inputs, so work on local copies.
        securebox::security::SecureBuffer passwordCopy{ securebox::security::secureBufferFrom(password) };
        auto saltCopy{ meta.salt };

        securebox::security::SecureBuffer out{};
        out.resize(meta.derivedKeyBytes);

        if (meta.algorithm == securebox::crypto::KdfAlgorithm::Pbkdf2HmacSha256)
        {
            securebox::crypto::requirePbkdf2ParamsSafe(meta.pbkdf2);
            if (!m_pbkdf2Kdf)
            {
                throw std::runtime_error("deriveMasterKey: OpenSSL PBKDF2 KDF not available");
            }

            std::uint64_t iter{ meta.pbkdf2.iterations };
            std::array<char, sizeof(g_kPbkdf2Digest)> digest{};
            std::memcpy(digest.data(), g_kPbkdf2Digest, sizeof(g_kPbkdf2Digest));

            OSSL_PARAM params[]{
                OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
                OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
                OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iter),
                OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest.data(), 0),
                OSSL_PARAM_construct_end(),
            };
            derive(m_pbkdf2Kdf.get(), params, out);
            return out;
        }

        securebox::crypto::requireArgon2idParamsSafe(meta.argon2id);
        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveMasterKey: OpenSSL Argon2id KDF not available");
        }

        std::uint32_t iter{ meta.argon2id.iterations };
        std::uint32_t memcostKiB{ meta.argon2id.memoryKiB };
        std::uint32_t lanes{ meta.argon2id.parallelism };
        std::uint32_t threads{ meta.argon2id.parallelism };
        std::uint32_t version{ meta.argon2Version };

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };
        derive(m_argon2idKdf.get(), params, out);
        return out;
    }

    [[nodiscard]] securebox::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> masterKey,
                                                                 std::span<const std::byte> context,
                                                                 std::size_t outBytes) const override
    {
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
        blake2bKeyed(masterKey, context, std::span<std::uint8_t>{ out });
        return out;
    }

    [[nodiscard]] securebox::crypto::Mac mac(std::span<const std::uint8_t> key,
                                             std::span<const std::byte> message) const override
    {
        securebox::crypto::Mac out{};
        blake2bKeyed(key, message, std::span<std::uint8_t>{ out });
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
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        securebox::crypto::AeadBox box{};
        box.nonce = nonce;

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: add aad failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
        auto* ctPtr{ box.cipherText.empty() ? nullptr : box.cipherText.data() };
        if (EVP_EncryptUpdate(ctx.get(), ctPtr, &outLen, ptPtr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        int finalLen{ 0 };
        auto* ctFinalPtr{ box.cipherText.empty() ? nullptr : (box.cipherText.data() + outLen) };
        if (EVP_EncryptFinal_ex(ctx.get(), ctFinalPtr, &finalLen) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (finalLen < 0 || totalBytes != plainText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }

        return box;
    }

    [[nodiscard]] std::optional<securebox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const securebox::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, securebox::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadDecrypt: add aad failed");
        }

        securebox::crypto::AeadTag tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        securebox::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        int outLen{ 0 };
        const auto* ctPtr{ box.cipherText.empty() ? nullptr : box.cipherText.data() };
        auto* ptPtr{ plainText.empty() ? nullptr : plainText.data() };
        if (EVP_DecryptUpdate(ctx.get(), ptPtr, &outLen, ctPtr, static_cast<int>(box.cipherText.size())) != 1 ||
            outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            securebox::security::secureRelease(plainText);
            return std::nullopt;
        }

        // The tag is checked here; on mismatch the decrypted bytes are wiped before returning.
        int finalLen{ 0 };
        auto* ptFinalPtr{ plainText.empty() ? nullptr : (plainText.data() + outLen) };
        if (EVP_DecryptFinal_ex(ctx.get(), ptFinalPtr, &finalLen) != 1 || finalLen < 0 ||
            static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != plainText.size())
        {
            securebox::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }

private:
    static void derive(EVP_KDF* kdf, const OSSL_PARAM* params, securebox::security::SecureBuffer& out)
    {
        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(kdf), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveMasterKey: EVP_KDF_CTX_new failed");
        }
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            securebox::security::secureRelease(out);
            throw std::runtime_error("deriveMasterKey: EVP_KDF_derive failed");
        }
    }

    void blake2bKeyed(std::span<const std::uint8_t> key, std::span<const std::byte> message,
                      std::span<std::uint8_t> out) const
    {
        constexpr std::size_t kMaxKeyBytes{ 64U };
        if (key.empty() || key.size() > kMaxKeyBytes)
        {
            throw std::invalid_argument("blake2b: invalid key size");
        }
        if (!m_blake2bMac)
        {
            throw std::runtime_error("blake2b: OpenSSL BLAKE2BMAC not available");
        }

        EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(m_blake2bMac.get()), &EVP_MAC_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("blake2b: EVP_MAC_CTX_new failed");
        }

        std::size_t outSize{ out.size() };
        OSSL_PARAM params[]{
            OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &outSize),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != 1)
        {
            throw std::runtime_error("blake2b: EVP_MAC_init failed");
        }

        const auto* msg{ reinterpret_cast<const unsigned char*>(message.data()) };
        if (!message.empty() && EVP_MAC_update(ctx.get(), msg, message.size()) != 1)
        {
            throw std::runtime_error("blake2b: EVP_MAC_update failed");
        }

        std::size_t written{ out.size() };
        if (EVP_MAC_final(ctx.get(), out.data(), &written, out.size()) != 1 || written != out.size())
        {
            throw std::runtime_error("blake2b: EVP_MAC_final failed");
        }
    }

    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
    EvpKdfPtr m_pbkdf2Kdf{ nullptr, &EVP_KDF_free };
    EvpMacPtr m_blake2bMac{ nullptr, &EVP_MAC_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<securebox::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace securebox::crypto::providers
