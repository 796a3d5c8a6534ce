#ifndef INCLUDE_SECUREBOX_CORE_KEYMATERIAL_HPP
#define INCLUDE_SECUREBOX_CORE_KEYMATERIAL_HPP

#include "securebox/core/KdfPolicy.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/crypto/KdfMetadata.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/SecureString.hpp"
#include <cstddef>
#include <span>
#include <variant>

namespace securebox::core
{

using KeyIv = securebox::crypto::AeadNonce;

// Salt + iv + the sub-keys derived from the master password. Session-scoped and move-only.
// The slow-KDF output itself is wiped as soon as the sub-keys exist.
class KeyMaterial final
{
public:
    KeyMaterial() = default;
    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;

    KeyMaterial(KeyMaterial&& other) noexcept : m_kdf(other.m_kdf), m_iv(other.m_iv)
    {
        m_containerKey.swap(other.m_containerKey);
        m_keyCheckKey.swap(other.m_keyCheckKey);
        m_sealKey.swap(other.m_sealKey);
        other.m_kdf = {};
        other.m_iv = {};
    }

    KeyMaterial& operator=(KeyMaterial&& other) noexcept
    {
        if (this == &other)
        {
            return *this;
        }

        release();
        m_kdf = other.m_kdf;
        m_iv = other.m_iv;
        m_containerKey.swap(other.m_containerKey);
        m_keyCheckKey.swap(other.m_keyCheckKey);
        m_sealKey.swap(other.m_sealKey);
        other.m_kdf = {};
        other.m_iv = {};
        return *this;
    }

    ~KeyMaterial() noexcept
    {
        release();
    }

    // Fresh random salt and iv, then derive.
    [[nodiscard]] static VaultResult<KeyMaterial> generate(securebox::crypto::ICryptoProvider& crypto,
                                                           const securebox::security::SecureString& password,
                                                           const KdfParams& params) noexcept;

    // Deterministic for fixed (password, metadata, iv).
    [[nodiscard]] static VaultResult<KeyMaterial> derive(const securebox::crypto::ICryptoProvider& crypto,
                                                         const securebox::security::SecureString& password,
                                                         const securebox::crypto::KdfMetadata& kdf,
                                                         const KeyIv& iv) noexcept;

    [[nodiscard]] const securebox::crypto::KdfMetadata& kdf() const noexcept
    {
        return m_kdf;
    }

    [[nodiscard]] const securebox::crypto::KdfSalt& salt() const noexcept
    {
        return m_kdf.salt;
    }

    [[nodiscard]] const KeyIv& iv() const noexcept
    {
        return m_iv;
    }

    [[nodiscard]] std::span<const std::uint8_t> containerKey() const noexcept
    {
        return securebox::security::asSpan(m_containerKey);
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_containerKey.empty();
    }

    // AEAD record of a constant marker (nonce = iv, AAD = encoded KDF metadata).
    [[nodiscard]] VaultResult<securebox::crypto::AeadBox>
    sealKeyCheck(securebox::crypto::ICryptoProvider& crypto) const noexcept;

    // AuthFailed when the record does not verify under this key.
    [[nodiscard]] VaultResult<std::monostate> verifyKeyCheck(securebox::crypto::ICryptoProvider& crypto,
                                                             const securebox::crypto::AeadBox& record) const noexcept;

    // Keyed BLAKE2b under the seal sub-key.
    [[nodiscard]] VaultResult<securebox::crypto::Mac> sealManifest(const securebox::crypto::ICryptoProvider& crypto,
                                                                   std::span<const std::byte> manifest) const noexcept;

    void release() noexcept
    {
        securebox::security::secureRelease(m_containerKey);
        securebox::security::secureRelease(m_keyCheckKey);
        securebox::security::secureRelease(m_sealKey);
    }

private:
    securebox::crypto::KdfMetadata m_kdf{};
    KeyIv m_iv{};
    securebox::security::SecureBuffer m_containerKey;
    securebox::security::SecureBuffer m_keyCheckKey;
    securebox::security::SecureBuffer m_sealKey;
};

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_KEYMATERIAL_HPP
