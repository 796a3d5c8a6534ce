#include "securebox/core/KeyMaterial.hpp"
#include "securebox/core/VaultCodec.hpp"
#include "securebox/security/ScopeWipe.hpp"
#include "securebox/security/SecureEquals.hpp"
#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace securebox::core
{
namespace
{

constexpr std::string_view g_kContainerKeyContext{ "securebox.container.aead_key.v1" };
constexpr std::string_view g_kKeyCheckKeyContext{ "securebox.vault.keycheck.v1" };
constexpr std::string_view g_kSealKeyContext{ "securebox.vault.seal_key.v1" };
constexpr std::string_view g_kKeyCheckMarker{ "SBOX-KEYCHECK-V1" };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] VaultResult<securebox::security::SecureBuffer>
deriveMasterKeyOrError(const securebox::crypto::ICryptoProvider& crypto,
                       const securebox::security::SecureString& password,
                       const securebox::crypto::KdfMetadata& kdf) noexcept
{
    try
    {
        return crypto.deriveMasterKey(securebox::security::asBytes(password), kdf);
    }
    catch (const std::invalid_argument&)
    {
        return VaultError::UnsupportedKdfMetadata;
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

[[nodiscard]] VaultResult<securebox::security::SecureBuffer>
deriveSubkeyOrError(const securebox::crypto::ICryptoProvider& crypto, std::span<const std::uint8_t> masterKey,
                    std::string_view context) noexcept
{
    try
    {
        return crypto.deriveSubkey(masterKey, asBytes(context), securebox::crypto::g_aeadKeyBytes);
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

} // namespace

[[nodiscard]] VaultResult<KeyMaterial> KeyMaterial::generate(securebox::crypto::ICryptoProvider& crypto,
                                                             const securebox::security::SecureString& password,
                                                             const KdfParams& params) noexcept
{
    if (password.empty())
    {
        return VaultError::EmptyPassword;
    }

    const auto metaOpt{ makeKdfMetadata(params) };
    if (!metaOpt)
    {
        return VaultError::RandomFailed;
    }

    KeyIv iv{};
    if (!crypto.randomBytes(std::span<std::uint8_t>{ iv }))
    {
        return VaultError::RandomFailed;
    }

    return derive(crypto, password, *metaOpt, iv);
}

[[nodiscard]] VaultResult<KeyMaterial> KeyMaterial::derive(const securebox::crypto::ICryptoProvider& crypto,
                                                           const securebox::security::SecureString& password,
                                                           const securebox::crypto::KdfMetadata& kdf,
                                                           const KeyIv& iv) noexcept
{
    if (password.empty())
    {
        return VaultError::EmptyPassword;
    }
    if (!crypto.supportsKdf(kdf.algorithm))
    {
        return VaultError::UnsupportedKdfMetadata;
    }

    auto masterOrErr{ deriveMasterKeyOrError(crypto, password, kdf) };
    if (std::holds_alternative<VaultError>(masterOrErr))
    {
        return std::get<VaultError>(masterOrErr);
    }
    auto masterKey{ std::get<securebox::security::SecureBuffer>(std::move(masterOrErr)) };
    const auto wipeMaster{ securebox::security::scopeWipe(masterKey) };

    KeyMaterial out{};
    out.m_kdf = kdf;
    out.m_iv = iv;

    const std::pair<std::string_view, securebox::security::SecureBuffer*> subkeys[]{
        { g_kContainerKeyContext, &out.m_containerKey },
        { g_kKeyCheckKeyContext, &out.m_keyCheckKey },
        { g_kSealKeyContext, &out.m_sealKey },
    };
    for (const auto& [context, target] : subkeys)
    {
        auto subkeyOrErr{ deriveSubkeyOrError(crypto, masterKey, context) };
        if (std::holds_alternative<VaultError>(subkeyOrErr))
        {
            return std::get<VaultError>(subkeyOrErr);
        }
        *target = std::get<securebox::security::SecureBuffer>(std::move(subkeyOrErr));
    }

    return out;
}

[[nodiscard]] VaultResult<securebox::crypto::AeadBox>
KeyMaterial::sealKeyCheck(securebox::crypto::ICryptoProvider& crypto) const noexcept
{
    try
    {
        const auto aad{ encodeKeyCheckAad(m_kdf) };
        return crypto.aeadEncrypt(m_keyCheckKey, m_iv, asBytes(g_kKeyCheckMarker),
                                  std::span<const std::byte>{ aad.data(), aad.size() });
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

[[nodiscard]] VaultResult<std::monostate>
KeyMaterial::verifyKeyCheck(securebox::crypto::ICryptoProvider& crypto,
                            const securebox::crypto::AeadBox& record) const noexcept
{
    try
    {
        const auto aad{ encodeKeyCheckAad(m_kdf) };
        auto plainOpt{ crypto.aeadDecrypt(m_keyCheckKey, record,
                                          std::span<const std::byte>{ aad.data(), aad.size() }) };
        if (!plainOpt)
        {
            return VaultError::AuthFailed;
        }
        const bool matches{ securebox::security::secureEquals(securebox::security::asBytes(*plainOpt),
                                                              asBytes(g_kKeyCheckMarker)) };
        securebox::security::secureRelease(*plainOpt);
        if (!matches)
        {
            return VaultError::AuthFailed;
        }
        return std::monostate{};
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

[[nodiscard]] VaultResult<securebox::crypto::Mac>
KeyMaterial::sealManifest(const securebox::crypto::ICryptoProvider& crypto,
                          std::span<const std::byte> manifest) const noexcept
{
    try
    {
        return crypto.mac(m_sealKey, manifest);
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

} // namespace securebox::core
