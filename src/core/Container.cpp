#include "securebox/core/Container.hpp"
#include "securebox/core/VaultCodec.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include <exception>
#include <optional>

namespace securebox::core
{

[[nodiscard]] VaultResult<securebox::storage::EncryptedContainer>
Container::encrypt(securebox::crypto::ICryptoProvider& crypto, const KeyMaterial& key) const noexcept
{
    securebox::crypto::AeadNonce iv{};
    if (!crypto.randomBytes(std::span<std::uint8_t>{ iv }))
    {
        return VaultError::RandomFailed;
    }

    try
    {
        auto plain{ encodeContainerPayload(m_name, m_data) };
        const auto aad{ encodeContainerAad(m_id) };

        securebox::storage::EncryptedContainer out{};
        out.id = m_id;
        out.salt = key.salt();
        out.box = crypto.aeadEncrypt(key.containerKey(), iv, securebox::security::asBytes(plain),
                                     std::span<const std::byte>{ aad.data(), aad.size() });
        securebox::security::secureRelease(plain);
        return out;
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
}

[[nodiscard]] VaultResult<Container> Container::decrypt(securebox::crypto::ICryptoProvider& crypto,
                                                        const KeyMaterial& key,
                                                        const securebox::storage::EncryptedContainer& record) noexcept
{
    std::optional<securebox::security::SecureBuffer> plainOpt{};
    try
    {
        const auto aad{ encodeContainerAad(record.id) };
        plainOpt = crypto.aeadDecrypt(key.containerKey(), record.box,
                                      std::span<const std::byte>{ aad.data(), aad.size() });
    }
    catch (const std::exception&)
    {
        return VaultError::CryptoError;
    }
    if (!plainOpt)
    {
        return VaultError::IntegrityFailed;
    }

    try
    {
        auto payloadOpt{ decodeContainerPayload(securebox::security::asBytes(*plainOpt)) };
        securebox::security::secureRelease(*plainOpt);
        if (!payloadOpt)
        {
            return VaultError::CorruptFormat;
        }
        return Container{ record.id, std::move(payloadOpt->name), std::move(payloadOpt->data) };
    }
    catch (const std::exception&)
    {
        securebox::security::secureRelease(*plainOpt);
        return VaultError::CryptoError;
    }
}

} // namespace securebox::core
