#ifndef INCLUDE_SECUREBOX_CORE_CONTAINER_HPP
#define INCLUDE_SECUREBOX_CORE_CONTAINER_HPP

#include "securebox/core/KeyMaterial.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/security/SecureString.hpp"
#include "securebox/storage/VaultSnapshot.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace securebox::core
{

using ContainerId = std::int64_t;

constexpr ContainerId g_firstContainerId{ 1 };

// Hidden containers carrying the backup credential and token blobs.
constexpr ContainerId g_credentialContainerId{ -1 };
constexpr ContainerId g_tokenContainerId{ -2 };

// One named secret record. Plaintext lives only in memory; at rest it is an EncryptedContainer.
class Container final
{
public:
    Container() = default;
    Container(ContainerId id, std::string name, securebox::security::SecureString data)
        : m_id{ id }, m_name{ std::move(name) }, m_data{ std::move(data) }
    {
    }

    [[nodiscard]] ContainerId id() const noexcept
    {
        return m_id;
    }
    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_name;
    }
    [[nodiscard]] const securebox::security::SecureString& data() const noexcept
    {
        return m_data;
    }
    [[nodiscard]] std::string_view dataView() const noexcept
    {
        return securebox::security::asStringView(m_data);
    }

    [[nodiscard]] bool isHidden() const noexcept
    {
        return m_id < g_firstContainerId;
    }

    void setName(std::string name)
    {
        m_name = std::move(name);
    }

    void setData(securebox::security::SecureString data)
    {
        securebox::security::secureRelease(m_data);
        m_data = std::move(data);
    }

    // Fresh random iv per call; the id is bound as associated data.
    [[nodiscard]] VaultResult<securebox::storage::EncryptedContainer>
    encrypt(securebox::crypto::ICryptoProvider& crypto, const KeyMaterial& key) const noexcept;

    // The tag is verified before any plaintext exists: IntegrityFailed on mismatch,
    // CorruptFormat when an authentic payload does not parse.
    [[nodiscard]] static VaultResult<Container> decrypt(securebox::crypto::ICryptoProvider& crypto,
                                                        const KeyMaterial& key,
                                                        const securebox::storage::EncryptedContainer& record) noexcept;

private:
    ContainerId m_id{};
    std::string m_name;
    securebox::security::SecureString m_data;
};

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_CONTAINER_HPP
