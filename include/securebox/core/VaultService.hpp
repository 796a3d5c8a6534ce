#ifndef INCLUDE_SECUREBOX_CORE_VAULTSERVICE_HPP
#define INCLUDE_SECUREBOX_CORE_VAULTSERVICE_HPP

#include "securebox/core/Container.hpp"
#include "securebox/core/IntegrityReport.hpp"
#include "securebox/core/KdfPolicy.hpp"
#include "securebox/core/Vault.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/log/AuditLog.hpp"
#include "securebox/security/SecureString.hpp"
#include "securebox/storage/IStorageRepository.hpp"
#include <filesystem>

namespace securebox::core
{

// Degraded unlock: only the records that verified are loaded, the report says which did not.
struct RecoveredVault final
{
    Vault vault;
    IntegrityReport report;
};

class VaultService final
{
public:
    VaultService(securebox::crypto::ICryptoProvider& crypto, securebox::storage::IStorageRepository& storage,
                 securebox::log::IAuditSink& audit = securebox::log::nullAuditSink()) noexcept;

    [[nodiscard]] bool vaultExists(const std::filesystem::path& vaultPath) const noexcept;

    // Uses defaultKdfParams(). Never overwrites: AlreadyExists if anything is at `vaultPath`.
    [[nodiscard]] VaultResult<Vault> createVault(const std::filesystem::path& vaultPath,
                                                 const securebox::security::SecureString& password);

    [[nodiscard]] VaultResult<Vault> createVault(const std::filesystem::path& vaultPath,
                                                 const securebox::security::SecureString& password,
                                                 const KdfParams& params);

    // Strict: the key check, the seal and every record must verify. Any authentication failure is AuthFailed;
    // an authentic but malformed payload is CorruptFormat.
    [[nodiscard]] VaultResult<Vault> openVault(const std::filesystem::path& vaultPath,
                                               const securebox::security::SecureString& password);

    // Requires the key check to pass; loads whatever else verifies.
    [[nodiscard]] VaultResult<RecoveredVault> recoverVault(const std::filesystem::path& vaultPath,
                                                           const securebox::security::SecureString& password);

    // Decrypts one user record without verifying the rest of the file.
    [[nodiscard]] VaultResult<Container> peekContainer(const std::filesystem::path& vaultPath,
                                                       const securebox::security::SecureString& password,
                                                       ContainerId id);

private:
    [[nodiscard]] VaultResult<Vault> unlock(const std::filesystem::path& vaultPath,
                                            const securebox::security::SecureString& password, bool degraded,
                                            IntegrityReport* reportOut);

    securebox::crypto::ICryptoProvider* m_crypto{ nullptr };
    securebox::storage::IStorageRepository* m_storage{ nullptr };
    securebox::log::IAuditSink* m_audit{ nullptr };
};

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_VAULTSERVICE_HPP
