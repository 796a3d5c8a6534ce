#ifndef INCLUDE_SECUREBOX_CORE_VAULT_HPP
#define INCLUDE_SECUREBOX_CORE_VAULT_HPP

#include "securebox/backup/IBackupGateway.hpp"
#include "securebox/core/Container.hpp"
#include "securebox/core/IntegrityReport.hpp"
#include "securebox/core/KdfPolicy.hpp"
#include "securebox/core/KeyMaterial.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/log/AuditLog.hpp"
#include "securebox/security/SecureString.hpp"
#include "securebox/storage/IStorageRepository.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace securebox::core
{

// A decrypted container paired with the record currently persisted for it.
struct VaultEntry final
{
    Container container;
    securebox::storage::EncryptedContainer record;
};

// One exclusive unlocked session over one vault file. Obtained from VaultService, move-only.
// Every mutation writes the whole file first and only then updates memory, so a failed call
// leaves both unchanged. After lock() (or once moved from) every operation returns Locked.
class Vault final
{
public:
    Vault() = default;
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;
    Vault(Vault&& other) noexcept;
    Vault& operator=(Vault&& other) noexcept;
    ~Vault() noexcept;

    [[nodiscard]] bool isLocked() const noexcept
    {
        return m_crypto == nullptr;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_path;
    }

    [[nodiscard]] const securebox::crypto::KdfMetadata& kdf() const noexcept
    {
        return m_key.kdf();
    }

    // User containers in insertion order. Hidden credential containers are not listed.
    [[nodiscard]] VaultResult<std::vector<Container>> containers() const;

    // An empty name becomes "Container <id>".
    [[nodiscard]] VaultResult<Container> addContainer(std::string_view name,
                                                      const securebox::security::SecureString& data);

    // In-memory copy; does not re-read or re-verify the file (see verifyIntegrity).
    [[nodiscard]] VaultResult<Container> getContainer(ContainerId id) const;

    [[nodiscard]] VaultResult<Container> updateContainer(ContainerId id, std::optional<std::string> name,
                                                         std::optional<securebox::security::SecureString> data);

    [[nodiscard]] VaultResult<std::monostate> removeContainer(ContainerId id);

    // Re-reads the file and verifies the key check, the seal and every record.
    [[nodiscard]] VaultResult<IntegrityReport> verifyIntegrity();

    // Keeps the current KDF cost parameters.
    [[nodiscard]] VaultResult<std::monostate>
    changeMasterPassword(const securebox::security::SecureString& newPassword);

    [[nodiscard]] VaultResult<std::monostate> changeMasterPassword(const securebox::security::SecureString& newPassword,
                                                                   const KdfParams& params);

    // Fresh salt, iv and keys for the same password; every record is re-encrypted.
    [[nodiscard]] VaultResult<std::monostate> regenerateKeys();

    // Only the provided blobs change. Empty blobs are rejected; use signOut() to drop the token.
    [[nodiscard]] VaultResult<std::monostate>
    setCloudCredentials(std::optional<securebox::security::SecureString> credentials,
                        std::optional<securebox::security::SecureString> token);

    [[nodiscard]] VaultResult<std::monostate> signOut();

    // Fields are empty when not set.
    [[nodiscard]] VaultResult<securebox::backup::BackupCredentials> cloudCredentials() const;

    // "<vault file name>.BAK"
    [[nodiscard]] std::string backupName() const;

    [[nodiscard]] VaultResult<std::monostate> uploadBackup(securebox::backup::IBackupGateway& gateway);

    // Fetches the remote copy into `destination` (never the open vault file). An existing file there is kept
    // as "<destination>.old"; AlreadyExists if that name is taken too. The result is only a candidate for
    // VaultService::openVault.
    [[nodiscard]] VaultResult<std::monostate> downloadBackup(securebox::backup::IBackupGateway& gateway,
                                                             const std::filesystem::path& destination);

    [[nodiscard]] VaultResult<std::monostate> deleteBackup(securebox::backup::IBackupGateway& gateway);

    // Wipes the password, keys and plaintext.
    void lock() noexcept;

private:
    friend class VaultService;

    Vault(securebox::crypto::ICryptoProvider& crypto, securebox::storage::IStorageRepository& storage,
          securebox::log::IAuditSink& audit, std::filesystem::path path, securebox::security::SecureString password,
          KeyMaterial key, std::vector<VaultEntry> entries, ContainerId nextId) noexcept;

    // Seals and atomically writes the given state; on success it becomes the session state.
    [[nodiscard]] VaultResult<std::monostate> commit(std::vector<VaultEntry> entries, ContainerId nextId);
    [[nodiscard]] VaultResult<std::monostate> commit(std::vector<VaultEntry> entries, ContainerId nextId,
                                                     KeyMaterial key, securebox::security::SecureString password);

    [[nodiscard]] VaultResult<std::monostate> rekey(const securebox::security::SecureString& password,
                                                    const KdfParams& params, std::string_view event);

    [[nodiscard]] VaultResult<std::monostate> putHidden(std::vector<VaultEntry>& entries, ContainerId id,
                                                        std::string_view name,
                                                        securebox::security::SecureString value);

    [[nodiscard]] VaultResult<securebox::backup::BackupCredentials> requireCredentials() const;

    [[nodiscard]] const VaultEntry* findEntry(ContainerId id) const noexcept;

    void audit(securebox::log::AuditLevel level, std::string_view event, std::string_view outcome,
               std::string_view detail) const noexcept;

    securebox::crypto::ICryptoProvider* m_crypto{ nullptr };
    securebox::storage::IStorageRepository* m_storage{ nullptr };
    securebox::log::IAuditSink* m_audit{ nullptr };
    std::filesystem::path m_path;
    securebox::security::SecureString m_password;
    KeyMaterial m_key;
    std::vector<VaultEntry> m_entries;
    ContainerId m_nextId{ g_firstContainerId };
};

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_VAULT_HPP
