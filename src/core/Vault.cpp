#include "securebox/core/Vault.hpp"

#include "VaultSnapshotOps.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

namespace securebox::core
{
namespace
{

constexpr std::string_view g_kCredentialName{ "Credential" };
constexpr std::string_view g_kTokenName{ "Token" };
constexpr std::string_view g_kBackupSuffix{ ".BAK" };

[[nodiscard]] std::string idDetail(ContainerId id)
{
    return "id=" + std::to_string(id);
}

[[nodiscard]] std::string errorDetail(VaultError error)
{
    return "error=" + std::string{ toString(error) };
}

[[nodiscard]] bool isUserId(ContainerId id) noexcept
{
    return id >= g_firstContainerId;
}

[[nodiscard]] auto findIn(std::vector<VaultEntry>& entries, ContainerId id)
{
    return std::find_if(entries.begin(), entries.end(),
                        [id](const VaultEntry& e) { return e.container.id() == id; });
}

[[nodiscard]] std::filesystem::path withSuffix(std::filesystem::path p, std::string_view suffix)
{
    p += std::string{ suffix };
    return p;
}

} // namespace

Vault::Vault(securebox::crypto::ICryptoProvider& crypto, securebox::storage::IStorageRepository& storage,
             securebox::log::IAuditSink& audit, std::filesystem::path path, securebox::security::SecureString password,
             KeyMaterial key, std::vector<VaultEntry> entries, ContainerId nextId) noexcept
    : m_crypto{ &crypto }, m_storage{ &storage }, m_audit{ &audit }, m_path{ std::move(path) },
      m_password{ std::move(password) }, m_key{ std::move(key) }, m_entries{ std::move(entries) }, m_nextId{ nextId }
{
}

Vault::Vault(Vault&& other) noexcept
    : m_crypto{ std::exchange(other.m_crypto, nullptr) }, m_storage{ std::exchange(other.m_storage, nullptr) },
      m_audit{ std::exchange(other.m_audit, nullptr) }, m_path{ std::move(other.m_path) },
      m_password{ std::move(other.m_password) }, m_key{ std::move(other.m_key) },
      m_entries{ std::move(other.m_entries) }, m_nextId{ std::exchange(other.m_nextId, g_firstContainerId) }
{
    other.lock();
}

Vault& Vault::operator=(Vault&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    lock();
    m_crypto = std::exchange(other.m_crypto, nullptr);
    m_storage = std::exchange(other.m_storage, nullptr);
    m_audit = std::exchange(other.m_audit, nullptr);
    m_path = std::move(other.m_path);
    m_password.swap(other.m_password);
    m_key = std::move(other.m_key);
    m_entries.swap(other.m_entries);
    m_nextId = std::exchange(other.m_nextId, g_firstContainerId);
    other.lock();
    return *this;
}

Vault::~Vault() noexcept
{
    lock();
}

void Vault::lock() noexcept
{
    securebox::security::secureRelease(m_password);
    m_key.release();
    m_entries.clear();
    if (m_audit != nullptr)
    {
        m_audit->record(securebox::log::AuditLevel::Info, "vault.lock", "success", "");
    }
    m_crypto = nullptr;
    m_storage = nullptr;
    m_audit = nullptr;
    m_nextId = g_firstContainerId;
}

void Vault::audit(securebox::log::AuditLevel level, std::string_view event, std::string_view outcome,
                  std::string_view detail) const noexcept
{
    if (m_audit != nullptr)
    {
        m_audit->record(level, event, outcome, detail);
    }
}

[[nodiscard]] const VaultEntry* Vault::findEntry(ContainerId id) const noexcept
{
    const auto it{ std::find_if(m_entries.begin(), m_entries.end(),
                                [id](const VaultEntry& e) { return e.container.id() == id; }) };
    return it == m_entries.end() ? nullptr : &*it;
}

[[nodiscard]] VaultResult<std::monostate> Vault::commit(std::vector<VaultEntry> entries, ContainerId nextId)
{
    auto snapshotOrErr{ detail::buildSnapshot(*m_crypto, m_key, entries, nextId) };
    if (std::holds_alternative<VaultError>(snapshotOrErr))
    {
        return std::get<VaultError>(snapshotOrErr);
    }
    const auto stored{ detail::replaceSnapshotOrError(*m_storage, m_path,
                                                      std::get<securebox::storage::VaultSnapshot>(snapshotOrErr)) };
    if (std::holds_alternative<VaultError>(stored))
    {
        return std::get<VaultError>(stored);
    }
    if (std::get<detail::WriteOutcome>(stored) == detail::WriteOutcome::NotSynced)
    {
        audit(securebox::log::AuditLevel::Warn, "vault.write", "unsynced", "directory fsync failed");
    }

    m_entries.swap(entries);
    m_nextId = nextId;
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::monostate> Vault::commit(std::vector<VaultEntry> entries, ContainerId nextId,
                                                        KeyMaterial key, securebox::security::SecureString password)
{
    auto snapshotOrErr{ detail::buildSnapshot(*m_crypto, key, entries, nextId) };
    if (std::holds_alternative<VaultError>(snapshotOrErr))
    {
        return std::get<VaultError>(snapshotOrErr);
    }
    const auto stored{ detail::replaceSnapshotOrError(*m_storage, m_path,
                                                      std::get<securebox::storage::VaultSnapshot>(snapshotOrErr)) };
    if (std::holds_alternative<VaultError>(stored))
    {
        return std::get<VaultError>(stored);
    }
    if (std::get<detail::WriteOutcome>(stored) == detail::WriteOutcome::NotSynced)
    {
        audit(securebox::log::AuditLevel::Warn, "vault.write", "unsynced", "directory fsync failed");
    }

    m_entries.swap(entries);
    m_nextId = nextId;
    m_key = std::move(key);
    m_password.swap(password);
    securebox::security::secureRelease(password);
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::vector<Container>> Vault::containers() const
{
    if (isLocked())
    {
        return VaultError::Locked;
    }

    std::vector<Container> out{};
    for (const auto& entry : m_entries)
    {
        if (!entry.container.isHidden())
        {
            out.push_back(entry.container);
        }
    }
    return out;
}

[[nodiscard]] VaultResult<Container> Vault::addContainer(std::string_view name,
                                                         const securebox::security::SecureString& data)
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    if (m_nextId == std::numeric_limits<ContainerId>::max())
    {
        return VaultError::InvalidArgument;
    }

    const ContainerId id{ m_nextId };
    std::string label{ name.empty() ? "Container " + std::to_string(id) : std::string{ name } };
    Container container{ id, std::move(label), data };

    auto recordOrErr{ container.encrypt(*m_crypto, m_key) };
    if (std::holds_alternative<VaultError>(recordOrErr))
    {
        return std::get<VaultError>(recordOrErr);
    }

    auto entries{ m_entries };
    entries.push_back(VaultEntry{ .container = container,
                                  .record = std::get<securebox::storage::EncryptedContainer>(std::move(recordOrErr)) });

    const auto committed{ commit(std::move(entries), id + 1) };
    if (std::holds_alternative<VaultError>(committed))
    {
        audit(securebox::log::AuditLevel::Error, "container.add", "failure",
              errorDetail(std::get<VaultError>(committed)));
        return std::get<VaultError>(committed);
    }

    audit(securebox::log::AuditLevel::Info, "container.add", "success", idDetail(id));
    return container;
}

[[nodiscard]] VaultResult<Container> Vault::getContainer(ContainerId id) const
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    const auto* entry{ isUserId(id) ? findEntry(id) : nullptr };
    if (entry == nullptr)
    {
        return VaultError::NotFound;
    }
    return entry->container;
}

[[nodiscard]] VaultResult<Container> Vault::updateContainer(ContainerId id, std::optional<std::string> name,
                                                            std::optional<securebox::security::SecureString> data)
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    if (!isUserId(id) || findEntry(id) == nullptr)
    {
        return VaultError::NotFound;
    }

    auto entries{ m_entries };
    auto it{ findIn(entries, id) };
    if (name)
    {
        it->container.setName(std::move(*name));
    }
    if (data)
    {
        it->container.setData(std::move(*data));
    }

    auto recordOrErr{ it->container.encrypt(*m_crypto, m_key) };
    if (std::holds_alternative<VaultError>(recordOrErr))
    {
        return std::get<VaultError>(recordOrErr);
    }
    it->record = std::get<securebox::storage::EncryptedContainer>(std::move(recordOrErr));
    Container updated{ it->container };

    const auto committed{ commit(std::move(entries), m_nextId) };
    if (std::holds_alternative<VaultError>(committed))
    {
        audit(securebox::log::AuditLevel::Error, "container.update", "failure",
              errorDetail(std::get<VaultError>(committed)));
        return std::get<VaultError>(committed);
    }

    audit(securebox::log::AuditLevel::Info, "container.update", "success", idDetail(id));
    return updated;
}

[[nodiscard]] VaultResult<std::monostate> Vault::removeContainer(ContainerId id)
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    if (!isUserId(id) || findEntry(id) == nullptr)
    {
        return VaultError::NotFound;
    }

    auto entries{ m_entries };
    entries.erase(findIn(entries, id));

    const auto committed{ commit(std::move(entries), m_nextId) };
    if (std::holds_alternative<VaultError>(committed))
    {
        audit(securebox::log::AuditLevel::Error, "container.remove", "failure",
              errorDetail(std::get<VaultError>(committed)));
        return committed;
    }

    audit(securebox::log::AuditLevel::Info, "container.remove", "success", idDetail(id));
    return std::monostate{};
}

[[nodiscard]] VaultResult<IntegrityReport> Vault::verifyIntegrity()
{
    if (isLocked())
    {
        return VaultError::Locked;
    }

    const auto snapshotOrErr{ detail::loadSnapshotOrError(*m_storage, m_path) };
    if (std::holds_alternative<VaultError>(snapshotOrErr))
    {
        audit(securebox::log::AuditLevel::Alert, "vault.verify", "failure",
              errorDetail(std::get<VaultError>(snapshotOrErr)));
        return std::get<VaultError>(snapshotOrErr);
    }
    const auto& snapshot{ std::get<securebox::storage::VaultSnapshot>(snapshotOrErr) };
    if (!detail::snapshotShapeValid(snapshot))
    {
        audit(securebox::log::AuditLevel::Alert, "vault.verify", "failure", errorDetail(VaultError::CorruptFormat));
        return VaultError::CorruptFormat;
    }

    // The file may carry a key record this session did not write (replaced on disk).
    KeyMaterial fileKey{};
    const KeyMaterial* key{ &m_key };
    if (!detail::keyMatches(m_key, snapshot.key))
    {
        auto keyOrErr{ detail::deriveSnapshotKey(*m_crypto, m_password, snapshot.key) };
        if (std::holds_alternative<VaultError>(keyOrErr))
        {
            return std::get<VaultError>(keyOrErr);
        }
        fileKey = std::get<KeyMaterial>(std::move(keyOrErr));
        key = &fileKey;
    }

    auto inspectionOrErr{ detail::inspectSnapshot(*m_crypto, m_password, snapshot, *key, detail::InspectMode::Report) };
    if (std::holds_alternative<VaultError>(inspectionOrErr))
    {
        return std::get<VaultError>(inspectionOrErr);
    }
    auto report{ std::move(std::get<detail::Inspection>(inspectionOrErr).report) };

    if (report.passed())
    {
        audit(securebox::log::AuditLevel::Info, "vault.verify", "success", "");
    }
    else
    {
        std::string failed{ "failed=" };
        for (const ContainerId id : report.failedIds())
        {
            failed += std::to_string(id) + ",";
        }
        if (!report.keyCheckValid)
        {
            failed += "keycheck,";
        }
        if (!report.sealValid)
        {
            failed += "seal,";
        }
        failed.pop_back();
        audit(securebox::log::AuditLevel::Alert, "vault.verify", "failure", failed);
    }
    return report;
}

[[nodiscard]] VaultResult<std::monostate> Vault::rekey(const securebox::security::SecureString& password,
                                                       const KdfParams& params, std::string_view event)
{
    auto keyOrErr{ KeyMaterial::generate(*m_crypto, password, params) };
    if (std::holds_alternative<VaultError>(keyOrErr))
    {
        audit(securebox::log::AuditLevel::Error, event, "failure", errorDetail(std::get<VaultError>(keyOrErr)));
        return std::get<VaultError>(keyOrErr);
    }
    auto newKey{ std::get<KeyMaterial>(std::move(keyOrErr)) };

    // Nothing is written unless every record re-encrypts under the new key.
    auto entries{ m_entries };
    for (auto& entry : entries)
    {
        auto recordOrErr{ entry.container.encrypt(*m_crypto, newKey) };
        if (std::holds_alternative<VaultError>(recordOrErr))
        {
            audit(securebox::log::AuditLevel::Error, event, "failure",
                  errorDetail(std::get<VaultError>(recordOrErr)));
            return std::get<VaultError>(recordOrErr);
        }
        entry.record = std::get<securebox::storage::EncryptedContainer>(std::move(recordOrErr));
    }

    const auto committed{ commit(std::move(entries), m_nextId, std::move(newKey), password) };
    if (std::holds_alternative<VaultError>(committed))
    {
        audit(securebox::log::AuditLevel::Error, event, "failure", errorDetail(std::get<VaultError>(committed)));
        return committed;
    }

    audit(securebox::log::AuditLevel::Info, event, "success", "");
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::monostate>
Vault::changeMasterPassword(const securebox::security::SecureString& newPassword)
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    return changeMasterPassword(newPassword, kdfParamsOf(m_key.kdf()));
}

[[nodiscard]] VaultResult<std::monostate>
Vault::changeMasterPassword(const securebox::security::SecureString& newPassword, const KdfParams& params)
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    if (newPassword.empty())
    {
        return VaultError::EmptyPassword;
    }
    return rekey(newPassword, params, "vault.password_change");
}

[[nodiscard]] VaultResult<std::monostate> Vault::regenerateKeys()
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    const auto password{ m_password };
    return rekey(password, kdfParamsOf(m_key.kdf()), "vault.key_rotation");
}

[[nodiscard]] VaultResult<std::monostate> Vault::putHidden(std::vector<VaultEntry>& entries, ContainerId id,
                                                           std::string_view name,
                                                           securebox::security::SecureString value)
{
    auto it{ findIn(entries, id) };
    if (it == entries.end())
    {
        entries.push_back(VaultEntry{ .container = Container{ id, std::string{ name }, {} }, .record = {} });
        it = std::prev(entries.end());
    }
    it->container.setData(std::move(value));

    auto recordOrErr{ it->container.encrypt(*m_crypto, m_key) };
    if (std::holds_alternative<VaultError>(recordOrErr))
    {
        return std::get<VaultError>(recordOrErr);
    }
    it->record = std::get<securebox::storage::EncryptedContainer>(std::move(recordOrErr));
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::monostate>
Vault::setCloudCredentials(std::optional<securebox::security::SecureString> credentials,
                           std::optional<securebox::security::SecureString> token)
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    if ((!credentials && !token) || (credentials && credentials->empty()) || (token && token->empty()))
    {
        return VaultError::InvalidArgument;
    }

    auto entries{ m_entries };
    if (credentials)
    {
        const auto put{ putHidden(entries, g_credentialContainerId, g_kCredentialName, std::move(*credentials)) };
        if (std::holds_alternative<VaultError>(put))
        {
            return put;
        }
    }
    if (token)
    {
        const auto put{ putHidden(entries, g_tokenContainerId, g_kTokenName, std::move(*token)) };
        if (std::holds_alternative<VaultError>(put))
        {
            return put;
        }
    }

    const auto committed{ commit(std::move(entries), m_nextId) };
    if (std::holds_alternative<VaultError>(committed))
    {
        audit(securebox::log::AuditLevel::Error, "backup.credentials", "failure",
              errorDetail(std::get<VaultError>(committed)));
        return committed;
    }
    audit(securebox::log::AuditLevel::Info, "backup.credentials", "success", "");
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::monostate> Vault::signOut()
{
    if (isLocked())
    {
        return VaultError::Locked;
    }
    if (findEntry(g_tokenContainerId) == nullptr)
    {
        return std::monostate{};
    }

    auto entries{ m_entries };
    entries.erase(findIn(entries, g_tokenContainerId));

    const auto committed{ commit(std::move(entries), m_nextId) };
    if (std::holds_alternative<VaultError>(committed))
    {
        audit(securebox::log::AuditLevel::Error, "backup.sign_out", "failure",
              errorDetail(std::get<VaultError>(committed)));
        return committed;
    }
    audit(securebox::log::AuditLevel::Info, "backup.sign_out", "success", "");
    return std::monostate{};
}

[[nodiscard]] VaultResult<securebox::backup::BackupCredentials> Vault::cloudCredentials() const
{
    if (isLocked())
    {
        return VaultError::Locked;
    }

    securebox::backup::BackupCredentials out{};
    if (const auto* entry{ findEntry(g_credentialContainerId) }; entry != nullptr)
    {
        out.credentials = entry->container.data();
    }
    if (const auto* entry{ findEntry(g_tokenContainerId) }; entry != nullptr)
    {
        out.token = entry->container.data();
    }
    return out;
}

[[nodiscard]] VaultResult<securebox::backup::BackupCredentials> Vault::requireCredentials() const
{
    auto credsOrErr{ cloudCredentials() };
    if (std::holds_alternative<VaultError>(credsOrErr))
    {
        return credsOrErr;
    }
    const auto& creds{ std::get<securebox::backup::BackupCredentials>(credsOrErr) };
    if (creds.credentials.empty() || creds.token.empty())
    {
        return VaultError::BackupNotConfigured;
    }
    return credsOrErr;
}

[[nodiscard]] std::string Vault::backupName() const
{
    return m_path.filename().string() + std::string{ g_kBackupSuffix };
}

[[nodiscard]] VaultResult<std::monostate> Vault::uploadBackup(securebox::backup::IBackupGateway& gateway)
{
    const auto credsOrErr{ requireCredentials() };
    if (std::holds_alternative<VaultError>(credsOrErr))
    {
        return std::get<VaultError>(credsOrErr);
    }

    bool ok{ false };
    try
    {
        ok = gateway.upload(std::get<securebox::backup::BackupCredentials>(credsOrErr), m_path, backupName());
    }
    catch (const std::exception& e)
    {
        audit(securebox::log::AuditLevel::Warn, "backup.upload", "failure", e.what());
        return VaultError::BackupTransportFailed;
    }
    if (!ok)
    {
        audit(securebox::log::AuditLevel::Warn, "backup.upload", "failure", "");
        return VaultError::BackupTransportFailed;
    }

    audit(securebox::log::AuditLevel::Info, "backup.upload", "success", backupName());
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::monostate> Vault::downloadBackup(securebox::backup::IBackupGateway& gateway,
                                                                const std::filesystem::path& destination)
{
    const auto credsOrErr{ requireCredentials() };
    if (std::holds_alternative<VaultError>(credsOrErr))
    {
        return std::get<VaultError>(credsOrErr);
    }
    if (destination.empty())
    {
        return VaultError::InvalidArgument;
    }

    std::error_code ec{};
    const auto ownFile{ std::filesystem::weakly_canonical(m_path, ec) };
    if (ec)
    {
        return VaultError::StorageError;
    }
    const auto target{ std::filesystem::weakly_canonical(destination, ec) };
    if (ec)
    {
        return VaultError::StorageError;
    }
    if (target == ownFile)
    {
        return VaultError::InvalidArgument;
    }
    const auto previous{ withSuffix(target, ".old") };
    if (std::filesystem::exists(target, ec) && std::filesystem::exists(previous, ec))
    {
        audit(securebox::log::AuditLevel::Warn, "backup.download", "failure", "destination.old exists");
        return VaultError::AlreadyExists;
    }

    const auto partial{ withSuffix(target, ".part") };
    bool ok{ false };
    std::string failure{};
    try
    {
        ok = gateway.download(std::get<securebox::backup::BackupCredentials>(credsOrErr), backupName(), partial);
    }
    catch (const std::exception& e)
    {
        failure = e.what();
    }
    if (!ok)
    {
        std::error_code cleanup{};
        std::filesystem::remove(partial, cleanup);
        audit(securebox::log::AuditLevel::Warn, "backup.download", "failure", failure);
        return VaultError::BackupTransportFailed;
    }

    if (std::filesystem::exists(target, ec))
    {
        std::filesystem::rename(target, previous, ec);
    }
    if (!ec)
    {
        std::filesystem::rename(partial, target, ec);
    }
    if (ec)
    {
        std::error_code cleanup{};
        std::filesystem::remove(partial, cleanup);
        audit(securebox::log::AuditLevel::Error, "backup.download", "failure", ec.message());
        return VaultError::StorageError;
    }

    audit(securebox::log::AuditLevel::Info, "backup.download", "success", backupName());
    return std::monostate{};
}

[[nodiscard]] VaultResult<std::monostate> Vault::deleteBackup(securebox::backup::IBackupGateway& gateway)
{
    const auto credsOrErr{ requireCredentials() };
    if (std::holds_alternative<VaultError>(credsOrErr))
    {
        return std::get<VaultError>(credsOrErr);
    }

    bool ok{ false };
    try
    {
        ok = gateway.remove(std::get<securebox::backup::BackupCredentials>(credsOrErr), backupName());
    }
    catch (const std::exception& e)
    {
        audit(securebox::log::AuditLevel::Warn, "backup.delete", "failure", e.what());
        return VaultError::BackupTransportFailed;
    }
    if (!ok)
    {
        audit(securebox::log::AuditLevel::Warn, "backup.delete", "failure", "");
        return VaultError::BackupTransportFailed;
    }

    audit(securebox::log::AuditLevel::Info, "backup.delete", "success", backupName());
    return std::monostate{};
}

} // namespace securebox::core
