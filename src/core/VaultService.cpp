#include "securebox/core/VaultService.hpp"

#include "VaultSnapshotOps.hpp"
#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace securebox::core
{
namespace
{

[[nodiscard]] std::string errorDetail(VaultError error)
{
    return "error=" + std::string{ toString(error) };
}

// Strict open tolerates nothing: any failed record, seal or key check is an authentication failure,
// except an authentic payload that does not parse.
[[nodiscard]] std::optional<VaultError> strictOpenError(const IntegrityReport& report) noexcept
{
    if (!report.keyCheckValid || !report.sealValid)
    {
        return VaultError::AuthFailed;
    }
    bool corrupt{ false };
    for (const auto& check : report.containers)
    {
        if (check.status == ContainerStatus::IntegrityFailed)
        {
            return VaultError::AuthFailed;
        }
        corrupt = corrupt || (check.status == ContainerStatus::CorruptFormat);
    }
    if (corrupt)
    {
        return VaultError::CorruptFormat;
    }
    return std::nullopt;
}

} // namespace

VaultService::VaultService(securebox::crypto::ICryptoProvider& crypto,
                           securebox::storage::IStorageRepository& storage,
                           securebox::log::IAuditSink& audit) noexcept
    : m_crypto(&crypto), m_storage(&storage), m_audit(&audit)
{
}

[[nodiscard]] bool VaultService::vaultExists(const std::filesystem::path& vaultPath) const noexcept
{
    try
    {
        return m_storage->vaultExists(vaultPath);
    }
    catch (const std::exception&)
    {
        return false;
    }
}

[[nodiscard]] VaultResult<Vault> VaultService::createVault(const std::filesystem::path& vaultPath,
                                                           const securebox::security::SecureString& password)
{
    return createVault(vaultPath, password, defaultKdfParams());
}

[[nodiscard]] VaultResult<Vault> VaultService::createVault(const std::filesystem::path& vaultPath,
                                                           const securebox::security::SecureString& password,
                                                           const KdfParams& params)
{
    if (password.empty())
    {
        return VaultError::EmptyPassword;
    }
    if (vaultExists(vaultPath))
    {
        m_audit->record(securebox::log::AuditLevel::Warn, "vault.create", "failure",
                        errorDetail(VaultError::AlreadyExists));
        return VaultError::AlreadyExists;
    }

    auto keyOrErr{ KeyMaterial::generate(*m_crypto, password, params) };
    if (std::holds_alternative<VaultError>(keyOrErr))
    {
        m_audit->record(securebox::log::AuditLevel::Error, "vault.create", "failure",
                        errorDetail(std::get<VaultError>(keyOrErr)));
        return std::get<VaultError>(keyOrErr);
    }
    auto key{ std::get<KeyMaterial>(std::move(keyOrErr)) };

    const auto snapshotOrErr{ detail::buildSnapshot(*m_crypto, key, {}, g_firstContainerId) };
    if (std::holds_alternative<VaultError>(snapshotOrErr))
    {
        return std::get<VaultError>(snapshotOrErr);
    }

    const auto created{ detail::createSnapshotOrError(*m_storage, vaultPath,
                                                      std::get<securebox::storage::VaultSnapshot>(snapshotOrErr)) };
    if (std::holds_alternative<VaultError>(created))
    {
        m_audit->record(securebox::log::AuditLevel::Error, "vault.create", "failure",
                        errorDetail(std::get<VaultError>(created)));
        return std::get<VaultError>(created);
    }
    if (std::get<detail::WriteOutcome>(created) == detail::WriteOutcome::NotSynced)
    {
        m_audit->record(securebox::log::AuditLevel::Warn, "vault.write", "unsynced", "directory fsync failed");
    }

    m_audit->record(securebox::log::AuditLevel::Info, "vault.create", "success", "");
    return Vault{ *m_crypto, *m_storage, *m_audit, vaultPath, password, std::move(key), {}, g_firstContainerId };
}

[[nodiscard]] VaultResult<Vault> VaultService::unlock(const std::filesystem::path& vaultPath,
                                                      const securebox::security::SecureString& password,
                                                      bool degraded, IntegrityReport* reportOut)
{
    if (password.empty())
    {
        return VaultError::EmptyPassword;
    }

    const auto snapshotOrErr{ detail::loadSnapshotOrError(*m_storage, vaultPath) };
    if (std::holds_alternative<VaultError>(snapshotOrErr))
    {
        return std::get<VaultError>(snapshotOrErr);
    }
    const auto& snapshot{ std::get<securebox::storage::VaultSnapshot>(snapshotOrErr) };
    if (!detail::snapshotShapeValid(snapshot))
    {
        return VaultError::CorruptFormat;
    }

    auto keyOrErr{ detail::deriveSnapshotKey(*m_crypto, password, snapshot.key) };
    if (std::holds_alternative<VaultError>(keyOrErr))
    {
        return std::get<VaultError>(keyOrErr);
    }
    auto key{ std::get<KeyMaterial>(std::move(keyOrErr)) };

    const auto mode{ degraded ? detail::InspectMode::Report : detail::InspectMode::Strict };
    auto inspectionOrErr{ detail::inspectSnapshot(*m_crypto, password, snapshot, key, mode) };
    if (std::holds_alternative<VaultError>(inspectionOrErr))
    {
        return std::get<VaultError>(inspectionOrErr);
    }
    auto& inspection{ std::get<detail::Inspection>(inspectionOrErr) };

    if (!inspection.report.keyCheckValid)
    {
        return VaultError::AuthFailed;
    }
    if (!degraded)
    {
        if (const auto err{ strictOpenError(inspection.report) }; err)
        {
            return *err;
        }
    }

    if (reportOut != nullptr)
    {
        *reportOut = inspection.report;
    }
    return Vault{ *m_crypto, *m_storage, *m_audit, vaultPath, password, std::move(key),
                  std::move(inspection.verified), snapshot.nextContainerId };
}

[[nodiscard]] VaultResult<Vault> VaultService::openVault(const std::filesystem::path& vaultPath,
                                                         const securebox::security::SecureString& password)
{
    auto vaultOrErr{ unlock(vaultPath, password, false, nullptr) };
    if (std::holds_alternative<VaultError>(vaultOrErr))
    {
        const auto err{ std::get<VaultError>(vaultOrErr) };
        const auto level{ err == VaultError::AuthFailed ? securebox::log::AuditLevel::Alert
                                                        : securebox::log::AuditLevel::Error };
        m_audit->record(level, "vault.open", "failure", errorDetail(err));
        return vaultOrErr;
    }

    m_audit->record(securebox::log::AuditLevel::Info, "vault.open", "success", "");
    return vaultOrErr;
}

[[nodiscard]] VaultResult<RecoveredVault> VaultService::recoverVault(const std::filesystem::path& vaultPath,
                                                                     const securebox::security::SecureString& password)
{
    IntegrityReport report{};
    auto vaultOrErr{ unlock(vaultPath, password, true, &report) };
    if (std::holds_alternative<VaultError>(vaultOrErr))
    {
        m_audit->record(securebox::log::AuditLevel::Alert, "vault.recover", "failure",
                        errorDetail(std::get<VaultError>(vaultOrErr)));
        return std::get<VaultError>(vaultOrErr);
    }

    if (report.passed())
    {
        m_audit->record(securebox::log::AuditLevel::Info, "vault.recover", "success", "");
    }
    else
    {
        std::string detail{ "dropped=" + std::to_string(report.failedIds().size()) };
        if (!report.sealValid)
        {
            detail += " seal=invalid";
        }
        m_audit->record(securebox::log::AuditLevel::Alert, "vault.recover", "degraded", detail);
    }
    return RecoveredVault{ .vault = std::get<Vault>(std::move(vaultOrErr)), .report = std::move(report) };
}

[[nodiscard]] VaultResult<Container> VaultService::peekContainer(const std::filesystem::path& vaultPath,
                                                                 const securebox::security::SecureString& password,
                                                                 ContainerId id)
{
    if (password.empty())
    {
        return VaultError::EmptyPassword;
    }

    const auto snapshotOrErr{ detail::loadSnapshotOrError(*m_storage, vaultPath) };
    if (std::holds_alternative<VaultError>(snapshotOrErr))
    {
        return std::get<VaultError>(snapshotOrErr);
    }
    const auto& snapshot{ std::get<securebox::storage::VaultSnapshot>(snapshotOrErr) };

    auto keyOrErr{ detail::deriveSnapshotKey(*m_crypto, password, snapshot.key) };
    if (std::holds_alternative<VaultError>(keyOrErr))
    {
        return std::get<VaultError>(keyOrErr);
    }
    const auto key{ std::get<KeyMaterial>(std::move(keyOrErr)) };

    const auto checked{ key.verifyKeyCheck(*m_crypto, snapshot.key.keyCheck) };
    if (std::holds_alternative<VaultError>(checked))
    {
        m_audit->record(securebox::log::AuditLevel::Alert, "container.peek", "failure",
                        errorDetail(std::get<VaultError>(checked)));
        return std::get<VaultError>(checked);
    }

    const auto it{ std::find_if(snapshot.containers.begin(), snapshot.containers.end(),
                                [id](const securebox::storage::EncryptedContainer& r) { return r.id == id; }) };
    if (id < g_firstContainerId || it == snapshot.containers.end())
    {
        return VaultError::NotFound;
    }

    detail::RecordKeys keys{ *m_crypto, password, key };
    const auto recordKeyOrErr{ keys.forSalt(it->salt) };
    if (std::holds_alternative<VaultError>(recordKeyOrErr))
    {
        return std::get<VaultError>(recordKeyOrErr);
    }
    auto containerOrErr{ Container::decrypt(*m_crypto, *std::get<const KeyMaterial*>(recordKeyOrErr), *it) };
    if (std::holds_alternative<VaultError>(containerOrErr))
    {
        m_audit->record(securebox::log::AuditLevel::Alert, "container.peek", "failure",
                        "id=" + std::to_string(id) + " " + errorDetail(std::get<VaultError>(containerOrErr)));
    }
    return containerOrErr;
}

} // namespace securebox::core
