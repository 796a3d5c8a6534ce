#include "VaultSnapshotOps.hpp"

#include "securebox/core/VaultCodec.hpp"
#include "securebox/security/SecureEquals.hpp"
#include "securebox/storage/StorageErrors.hpp"
#include <algorithm>
#include <exception>
#include <set>

namespace securebox::core::detail
{

[[nodiscard]] VaultResult<securebox::storage::VaultSnapshot>
loadSnapshotOrError(const securebox::storage::IStorageRepository& storage,
                    const std::filesystem::path& vaultPath) noexcept
{
    try
    {
        return storage.loadVault(vaultPath);
    }
    catch (const securebox::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const securebox::storage::CorruptVaultFile&)
    {
        return VaultError::CorruptFormat;
    }
    catch (const std::exception&)
    {
        return VaultError::StorageError;
    }
}

[[nodiscard]] VaultResult<WriteOutcome>
createSnapshotOrError(securebox::storage::IStorageRepository& storage, const std::filesystem::path& vaultPath,
                      const securebox::storage::VaultSnapshot& snapshot) noexcept
{
    try
    {
        storage.createVault(vaultPath, snapshot);
        return WriteOutcome::Durable;
    }
    catch (const securebox::storage::UnsyncedWrite&)
    {
        return WriteOutcome::NotSynced;
    }
    catch (const securebox::storage::VaultAlreadyExists&)
    {
        return VaultError::AlreadyExists;
    }
    catch (const std::exception&)
    {
        return VaultError::StorageError;
    }
}

[[nodiscard]] VaultResult<WriteOutcome>
replaceSnapshotOrError(securebox::storage::IStorageRepository& storage, const std::filesystem::path& vaultPath,
                       const securebox::storage::VaultSnapshot& snapshot) noexcept
{
    try
    {
        storage.replaceVault(vaultPath, snapshot);
        return WriteOutcome::Durable;
    }
    catch (const securebox::storage::UnsyncedWrite&)
    {
        return WriteOutcome::NotSynced;
    }
    catch (const securebox::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const std::exception&)
    {
        return VaultError::StorageError;
    }
}

[[nodiscard]] VaultResult<securebox::storage::VaultSnapshot> buildSnapshot(securebox::crypto::ICryptoProvider& crypto,
                                                                           const KeyMaterial& key,
                                                                           std::span<const VaultEntry> entries,
                                                                           ContainerId nextId)
{
    securebox::storage::VaultSnapshot snapshot{};
    snapshot.key.kdf = key.kdf();

    auto checkOrErr{ key.sealKeyCheck(crypto) };
    if (std::holds_alternative<VaultError>(checkOrErr))
    {
        return std::get<VaultError>(checkOrErr);
    }
    snapshot.key.keyCheck = std::get<securebox::crypto::AeadBox>(std::move(checkOrErr));
    snapshot.nextContainerId = nextId;

    snapshot.containers.reserve(entries.size());
    for (const auto& entry : entries)
    {
        snapshot.containers.push_back(entry.record);
    }

    const auto manifest{ encodeSealManifest(snapshot) };
    const auto sealOrErr{ key.sealManifest(crypto, manifest) };
    if (std::holds_alternative<VaultError>(sealOrErr))
    {
        return std::get<VaultError>(sealOrErr);
    }
    snapshot.seal = std::get<securebox::crypto::Mac>(sealOrErr);
    return snapshot;
}

[[nodiscard]] bool snapshotShapeValid(const securebox::storage::VaultSnapshot& snapshot)
{
    if (snapshot.formatVersion != securebox::storage::g_vaultFormatVersion ||
        snapshot.nextContainerId < g_firstContainerId)
    {
        return false;
    }

    std::set<ContainerId> seen{};
    for (const auto& record : snapshot.containers)
    {
        const bool reserved{ record.id == g_credentialContainerId || record.id == g_tokenContainerId };
        const bool allocated{ record.id >= g_firstContainerId && record.id < snapshot.nextContainerId };
        if (!reserved && !allocated)
        {
            return false;
        }
        if (!seen.insert(record.id).second)
        {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool keyMatches(const KeyMaterial& key, const securebox::storage::KeyRecord& record) noexcept
{
    return !key.empty() && encodeKeyCheckAad(key.kdf()) == encodeKeyCheckAad(record.kdf) &&
           key.iv() == record.keyCheck.nonce;
}

[[nodiscard]] VaultResult<KeyMaterial> deriveSnapshotKey(const securebox::crypto::ICryptoProvider& crypto,
                                                         const securebox::security::SecureString& password,
                                                         const securebox::storage::KeyRecord& record) noexcept
{
    return KeyMaterial::derive(crypto, password, record.kdf, record.keyCheck.nonce);
}

[[nodiscard]] VaultResult<const KeyMaterial*> RecordKeys::forSalt(const securebox::crypto::KdfSalt& salt)
{
    if (m_primary->salt() == salt)
    {
        return m_primary;
    }
    for (const auto& key : m_extra)
    {
        if (key.salt() == salt)
        {
            return &key;
        }
    }

    auto meta{ m_primary->kdf() };
    meta.salt = salt;
    auto keyOrErr{ KeyMaterial::derive(*m_crypto, *m_password, meta, KeyIv{}) };
    if (std::holds_alternative<VaultError>(keyOrErr))
    {
        return std::get<VaultError>(keyOrErr);
    }
    m_extra.push_back(std::get<KeyMaterial>(std::move(keyOrErr)));
    return &m_extra.back();
}

[[nodiscard]] VaultResult<Inspection> inspectSnapshot(securebox::crypto::ICryptoProvider& crypto,
                                                      const securebox::security::SecureString& password,
                                                      const securebox::storage::VaultSnapshot& snapshot,
                                                      const KeyMaterial& key, InspectMode mode)
{
    Inspection out{};

    const auto checkOrErr{ key.verifyKeyCheck(crypto, snapshot.key.keyCheck) };
    if (std::holds_alternative<VaultError>(checkOrErr) &&
        std::get<VaultError>(checkOrErr) != VaultError::AuthFailed)
    {
        return std::get<VaultError>(checkOrErr);
    }
    out.report.keyCheckValid = std::holds_alternative<std::monostate>(checkOrErr);

    if (!out.report.keyCheckValid)
    {
        for (const auto& record : snapshot.containers)
        {
            out.report.containers.push_back(
                ContainerCheck{ .id = record.id, .status = ContainerStatus::IntegrityFailed });
        }
        return out;
    }

    const auto manifest{ encodeSealManifest(snapshot) };
    const auto sealOrErr{ key.sealManifest(crypto, manifest) };
    if (std::holds_alternative<VaultError>(sealOrErr))
    {
        return std::get<VaultError>(sealOrErr);
    }
    const auto& seal{ std::get<securebox::crypto::Mac>(sealOrErr) };
    out.report.sealValid = securebox::security::secureEquals(seal, snapshot.seal);
    if (!out.report.sealValid && mode == InspectMode::Strict)
    {
        return out;
    }

    RecordKeys keys{ crypto, password, key };
    for (const auto& record : snapshot.containers)
    {
        if (!out.report.sealValid && record.salt != key.salt())
        {
            out.report.containers.push_back(
                ContainerCheck{ .id = record.id, .status = ContainerStatus::IntegrityFailed });
            continue;
        }

        const auto recordKeyOrErr{ keys.forSalt(record.salt) };
        if (std::holds_alternative<VaultError>(recordKeyOrErr))
        {
            return std::get<VaultError>(recordKeyOrErr);
        }

        auto containerOrErr{ Container::decrypt(crypto, *std::get<const KeyMaterial*>(recordKeyOrErr), record) };
        ContainerStatus status{ ContainerStatus::Verified };
        if (std::holds_alternative<VaultError>(containerOrErr))
        {
            switch (std::get<VaultError>(containerOrErr))
            {
            case VaultError::IntegrityFailed:
                status = ContainerStatus::IntegrityFailed;
                break;
            case VaultError::CorruptFormat:
                status = ContainerStatus::CorruptFormat;
                break;
            default:
                return std::get<VaultError>(containerOrErr);
            }
        }
        else
        {
            out.verified.push_back(
                VaultEntry{ .container = std::get<Container>(std::move(containerOrErr)), .record = record });
        }
        out.report.containers.push_back(ContainerCheck{ .id = record.id, .status = status });
    }

    return out;
}

} // namespace securebox::core::detail
