#ifndef SECUREBOX_SRC_CORE_VAULTSNAPSHOTOPS_HPP
#define SECUREBOX_SRC_CORE_VAULTSNAPSHOTOPS_HPP

#include "securebox/core/IntegrityReport.hpp"
#include "securebox/core/KeyMaterial.hpp"
#include "securebox/core/Vault.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/security/SecureString.hpp"
#include "securebox/storage/IStorageRepository.hpp"
#include "securebox/storage/VaultSnapshot.hpp"
#include <deque>
#include <filesystem>
#include <span>
#include <variant>
#include <vector>

namespace securebox::core::detail
{

[[nodiscard]] VaultResult<securebox::storage::VaultSnapshot>
loadSnapshotOrError(const securebox::storage::IStorageRepository& storage,
                    const std::filesystem::path& vaultPath) noexcept;

// NotSynced: the file was written but its directory entry may not survive a crash.
enum class WriteOutcome
{
    Durable,
    NotSynced
};

[[nodiscard]] VaultResult<WriteOutcome>
createSnapshotOrError(securebox::storage::IStorageRepository& storage, const std::filesystem::path& vaultPath,
                      const securebox::storage::VaultSnapshot& snapshot) noexcept;

[[nodiscard]] VaultResult<WriteOutcome>
replaceSnapshotOrError(securebox::storage::IStorageRepository& storage, const std::filesystem::path& vaultPath,
                       const securebox::storage::VaultSnapshot& snapshot) noexcept;

// Key record, id counter, records in order, and the seal over all of it.
[[nodiscard]] VaultResult<securebox::storage::VaultSnapshot> buildSnapshot(securebox::crypto::ICryptoProvider& crypto,
                                                                           const KeyMaterial& key,
                                                                           std::span<const VaultEntry> entries,
                                                                           ContainerId nextId);

// Format version, id counter, unique ids, and only the two reserved hidden ids below 1.
[[nodiscard]] bool snapshotShapeValid(const securebox::storage::VaultSnapshot& snapshot);

// True when `key` was derived for exactly this key record (same KDF metadata and iv).
[[nodiscard]] bool keyMatches(const KeyMaterial& key, const securebox::storage::KeyRecord& record) noexcept;

[[nodiscard]] VaultResult<KeyMaterial> deriveSnapshotKey(const securebox::crypto::ICryptoProvider& crypto,
                                                         const securebox::security::SecureString& password,
                                                         const securebox::storage::KeyRecord& record) noexcept;

// Keys for records written under another salt, derived once per salt with the vault's cost parameters.
class RecordKeys final
{
public:
    RecordKeys(const securebox::crypto::ICryptoProvider& crypto, const securebox::security::SecureString& password,
               const KeyMaterial& primary) noexcept
        : m_crypto{ &crypto }, m_password{ &password }, m_primary{ &primary }
    {
    }

    [[nodiscard]] VaultResult<const KeyMaterial*> forSalt(const securebox::crypto::KdfSalt& salt);

private:
    const securebox::crypto::ICryptoProvider* m_crypto;
    const securebox::security::SecureString* m_password;
    const KeyMaterial* m_primary;
    std::deque<KeyMaterial> m_extra;
};

struct Inspection final
{
    IntegrityReport report;
    std::vector<VaultEntry> verified;
};

enum class InspectMode
{
    Strict, // stop at an invalid seal
    Report  // check every record the seal does not rule out
};

// Verifies the key check and seal under `key`, then decrypts every record. Records that fail are
// reported, not returned. A record salt is only trusted under a valid seal, so with a bad seal records
// under another salt fail without a KDF run. Backend failures (not verification failures) come back as errors.
[[nodiscard]] VaultResult<Inspection> inspectSnapshot(securebox::crypto::ICryptoProvider& crypto,
                                                      const securebox::security::SecureString& password,
                                                      const securebox::storage::VaultSnapshot& snapshot,
                                                      const KeyMaterial& key, InspectMode mode);

} // namespace securebox::core::detail

#endif // SECUREBOX_SRC_CORE_VAULTSNAPSHOTOPS_HPP
