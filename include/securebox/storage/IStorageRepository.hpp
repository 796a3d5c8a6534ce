#ifndef INCLUDE_SECUREBOX_STORAGE_ISTORAGEREPOSITORY_HPP
#define INCLUDE_SECUREBOX_STORAGE_ISTORAGEREPOSITORY_HPP

#include "securebox/storage/VaultSnapshot.hpp"
#include <filesystem>

namespace securebox::storage
{

class IStorageRepository
{
public:
    IStorageRepository() = default;
    IStorageRepository(const IStorageRepository&) = delete;
    IStorageRepository& operator=(const IStorageRepository&) = delete;
    IStorageRepository(IStorageRepository&&) = delete;
    IStorageRepository& operator=(IStorageRepository&&) = delete;
    virtual ~IStorageRepository() = default;

    [[nodiscard]] virtual bool vaultExists(const std::filesystem::path& vaultPath) const = 0;

    // Writes the initial file. Throws VaultAlreadyExists if anything exists at `vaultPath`.
    // UnsyncedWrite from either writer means the file was written.
    virtual void createVault(const std::filesystem::path& vaultPath, const VaultSnapshot& snapshot) = 0;

    // Throws VaultNotFound or CorruptVaultFile; other failures are std::runtime_error.
    [[nodiscard]] virtual VaultSnapshot loadVault(const std::filesystem::path& vaultPath) const = 0;

    // Replaces the whole file atomically: either the new snapshot is in place or the old file is untouched.
    virtual void replaceVault(const std::filesystem::path& vaultPath, const VaultSnapshot& snapshot) = 0;
};

} // namespace securebox::storage

#endif // INCLUDE_SECUREBOX_STORAGE_ISTORAGEREPOSITORY_HPP
