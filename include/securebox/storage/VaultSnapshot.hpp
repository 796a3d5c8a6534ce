#ifndef INCLUDE_SECUREBOX_STORAGE_VAULTSNAPSHOT_HPP
#define INCLUDE_SECUREBOX_STORAGE_VAULTSNAPSHOT_HPP

#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/crypto/KdfMetadata.hpp"
#include <cstdint>
#include <vector>

namespace securebox::storage
{

constexpr std::uint32_t g_vaultFormatVersion{ 1U };

// One container at rest. box.nonce is the per-encryption iv, box.tag the Poly1305 MAC.
// `salt` names the KDF salt of the key that produced the record.
struct EncryptedContainer final
{
    std::int64_t id{};
    securebox::crypto::KdfSalt salt{};
    securebox::crypto::AeadBox box{};
};

// keyCheck.nonce doubles as the persisted KeyMaterial iv.
struct KeyRecord final
{
    securebox::crypto::KdfMetadata kdf{};
    securebox::crypto::AeadBox keyCheck{};
};

// Everything the vault file holds. Records keep their on-disk order.
struct VaultSnapshot final
{
    std::uint32_t formatVersion{ g_vaultFormatVersion };
    KeyRecord key{};
    std::int64_t nextContainerId{ 1 };
    securebox::crypto::Mac seal{};
    std::vector<EncryptedContainer> containers;
};

} // namespace securebox::storage

#endif // INCLUDE_SECUREBOX_STORAGE_VAULTSNAPSHOT_HPP
