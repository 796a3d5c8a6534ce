#ifndef INCLUDE_SECUREBOX_CORE_VAULTCODEC_HPP
#define INCLUDE_SECUREBOX_CORE_VAULTCODEC_HPP

#include "securebox/crypto/KdfMetadata.hpp"
#include "securebox/security/SecureBuffer.hpp"
#include "securebox/security/SecureString.hpp"
#include "securebox/storage/VaultSnapshot.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securebox::core
{

constexpr std::size_t g_codecPrefixBytes{ 8 };

// "SBOXKEY1" + 8 x u32 LE + salt.
constexpr std::size_t g_keyCheckAadBytes{ g_codecPrefixBytes + (8U * sizeof(std::uint32_t)) +
                                          securebox::crypto::g_kdfSaltBytes };

// "SBOXCID1" + i64 LE container id.
constexpr std::size_t g_containerAadBytes{ g_codecPrefixBytes + sizeof(std::int64_t) };

constexpr std::uint32_t g_containerPayloadVersion{ 1U };

// Binds the full KDF metadata to the key-check record, so editing any persisted parameter fails authentication.
[[nodiscard]] std::array<std::byte, g_keyCheckAadBytes>
encodeKeyCheckAad(const securebox::crypto::KdfMetadata& meta) noexcept;

// Binds a record to its id: a ciphertext moved under another id does not verify.
[[nodiscard]] std::array<std::byte, g_containerAadBytes> encodeContainerAad(std::int64_t id) noexcept;

struct ContainerPayload final
{
    std::string name;
    securebox::security::SecureString data;
};

// "SBXC" | u32 version | u32 nameLen | name | u32 dataLen | data
[[nodiscard]] securebox::security::SecureBuffer encodeContainerPayload(std::string_view name,
                                                                       const securebox::security::SecureString& data);

// std::nullopt on bad magic, unknown version, truncated fields or trailing bytes.
[[nodiscard]] std::optional<ContainerPayload> decodeContainerPayload(std::span<const std::byte> bytes);

// The bytes the vault seal is computed over: format version, key iv, KDF salt, the id counter,
// and (id, salt, iv, tag) of every record in file order.
[[nodiscard]] std::vector<std::byte> encodeSealManifest(const securebox::storage::VaultSnapshot& snapshot);

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_VAULTCODEC_HPP
