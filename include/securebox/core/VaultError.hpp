#ifndef INCLUDE_SECUREBOX_CORE_VAULTERROR_HPP
#define INCLUDE_SECUREBOX_CORE_VAULTERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace securebox::core
{

enum class VaultError : std::uint8_t
{
    RandomFailed,
    StorageError,
    CorruptFormat,
    NotFound,
    AlreadyExists,
    UnsupportedKdfMetadata,
    EmptyPassword,
    AuthFailed,
    IntegrityFailed,
    CryptoError,
    BackupNotConfigured,
    BackupTransportFailed,
    InvalidArgument,
    Locked,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

// Short human-readable message for front ends. Never includes secret material.
[[nodiscard]] std::string_view toString(VaultError error) noexcept;

} // namespace securebox::core

#endif // INCLUDE_SECUREBOX_CORE_VAULTERROR_HPP
