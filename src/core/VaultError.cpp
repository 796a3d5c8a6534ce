#include "securebox/core/VaultError.hpp"

namespace securebox::core
{

[[nodiscard]] std::string_view toString(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::RandomFailed:
        return "random generator failure";
    case VaultError::StorageError:
        return "storage error";
    case VaultError::CorruptFormat:
        return "vault file is corrupt or has an unsupported format";
    case VaultError::NotFound:
        return "not found";
    case VaultError::AlreadyExists:
        return "vault already exists";
    case VaultError::UnsupportedKdfMetadata:
        return "unsupported key derivation parameters";
    case VaultError::EmptyPassword:
        return "password must not be empty";
    case VaultError::AuthFailed:
        return "cannot unlock vault (wrong password or tampered file)";
    case VaultError::IntegrityFailed:
        return "container failed integrity verification";
    case VaultError::CryptoError:
        return "cryptographic backend failure";
    case VaultError::BackupNotConfigured:
        return "backup credentials are not set";
    case VaultError::BackupTransportFailed:
        return "backup transfer failed";
    case VaultError::InvalidArgument:
        return "invalid argument";
    case VaultError::Locked:
        return "vault is locked";
    }
    return "unknown error";
}

} // namespace securebox::core
