#ifndef INCLUDE_SECUREBOX_BACKUP_IBACKUPGATEWAY_HPP
#define INCLUDE_SECUREBOX_BACKUP_IBACKUPGATEWAY_HPP

#include "securebox/security/SecureString.hpp"
#include <filesystem>
#include <string_view>

namespace securebox::backup
{

// Opaque blobs handed to the remote client unmodified (e.g. a service-account JSON and an OAuth token).
struct BackupCredentials final
{
    securebox::security::SecureString credentials;
    securebox::security::SecureString token;
};

// Remote blob store for off-site copies of the vault file. The vault never inspects remote content.
// Implementations report failure by returning false or throwing; callers never retry.
class IBackupGateway
{
public:
    IBackupGateway() = default;
    IBackupGateway(const IBackupGateway&) = delete;
    IBackupGateway& operator=(const IBackupGateway&) = delete;
    IBackupGateway(IBackupGateway&&) = delete;
    IBackupGateway& operator=(IBackupGateway&&) = delete;
    virtual ~IBackupGateway() = default;

    [[nodiscard]] virtual bool upload(const BackupCredentials& creds, const std::filesystem::path& localPath,
                                      std::string_view remoteName) = 0;

    [[nodiscard]] virtual bool download(const BackupCredentials& creds, std::string_view remoteName,
                                        const std::filesystem::path& localPath) = 0;

    [[nodiscard]] virtual bool remove(const BackupCredentials& creds, std::string_view remoteName) = 0;
};

} // namespace securebox::backup

#endif // INCLUDE_SECUREBOX_BACKUP_IBACKUPGATEWAY_HPP
