#ifndef INCLUDE_SECUREBOX_BACKUP_DIRECTORY_DIRECTORYBACKUPGATEWAYFACTORY_HPP
#define INCLUDE_SECUREBOX_BACKUP_DIRECTORY_DIRECTORYBACKUPGATEWAYFACTORY_HPP

#include "securebox/backup/IBackupGateway.hpp"
#include <filesystem>
#include <memory>

namespace securebox::backup
{

// Mirrors backups into a local directory (a mounted share, a synced folder, tests).
// Credentials are required to be present but are not interpreted.
[[nodiscard]] std::unique_ptr<IBackupGateway> makeDirectoryBackupGateway(std::filesystem::path root);

} // namespace securebox::backup

#endif // INCLUDE_SECUREBOX_BACKUP_DIRECTORY_DIRECTORYBACKUPGATEWAYFACTORY_HPP
