#include "securebox/backup/directory/DirectoryBackupGatewayFactory.hpp"
#include <string>
#include <system_error>
#include <utility>

namespace securebox::backup
{
namespace
{

[[nodiscard]] bool isPlainName(std::string_view name) noexcept
{
    if (name.empty() || name == "." || name == "..")
    {
        return false;
    }
    return name.find('/') == std::string_view::npos && name.find('\\') == std::string_view::npos;
}

[[nodiscard]] bool hasCredentials(const BackupCredentials& creds) noexcept
{
    return !creds.credentials.empty() && !creds.token.empty();
}

// Copies through a sibling temporary so the destination is either the old or the complete new file.
[[nodiscard]] bool copyReplacing(const std::filesystem::path& from, const std::filesystem::path& to)
{
    std::error_code ec{};
    if (!std::filesystem::is_regular_file(from, ec))
    {
        return false;
    }

    auto tmp{ to };
    tmp += ".tmp";
    std::filesystem::copy_file(from, tmp, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
    {
        std::error_code cleanup{};
        std::filesystem::remove(tmp, cleanup);
        return false;
    }
    std::filesystem::rename(tmp, to, ec);
    if (ec)
    {
        std::error_code cleanup{};
        std::filesystem::remove(tmp, cleanup);
        return false;
    }
    return true;
}

class DirectoryBackupGateway final : public IBackupGateway
{
public:
    explicit DirectoryBackupGateway(std::filesystem::path root) noexcept : m_root{ std::move(root) }
    {
    }

    [[nodiscard]] bool upload(const BackupCredentials& creds, const std::filesystem::path& localPath,
                              std::string_view remoteName) override
    {
        if (!hasCredentials(creds) || !isPlainName(remoteName))
        {
            return false;
        }
        std::error_code ec{};
        std::filesystem::create_directories(m_root, ec);
        if (ec)
        {
            return false;
        }
        return copyReplacing(localPath, m_root / std::string{ remoteName });
    }

    [[nodiscard]] bool download(const BackupCredentials& creds, std::string_view remoteName,
                                const std::filesystem::path& localPath) override
    {
        if (!hasCredentials(creds) || !isPlainName(remoteName))
        {
            return false;
        }
        return copyReplacing(m_root / std::string{ remoteName }, localPath);
    }

    [[nodiscard]] bool remove(const BackupCredentials& creds, std::string_view remoteName) override
    {
        if (!hasCredentials(creds) || !isPlainName(remoteName))
        {
            return false;
        }
        std::error_code ec{};
        const bool removed{ std::filesystem::remove(m_root / std::string{ remoteName }, ec) };
        return removed && !ec;
    }

private:
    std::filesystem::path m_root;
};

} // namespace

[[nodiscard]] std::unique_ptr<IBackupGateway> makeDirectoryBackupGateway(std::filesystem::path root)
{
    return std::make_unique<DirectoryBackupGateway>(std::move(root));
}

} // namespace securebox::backup
