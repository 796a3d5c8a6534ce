#ifndef SECUREBOX_UI_CLI_INTERACTIVESHELL_HPP
#define SECUREBOX_UI_CLI_INTERACTIVESHELL_HPP

#include "CliSettings.hpp"
#include "securebox/backup/IBackupGateway.hpp"
#include "securebox/core/IntegrityReport.hpp"
#include "securebox/core/Vault.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/core/VaultService.hpp"
#include "securebox/security/SecureString.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace securebox::ui::cli
{

constexpr const char* g_kVersion{ "v0.1" };

// In tests: returns a pre-determined string.
using PasswordReader = std::function<securebox::security::SecureString(const std::string&)>;

class InteractiveShell final
{
public:
    // `gateway` may be null when no backup target is configured.
    InteractiveShell(securebox::core::VaultService& service, CliSettings settings, std::istream& in,
                     std::ostream& out, PasswordReader pwdReader, securebox::backup::IBackupGateway* gateway);

    int run();

private:
    securebox::core::VaultService& m_service;
    CliSettings m_settings;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    securebox::backup::IBackupGateway* m_gateway;

    std::optional<securebox::core::Vault> m_vault;
    bool m_running{ true };

    void processLine(const std::string& line);

    [[nodiscard]] bool requireOpen();
    [[nodiscard]] bool requireGateway();
    [[nodiscard]] std::optional<securebox::security::SecureString> readNewPassword();
    void printError(securebox::core::VaultError error);
    void printReport(const securebox::core::IntegrityReport& report);

    void doOpen(const std::string& path, bool recover);
    void doCreate(const std::string& path);
    void doClose();
    void doList();
    void doView(std::int64_t id);
    void doAdd(const std::string& name, std::optional<std::string> text);
    void doEdit(std::int64_t id, std::optional<std::string> name, std::optional<std::string> text);
    void doRm(std::int64_t id);
    void doVerify();
    void doPasswd();
    void doRotate();
    void doSetCredentials(const std::string& credentialsFile, const std::string& tokenFile);
    void doSignOut();
    void doUpload();
    void doDownload(const std::string& destination);
    void doDeleteBackup();
    void doPaths();
};

} // namespace securebox::ui::cli

#endif // SECUREBOX_UI_CLI_INTERACTIVESHELL_HPP
