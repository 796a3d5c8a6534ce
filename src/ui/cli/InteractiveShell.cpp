#include "InteractiveShell.hpp"
#include "ConsoleUtils.hpp"
#include "Tokenizer.hpp"
#include "securebox/security/MemoryWiper.hpp"
#include "securebox/security/ScopeWipe.hpp"
#include "securebox/security/SecureEquals.hpp"

#include <CLI/CLI.hpp>
#include <exception>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace securebox::ui::cli
{

namespace
{

[[nodiscard]] const char* statusLabel(securebox::core::ContainerStatus status) noexcept
{
    switch (status)
    {
    case securebox::core::ContainerStatus::Verified:
        return "ok";
    case securebox::core::ContainerStatus::IntegrityFailed:
        return "INTEGRITY FAILED";
    case securebox::core::ContainerStatus::CorruptFormat:
        return "CORRUPT";
    }
    return "?";
}

} // namespace

InteractiveShell::InteractiveShell(securebox::core::VaultService& service, CliSettings settings, std::istream& in,
                                   std::ostream& out, PasswordReader pwdReader,
                                   securebox::backup::IBackupGateway* gateway)
    : m_service(service), m_settings(std::move(settings)), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader)),
      m_gateway(gateway)
{
}

int InteractiveShell::run()
{
    m_out << "SecureBox " << g_kVersion << "\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        if (m_vault.has_value())
        {
            m_out << "sbox(" << m_vault->path().filename().string() << ")> ";
        }
        else
        {
            m_out << "sbox> ";
        }

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (!line.empty())
        {
            processLine(line);
        }
        securebox::security::secureWipeString(line);
    }

    if (m_vault.has_value())
    {
        doClose();
    }
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    auto tokens = Tokenizer::tokenize(line);
    if (!tokens.has_value())
    {
        m_out << "Syntax Error: unterminated quote\n";
        return;
    }
    std::vector<std::string> userArgs{ std::move(*tokens) };
    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("sbox");
    args.insert(args.end(), userArgs.begin(), userArgs.end());
    securebox::security::secureWipeStrings(userArgs);

    CLI::App app{ "SecureBox shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Close the vault and leave the shell")->alias("quit")->callback([this]() {
        if (m_vault.has_value())
        {
            doClose();
        }
        m_running = false;
    });
    app.add_subcommand("version", "Print the version")->callback([this]() {
        m_out << "securebox " << g_kVersion << "\n";
    });
    app.add_subcommand("paths", "Print the vault and config file locations")->callback([this]() { doPaths(); });

    std::string pathArg;
    bool recoverFlag{ false };
    auto* subOpen = app.add_subcommand("open", "Unlock a vault (default: the configured vault)");
    subOpen->add_option("path", pathArg, "Vault file");
    subOpen->add_flag("--recover", recoverFlag, "Load whatever verifies and report the rest");
    subOpen->callback([&]() { doOpen(pathArg, recoverFlag); });

    auto* subCreate = app.add_subcommand("create", "Create a new vault (default: the configured vault)");
    subCreate->add_option("path", pathArg, "Vault file");
    subCreate->callback([&]() { doCreate(pathArg); });

    app.add_subcommand("close", "Lock the open vault")->callback([this]() { doClose(); });
    app.add_subcommand("ls", "List containers")->callback([this]() { doList(); });

    std::int64_t idArg{ 0 };
    auto* subView = app.add_subcommand("view", "Show one container (without opening: only that record is checked)");
    subView->add_option("id", idArg, "Container id")->required();
    subView->callback([&]() { doView(idArg); });

    std::string nameArg;
    std::string textArg;
    auto* subAdd = app.add_subcommand("add", "Add a container (prompts for the text if --text is absent)");
    subAdd->add_option("--name", nameArg, "Container name");
    auto* addText = subAdd->add_option("--text", textArg, "Container text");
    subAdd->callback([&]() {
        doAdd(nameArg, addText->count() > 0 ? std::optional<std::string>{ textArg } : std::nullopt);
    });

    auto* subEdit = app.add_subcommand("edit", "Change the name and/or text of a container");
    subEdit->add_option("id", idArg, "Container id")->required();
    auto* editName = subEdit->add_option("--name", nameArg, "New name");
    auto* editText = subEdit->add_option("--text", textArg, "New text");
    subEdit->callback([&]() {
        doEdit(idArg, editName->count() > 0 ? std::optional<std::string>{ nameArg } : std::nullopt,
               editText->count() > 0 ? std::optional<std::string>{ textArg } : std::nullopt);
    });

    auto* subRm = app.add_subcommand("rm", "Delete a container");
    subRm->add_option("id", idArg, "Container id")->required();
    subRm->callback([&]() { doRm(idArg); });

    app.add_subcommand("verify", "Re-read the vault file and verify every record")->callback([this]() {
        doVerify();
    });
    app.add_subcommand("passwd", "Change the master password")->callback([this]() { doPasswd(); });
    app.add_subcommand("rotate", "Re-encrypt everything under fresh keys")->callback([this]() { doRotate(); });

    std::string credentialsFile;
    std::string tokenFile;
    auto* subCreds = app.add_subcommand("set-credentials", "Store backup credentials from a file");
    subCreds->add_option("file", credentialsFile, "Credentials file")->required();
    subCreds->add_option("--token", tokenFile, "Token file");
    subCreds->callback([&]() { doSetCredentials(credentialsFile, tokenFile); });

    app.add_subcommand("sign-out", "Forget the backup token")->callback([this]() { doSignOut(); });
    app.add_subcommand("upload", "Upload the vault file as a backup")->callback([this]() { doUpload(); });

    std::string destArg;
    auto* subDownload = app.add_subcommand("download", "Download the backup to a file");
    subDownload->add_option("destination", destArg, "Target file (never the open vault)")->required();
    subDownload->callback([&]() { doDownload(destArg); });

    app.add_subcommand("delete-backup", "Delete the remote backup")->callback([this]() { doDeleteBackup(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (auto& arg : args)
        {
            argv.push_back(arg.data());
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        m_out << "Error: " << e.what() << "\n";
    }

    securebox::security::secureWipeStrings(args);
    securebox::security::secureWipeString(textArg);
}

bool InteractiveShell::requireOpen()
{
    if (!m_vault.has_value())
    {
        m_out << "Error: no vault is open.\n";
        return false;
    }
    return true;
}

bool InteractiveShell::requireGateway()
{
    if (m_gateway == nullptr)
    {
        m_out << "Error: no backup directory is configured.\n";
        return false;
    }
    return true;
}

std::optional<securebox::security::SecureString> InteractiveShell::readNewPassword()
{
    auto p1 = m_pwdReader("New Password: ");
    auto p2 = m_pwdReader("Confirm Password: ");
    auto wipeP2 = securebox::security::scopeWipe(p2);

    if (!securebox::security::secureEquals(p1, p2))
    {
        securebox::security::secureRelease(p1);
        m_out << "Error: passwords do not match.\n";
        return std::nullopt;
    }
    return p1;
}

void InteractiveShell::printError(securebox::core::VaultError error)
{
    m_out << "Error: " << securebox::core::toString(error) << ".\n";
}

void InteractiveShell::printReport(const securebox::core::IntegrityReport& report)
{
    m_out << "key check: " << (report.keyCheckValid ? "ok" : "FAILED") << "\n";
    m_out << "seal: " << (report.sealValid ? "ok" : "FAILED") << "\n";
    for (const auto& check : report.containers)
    {
        m_out << "  [" << check.id << "] " << statusLabel(check.status) << "\n";
    }

    if (report.passed())
    {
        m_out << "Integrity OK.\n";
        return;
    }
    m_out << "Integrity FAILED";
    const auto failed{ report.failedIds() };
    if (!failed.empty())
    {
        m_out << " for ids:";
        for (const auto id : failed)
        {
            m_out << " " << id;
        }
    }
    m_out << ".\n";
}

// --- Handlers ---

void InteractiveShell::doOpen(const std::string& path, bool recover)
{
    if (m_vault.has_value())
    {
        m_out << "Error: a vault is already open; close it first.\n";
        return;
    }

    const std::filesystem::path vaultPath{ path.empty() ? m_settings.vaultPath : std::filesystem::path{ path } };
    if (!m_service.vaultExists(vaultPath))
    {
        m_out << "Error: no vault at " << vaultPath.string() << "\n";
        return;
    }

    auto pass = m_pwdReader("Password: ");
    auto wipePass = securebox::security::scopeWipe(pass);

    if (recover)
    {
        auto result = m_service.recoverVault(vaultPath, pass);
        if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
        {
            printError(*err);
            return;
        }
        auto& recovered{ std::get<securebox::core::RecoveredVault>(result) };
        printReport(recovered.report);
        m_vault = std::move(recovered.vault);
        m_out << "Vault opened in recovery mode; the next change drops unverified containers.\n";
        return;
    }

    auto result = m_service.openVault(vaultPath, pass);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_vault = std::move(std::get<securebox::core::Vault>(result));
    m_out << "Vault opened.\n";
}

void InteractiveShell::doCreate(const std::string& path)
{
    if (m_vault.has_value())
    {
        m_out << "Error: a vault is already open; close it first.\n";
        return;
    }

    const std::filesystem::path vaultPath{ path.empty() ? m_settings.vaultPath : std::filesystem::path{ path } };
    if (m_service.vaultExists(vaultPath))
    {
        m_out << "Error: vault already exists at " << vaultPath.string() << "\n";
        return;
    }

    auto pass = readNewPassword();
    if (!pass.has_value())
    {
        return;
    }
    auto wipePass = securebox::security::scopeWipe(*pass);

    auto result = m_service.createVault(vaultPath, *pass, m_settings.kdf);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_vault = std::move(std::get<securebox::core::Vault>(result));
    m_out << "Vault created.\n";
}

void InteractiveShell::doClose()
{
    if (!requireOpen())
    {
        return;
    }

    if (m_settings.autoUpload && m_gateway != nullptr)
    {
        const auto result = m_vault->uploadBackup(*m_gateway);
        if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
        {
            printError(*err);
        }
        else
        {
            m_out << "Backup uploaded.\n";
        }
    }

    m_vault->lock();
    m_vault.reset();
    m_out << "Vault closed.\n";
}

void InteractiveShell::doList()
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_vault->containers();
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }

    const auto& containers{ std::get<std::vector<securebox::core::Container>>(result) };
    if (containers.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& c : containers)
    {
        m_out << "  [" << c.id() << "] " << c.name() << "\n";
    }
}

void InteractiveShell::doView(std::int64_t id)
{
    securebox::core::VaultResult<securebox::core::Container> result{ securebox::core::VaultError::Locked };
    if (m_vault.has_value())
    {
        result = m_vault->getContainer(id);
    }
    else
    {
        if (!m_service.vaultExists(m_settings.vaultPath))
        {
            m_out << "Error: no vault at " << m_settings.vaultPath.string() << "\n";
            return;
        }
        auto pass = m_pwdReader("Password: ");
        auto wipePass = securebox::security::scopeWipe(pass);
        result = m_service.peekContainer(m_settings.vaultPath, pass, id);
    }

    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    const auto& c{ std::get<securebox::core::Container>(result) };
    m_out << "[" << c.id() << "] " << c.name() << "\n" << c.dataView() << "\n";
}

void InteractiveShell::doAdd(const std::string& name, std::optional<std::string> text)
{
    if (!requireOpen())
    {
        return;
    }

    auto data = text.has_value() ? securebox::security::secureStringFrom(*text) : m_pwdReader("Text: ");
    auto wipeData = securebox::security::scopeWipe(data);
    if (text.has_value())
    {
        securebox::security::secureWipeString(*text);
    }

    const auto result = m_vault->addContainer(name, data);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Container " << std::get<securebox::core::Container>(result).id() << " added.\n";
}

void InteractiveShell::doEdit(std::int64_t id, std::optional<std::string> name, std::optional<std::string> text)
{
    if (!requireOpen())
    {
        return;
    }
    if (!name.has_value() && !text.has_value())
    {
        m_out << "Error: nothing to change (use --name and/or --text).\n";
        return;
    }

    std::optional<securebox::security::SecureString> data{};
    if (text.has_value())
    {
        data = securebox::security::secureStringFrom(*text);
        securebox::security::secureWipeString(*text);
    }

    const auto result = m_vault->updateContainer(id, std::move(name), std::move(data));
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Container " << id << " updated.\n";
}

void InteractiveShell::doRm(std::int64_t id)
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_vault->removeContainer(id);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Container " << id << " removed.\n";
}

void InteractiveShell::doVerify()
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_vault->verifyIntegrity();
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    printReport(std::get<securebox::core::IntegrityReport>(result));
}

void InteractiveShell::doPasswd()
{
    if (!requireOpen())
    {
        return;
    }

    auto pass = readNewPassword();
    if (!pass.has_value())
    {
        return;
    }
    auto wipePass = securebox::security::scopeWipe(*pass);

    const auto result = m_vault->changeMasterPassword(*pass);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Master password changed.\n";
}

void InteractiveShell::doRotate()
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_vault->regenerateKeys();
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Keys rotated.\n";
}

void InteractiveShell::doSetCredentials(const std::string& credentialsFile, const std::string& tokenFile)
{
    if (!requireOpen())
    {
        return;
    }

    auto credentials = readSecretFile(credentialsFile);
    std::optional<securebox::security::SecureString> token{};
    if (!tokenFile.empty())
    {
        token = readSecretFile(tokenFile);
    }

    const auto result = m_vault->setCloudCredentials(std::move(credentials), std::move(token));
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Backup credentials stored.\n";
}

void InteractiveShell::doSignOut()
{
    if (!requireOpen())
    {
        return;
    }

    const auto result = m_vault->signOut();
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Signed out.\n";
}

void InteractiveShell::doUpload()
{
    if (!requireOpen() || !requireGateway())
    {
        return;
    }

    const auto result = m_vault->uploadBackup(*m_gateway);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Backup uploaded as " << m_vault->backupName() << ".\n";
}

void InteractiveShell::doDownload(const std::string& destination)
{
    if (!requireOpen() || !requireGateway())
    {
        return;
    }

    const auto result = m_vault->downloadBackup(*m_gateway, destination);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Backup downloaded to " << destination << "; open it to verify.\n";
}

void InteractiveShell::doDeleteBackup()
{
    if (!requireOpen() || !requireGateway())
    {
        return;
    }

    const auto result = m_vault->deleteBackup(*m_gateway);
    if (const auto* err = std::get_if<securebox::core::VaultError>(&result))
    {
        printError(*err);
        return;
    }
    m_out << "Remote backup deleted.\n";
}

void InteractiveShell::doPaths()
{
    m_out << "vault:  " << m_settings.vaultPath.string() << "\n";
    m_out << "config: " << m_settings.configFile.string() << "\n";
    if (!m_settings.backupDirectory.empty())
    {
        m_out << "backup: " << m_settings.backupDirectory.string() << "\n";
    }
}

} // namespace securebox::ui::cli
