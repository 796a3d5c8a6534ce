#include "CliSettings.hpp"
#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "securebox/backup/directory/DirectoryBackupGatewayFactory.hpp"
#include "securebox/core/VaultService.hpp"
#include "securebox/crypto/ICryptoProvider.hpp"
#include "securebox/log/AuditLog.hpp"
#include "securebox/storage/sqlite/SqliteStorageRepositoryFactory.hpp"

#include <CLI/CLI.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#if defined(SBOX_ENABLE_NATIVE_CRYPTO)
#include "securebox/crypto/providers/NativeProviderFactory.hpp"
#endif
#if defined(SBOX_ENABLE_OPENSSL)
#include "securebox/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace
{

// monocypher ships Argon2id everywhere; OpenSSL only from 3.2.
[[nodiscard]] std::unique_ptr<securebox::crypto::ICryptoProvider> makeCryptoProvider()
{
#if defined(SBOX_ENABLE_NATIVE_CRYPTO)
    return securebox::crypto::providers::makeNativeCryptoProvider();
#elif defined(SBOX_ENABLE_OPENSSL)
    return securebox::crypto::providers::makeOpenSslCryptoProvider();
#else
#error "securebox needs at least one crypto provider"
#endif
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        CLI::App app{ "SecureBox: encrypted local secrets vault" };

        std::string configArg{ securebox::ui::cli::defaultConfigFile().string() };
        std::string vaultArg;
        bool printPaths{ false };
        bool printVersion{ false };
        app.add_option("-c,--config", configArg, "Configuration file");
        app.add_option("--vault", vaultArg, "Vault file (overrides vault/path)");
        app.add_flag("--print-paths", printPaths, "Print the vault and config file locations and exit");
        app.add_flag("--version", printVersion, "Print the version and exit");
        CLI11_PARSE(app, argc, argv);

        if (printVersion)
        {
            std::cout << "securebox " << securebox::ui::cli::g_kVersion << "\n";
            return 0;
        }

        auto settings{ securebox::ui::cli::loadCliSettings(configArg) };
        if (!vaultArg.empty())
        {
            settings.vaultPath = vaultArg;
        }
        if (printPaths)
        {
            std::cout << "vault:  " << settings.vaultPath.string() << "\n";
            std::cout << "config: " << settings.configFile.string() << "\n";
            return 0;
        }

        securebox::ui::cli::lockProcessMemory();

        auto crypto{ makeCryptoProvider() };
        auto storage{ securebox::storage::sqlite::makeSqliteStorageRepository() };

        std::unique_ptr<securebox::log::IAuditSink> auditSink{};
        if (!settings.auditFile.empty())
        {
            auditSink = securebox::log::makeFileAuditSink(settings.auditFile);
        }
        securebox::core::VaultService service{ *crypto, *storage,
                                               auditSink ? *auditSink : securebox::log::nullAuditSink() };

        std::unique_ptr<securebox::backup::IBackupGateway> gateway{};
        if (!settings.backupDirectory.empty())
        {
            gateway = securebox::backup::makeDirectoryBackupGateway(settings.backupDirectory);
        }

        securebox::ui::cli::InteractiveShell shell{ service, std::move(settings), std::cin, std::cout,
                                                    &securebox::ui::cli::readPassword, gateway.get() };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
