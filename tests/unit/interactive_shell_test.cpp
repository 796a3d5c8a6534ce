#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "InteractiveShell.hpp"
#include "securebox/backup/directory/DirectoryBackupGatewayFactory.hpp"
#include "securebox/core/VaultService.hpp"
#include "securebox/storage/sqlite/SqliteStorageRepositoryFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include "test_utils/VaultTestSupport.hpp"

#include <deque>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using ::testing::HasSubstr;
using ::testing::Not;

class InteractiveShellTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.valid());
        m_settings.configFile = m_dir.path() / "securebox.conf";
        m_settings.vaultPath = m_dir.path() / "default.db";
        m_settings.kdf = securebox::test_utils::kdfParamsForVaultTests(*m_crypto);
    }

    // Answers prompts in order; "pass123" once the script runs out.
    [[nodiscard]] securebox::ui::cli::PasswordReader scriptedReader()
    {
        return [this](const std::string& prompt) {
            m_prompts.push_back(prompt);
            if (m_answers.empty())
            {
                return securebox::security::secureStringFrom("pass123");
            }
            auto next{ m_answers.front() };
            m_answers.pop_front();
            return securebox::security::secureStringFrom(next);
        };
    }

    std::string runShell(securebox::backup::IBackupGateway* gateway = nullptr)
    {
        securebox::ui::cli::InteractiveShell shell(*m_service, m_settings, m_inContent, m_outContent,
                                                   scriptedReader(), gateway);
        EXPECT_EQ(shell.run(), 0);
        return m_outContent.str();
    }

    securebox::test_utils::TempDir m_dir{ "shell_test_" };
    std::unique_ptr<securebox::crypto::ICryptoProvider> m_crypto{ securebox::test_utils::makeTestCryptoProvider() };
    std::unique_ptr<securebox::storage::IStorageRepository> m_storage{
        securebox::storage::sqlite::makeSqliteStorageRepository()
    };
    std::unique_ptr<securebox::core::VaultService> m_service{
        std::make_unique<securebox::core::VaultService>(*m_crypto, *m_storage)
    };
    securebox::ui::cli::CliSettings m_settings;

    std::deque<std::string> m_answers;
    std::vector<std::string> m_prompts;
    std::stringstream m_inContent;
    std::stringstream m_outContent;
};

TEST_F(InteractiveShellTest, CompleteSessionFlow)
{
    const fs::path vaultPath{ m_dir.path() / "my_vault.db" };

    m_inContent << "create " << vaultPath.string() << "\n";
    m_inContent << "add --name \"Bank PIN\" --text 1234\n";
    m_inContent << "add --name Notes\n";
    m_inContent << "ls\n";
    m_inContent << "view 1\n";
    m_inContent << "verify\n";
    m_inContent << "close\n";
    m_inContent << "exit\n";
    m_answers = { "pass123", "pass123", "typed at the prompt" };

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("SecureBox v0.1"));
    EXPECT_THAT(output, HasSubstr("Vault created."));
    EXPECT_THAT(output, HasSubstr("sbox(my_vault.db)> "));
    EXPECT_THAT(output, HasSubstr("Container 1 added."));
    EXPECT_THAT(output, HasSubstr("Container 2 added."));
    EXPECT_THAT(output, HasSubstr("  [1] Bank PIN\n  [2] Notes\n"));
    EXPECT_THAT(output, HasSubstr("[1] Bank PIN\n1234\n"));
    EXPECT_THAT(output, HasSubstr("Integrity OK."));
    EXPECT_THAT(output, HasSubstr("Vault closed."));
    EXPECT_THAT(m_prompts, ::testing::ElementsAre("New Password: ", "Confirm Password: ", "Text: "));
    EXPECT_TRUE(fs::exists(vaultPath));
}

TEST_F(InteractiveShellTest, DefaultsToConfiguredVaultPath)
{
    m_inContent << "create\nclose\nopen\nls\nexit\n";

    const auto output{ runShell() };

    EXPECT_TRUE(fs::exists(m_settings.vaultPath));
    EXPECT_THAT(output, HasSubstr("Vault opened."));
    EXPECT_THAT(output, HasSubstr("(empty)"));
}

TEST_F(InteractiveShellTest, CreateFailsOnPasswordMismatch)
{
    m_inContent << "create\nexit\n";
    m_answers = { "one", "two" };

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: passwords do not match."));
    EXPECT_FALSE(fs::exists(m_settings.vaultPath));
}

TEST_F(InteractiveShellTest, CreateFailsIfVaultAlreadyExists)
{
    m_inContent << "create\nclose\ncreate\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: vault already exists at " + m_settings.vaultPath.string()));
}

TEST_F(InteractiveShellTest, OpenFailsOnWrongPassword)
{
    m_inContent << "create\nclose\nopen\nls\nexit\n";
    m_answers = { "right", "right", "wrong" };

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: cannot unlock vault (wrong password or tampered file)."));
    EXPECT_THAT(output, HasSubstr("Error: no vault is open."));
}

TEST_F(InteractiveShellTest, OpenFailsOnMissingFile)
{
    m_inContent << "open " << (m_dir.path() / "nope.db").string() << "\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: no vault at "));
    EXPECT_TRUE(m_prompts.empty());
}

TEST_F(InteractiveShellTest, RefusesSecondOpenVault)
{
    m_inContent << "create\nopen\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: a vault is already open; close it first."));
}

TEST_F(InteractiveShellTest, RequiresOpenVaultForOperations)
{
    m_inContent << "ls\nadd --text x\nrm 1\nverify\npasswd\nrotate\nsign-out\nclose\nexit\n";

    const auto output{ runShell() };

    std::size_t count{ 0 };
    for (auto pos{ output.find("Error: no vault is open.") }; pos != std::string::npos;
         pos = output.find("Error: no vault is open.", pos + 1))
    {
        ++count;
    }
    EXPECT_EQ(count, 8U);
}

TEST_F(InteractiveShellTest, EditRenameAndRemove)
{
    m_inContent << "create\nadd --name a --text one\nadd --name b --text two\n";
    m_inContent << "edit 1 --name renamed\nedit 2 --text \"new text\"\nedit 2\nrm 1\nrm 1\nls\nview 2\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Container 1 updated."));
    EXPECT_THAT(output, HasSubstr("Container 2 updated."));
    EXPECT_THAT(output, HasSubstr("Error: nothing to change"));
    EXPECT_THAT(output, HasSubstr("Container 1 removed."));
    EXPECT_THAT(output, HasSubstr("Error: not found."));
    EXPECT_THAT(output, HasSubstr("  [2] b\n"));
    EXPECT_THAT(output, Not(HasSubstr("[1] renamed\n")));
    EXPECT_THAT(output, HasSubstr("[2] b\nnew text\n"));
}

TEST_F(InteractiveShellTest, ViewWithoutOpeningReadsOneRecord)
{
    m_inContent << "create\nadd --name secret --text hidden-value\nclose\nview 1\nview 7\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("[1] secret\nhidden-value\n"));
    EXPECT_THAT(output, HasSubstr("Error: not found."));
    EXPECT_THAT(output, Not(HasSubstr("Vault opened.")));
}

TEST_F(InteractiveShellTest, PasswordChangeAndRotation)
{
    m_inContent << "create\nadd --text x\npasswd\nrotate\nclose\nopen\nls\nexit\n";
    m_answers = { "old", "old", "new", "new", "new" };

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Master password changed."));
    EXPECT_THAT(output, HasSubstr("Keys rotated."));
    EXPECT_THAT(output, HasSubstr("Vault opened."));
    EXPECT_THAT(output, HasSubstr("  [1] Container 1\n"));
}

TEST_F(InteractiveShellTest, RecoverModeReportsDamage)
{
    m_inContent << "create\nadd --text a\nadd --text b\nexit\n";
    (void)runShell();

    auto snapshot{ m_storage->loadVault(m_settings.vaultPath) };
    for (auto& record : snapshot.containers)
    {
        if (record.id == 2)
        {
            record.box.cipherText[0] ^= 0x01U;
        }
    }
    m_storage->replaceVault(m_settings.vaultPath, snapshot);

    m_outContent.str("");
    m_inContent.clear();
    m_inContent.str("open\nopen --recover\nls\nexit\n");
    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: cannot unlock vault (wrong password or tampered file)."));
    EXPECT_THAT(output, HasSubstr("  [2] INTEGRITY FAILED"));
    EXPECT_THAT(output, HasSubstr("Integrity FAILED for ids: 2."));
    EXPECT_THAT(output, HasSubstr("Vault opened in recovery mode"));
    EXPECT_THAT(output, HasSubstr("  [1] Container 1\n"));
    EXPECT_THAT(output, Not(HasSubstr("  [2] Container 2\n")));
}

TEST_F(InteractiveShellTest, BackupCommandsNeedAGateway)
{
    m_inContent << "create\nupload\ndownload x.db\ndelete-backup\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: no backup directory is configured."));
}

TEST_F(InteractiveShellTest, BackupRoundTripThroughDirectoryGateway)
{
    const auto credsFile{ m_dir.path() / "creds.json" };
    const auto tokenFile{ m_dir.path() / "token.txt" };
    securebox::test_utils::writeFile(credsFile, "{\"type\":\"service_account\"}\n");
    securebox::test_utils::writeFile(tokenFile, "tok\n");
    const auto restored{ m_dir.path() / "restored.db" };
    auto gateway{ securebox::backup::makeDirectoryBackupGateway(m_dir.path() / "remote") };

    m_inContent << "create\nupload\n";
    m_inContent << "set-credentials " << credsFile.string() << " --token " << tokenFile.string() << "\n";
    m_inContent << "upload\ndownload " << restored.string() << "\ndelete-backup\nsign-out\nupload\nexit\n";

    const auto output{ runShell(gateway.get()) };

    EXPECT_THAT(output, HasSubstr("Error: backup credentials are not set."));
    EXPECT_THAT(output, HasSubstr("Backup credentials stored."));
    EXPECT_THAT(output, HasSubstr("Backup uploaded as default.db.BAK."));
    EXPECT_THAT(output, HasSubstr("Backup downloaded to " + restored.string() + "; open it to verify."));
    EXPECT_THAT(output, HasSubstr("Remote backup deleted."));
    EXPECT_THAT(output, HasSubstr("Signed out."));
    EXPECT_TRUE(fs::exists(restored));
    EXPECT_FALSE(fs::exists(m_dir.path() / "remote" / "default.db.BAK"));
}

TEST_F(InteractiveShellTest, AutoUploadOnClose)
{
    const auto credsFile{ m_dir.path() / "creds.json" };
    securebox::test_utils::writeFile(credsFile, "creds");
    auto gateway{ securebox::backup::makeDirectoryBackupGateway(m_dir.path() / "remote") };
    m_settings.autoUpload = true;

    m_inContent << "create\nset-credentials " << credsFile.string() << " --token " << credsFile.string()
                << "\nclose\nexit\n";

    const auto output{ runShell(gateway.get()) };

    EXPECT_THAT(output, HasSubstr("Backup uploaded.\nVault closed."));
    EXPECT_TRUE(fs::exists(m_dir.path() / "remote" / "default.db.BAK"));
}

TEST_F(InteractiveShellTest, SetCredentialsReportsUnreadableFile)
{
    m_inContent << "create\nset-credentials " << (m_dir.path() / "missing").string() << "\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Error: cannot read "));
}

TEST_F(InteractiveShellTest, EofClosesTheVault)
{
    m_inContent << "create\nadd --text x";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("Container 1 added."));
    EXPECT_THAT(output, HasSubstr("Vault closed."));
}

TEST_F(InteractiveShellTest, HelpCommandWorks)
{
    m_inContent << "help\nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("SecureBox shell"));
    EXPECT_THAT(output, HasSubstr("verify"));
    EXPECT_THAT(output, HasSubstr("delete-backup"));
}

TEST_F(InteractiveShellTest, VersionAndPaths)
{
    m_settings.backupDirectory = m_dir.path() / "remote";
    m_inContent << "version\npaths\nquit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("securebox v0.1\n"));
    EXPECT_THAT(output, HasSubstr("vault:  " + m_settings.vaultPath.string()));
    EXPECT_THAT(output, HasSubstr("backup: " + m_settings.backupDirectory.string()));
}

TEST_F(InteractiveShellTest, SyntaxErrors)
{
    m_inContent << "frobnicate\nview\nview abc\nadd --text \"open quote\nexit\n";

    const auto output{ runShell() };

    std::size_t count{ 0 };
    for (auto pos{ output.find("Syntax Error:") }; pos != std::string::npos;
         pos = output.find("Syntax Error:", pos + 1))
    {
        ++count;
    }
    EXPECT_EQ(count, 4U);
    EXPECT_THAT(output, HasSubstr("Syntax Error: unterminated quote"));
}

TEST_F(InteractiveShellTest, IgnoresExcessiveWhitespace)
{
    m_inContent << "   \n\t\n   version   \nexit\n";

    const auto output{ runShell() };

    EXPECT_THAT(output, HasSubstr("securebox v0.1"));
    EXPECT_THAT(output, Not(HasSubstr("Error")));
}
