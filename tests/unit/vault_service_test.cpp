#include "securebox/core/VaultService.hpp"

#include "securebox/core/Container.hpp"
#include "securebox/core/IntegrityReport.hpp"
#include "securebox/core/Vault.hpp"
#include "securebox/security/SecureString.hpp"
#include "securebox/storage/VaultSnapshot.hpp"
#include "securebox/storage/sqlite/SqliteStorageRepositoryFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include "test_utils/VaultTestSupport.hpp"
#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace
{

using securebox::core::ContainerId;
using securebox::core::VaultError;
using securebox::security::secureStringFrom;
using securebox::test_utils::describe;
using securebox::test_utils::isError;
using securebox::test_utils::isOk;

class VaultServiceTest : public ::testing::Test
{
protected:
    [[nodiscard]] securebox::core::Vault createOrFail(std::string_view password = "master")
    {
        auto r{ m_service.createVault(m_path, secureStringFrom(password), m_params) };
        if (!isOk(r))
        {
            ADD_FAILURE() << "createVault: " << describe(r);
            return {};
        }
        return std::get<securebox::core::Vault>(std::move(r));
    }

    [[nodiscard]] securebox::core::Vault openOrFail(std::string_view password = "master")
    {
        auto r{ m_service.openVault(m_path, secureStringFrom(password)) };
        if (!isOk(r))
        {
            ADD_FAILURE() << "openVault: " << describe(r);
            return {};
        }
        return std::get<securebox::core::Vault>(std::move(r));
    }

    static ContainerId addOrFail(securebox::core::Vault& vault, std::string_view name, std::string_view text)
    {
        const auto r{ vault.addContainer(name, secureStringFrom(text)) };
        if (!isOk(r))
        {
            ADD_FAILURE() << "addContainer: " << describe(r);
            return 0;
        }
        return std::get<securebox::core::Container>(r).id();
    }

    [[nodiscard]] static std::vector<ContainerId> idsOf(const securebox::core::Vault& vault)
    {
        std::vector<ContainerId> out{};
        const auto listed{ vault.containers() };
        if (!isOk(listed))
        {
            ADD_FAILURE() << "containers: " << describe(listed);
            return out;
        }
        for (const auto& c : std::get<std::vector<securebox::core::Container>>(listed))
        {
            out.push_back(c.id());
        }
        return out;
    }

    [[nodiscard]] static std::string textOf(const securebox::core::Vault& vault, ContainerId id)
    {
        const auto r{ vault.getContainer(id) };
        if (!isOk(r))
        {
            ADD_FAILURE() << "getContainer(" << id << "): " << describe(r);
            return {};
        }
        return std::string{ std::get<securebox::core::Container>(r).dataView() };
    }

    // Edits the file behind the service's back, the way an attacker with write access would.
    void editFile(const std::function<void(securebox::storage::VaultSnapshot&)>& edit)
    {
        auto snapshot{ m_storage->loadVault(m_path) };
        edit(snapshot);
        m_storage->replaceVault(m_path, snapshot);
    }

    [[nodiscard]] securebox::storage::EncryptedContainer& recordIn(securebox::storage::VaultSnapshot& s,
                                                                   ContainerId id)
    {
        const auto it{ std::find_if(s.containers.begin(), s.containers.end(),
                                    [id](const securebox::storage::EncryptedContainer& r) { return r.id == id; }) };
        if (it == s.containers.end())
        {
            ADD_FAILURE() << "no record " << id;
            return m_missing;
        }
        return *it;
    }

    securebox::test_utils::TempDir m_dir{ "vault_service_" };
    std::filesystem::path m_path{ m_dir.path() / "vault.db" };
    std::unique_ptr<securebox::crypto::ICryptoProvider> m_crypto{ securebox::test_utils::makeTestCryptoProvider() };
    std::unique_ptr<securebox::storage::IStorageRepository> m_storage{
        securebox::storage::sqlite::makeSqliteStorageRepository()
    };
    securebox::core::KdfParams m_params{ securebox::test_utils::kdfParamsForVaultTests(*m_crypto) };
    securebox::test_utils::RecordingAuditSink m_audit;
    securebox::core::VaultService m_service{ *m_crypto, *m_storage, m_audit };
    securebox::storage::EncryptedContainer m_missing{};
};

} // namespace

TEST_F(VaultServiceTest, OpenMissingVaultIsNotFound)
{
    EXPECT_FALSE(m_service.vaultExists(m_path));
    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("x")), VaultError::NotFound));
    EXPECT_TRUE(isError(m_service.recoverVault(m_path, secureStringFrom("x")), VaultError::NotFound));
    EXPECT_TRUE(isError(m_service.peekContainer(m_path, secureStringFrom("x"), 1), VaultError::NotFound));
}

TEST_F(VaultServiceTest, CreateRejectsEmptyPasswordAndExistingVault)
{
    EXPECT_TRUE(isError(m_service.createVault(m_path, securebox::security::SecureString{}, m_params),
                        VaultError::EmptyPassword));
    EXPECT_FALSE(m_service.vaultExists(m_path));

    auto vault{ createOrFail() };
    EXPECT_TRUE(m_service.vaultExists(m_path));
    EXPECT_TRUE(isError(m_service.createVault(m_path, secureStringFrom("other"), m_params), VaultError::AlreadyExists));

    // The original vault still opens with its own password.
    vault.lock();
    auto reopened{ openOrFail() };
    EXPECT_FALSE(reopened.isLocked());
}

TEST_F(VaultServiceTest, ContainersKeepInsertionOrderAndIdsAreNeverReused)
{
    auto vault{ createOrFail() };
    EXPECT_TRUE(idsOf(vault).empty());

    EXPECT_EQ(addOrFail(vault, "one", "1"), 1);
    EXPECT_EQ(addOrFail(vault, "two", "2"), 2);
    EXPECT_EQ(addOrFail(vault, "three", "3"), 3);
    ASSERT_TRUE(isOk(vault.removeContainer(2)));
    EXPECT_EQ(addOrFail(vault, "four", "4"), 4);
    EXPECT_EQ(idsOf(vault), (std::vector<ContainerId>{ 1, 3, 4 }));

    ASSERT_TRUE(isOk(vault.removeContainer(4)));
    vault.lock();

    auto reopened{ openOrFail() };
    EXPECT_EQ(idsOf(reopened), (std::vector<ContainerId>{ 1, 3 }));
    EXPECT_EQ(addOrFail(reopened, "five", "5"), 5);
    EXPECT_EQ(textOf(reopened, 3), "3");
}

TEST_F(VaultServiceTest, EmptyNameGetsDefaultLabel)
{
    auto vault{ createOrFail() };
    const auto id{ addOrFail(vault, "", "payload") };
    const auto c{ vault.getContainer(id) };
    ASSERT_TRUE(isOk(c));
    EXPECT_EQ(std::get<securebox::core::Container>(c).name(), "Container " + std::to_string(id));
}

TEST_F(VaultServiceTest, ReopenRestoresNamesAndText)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "Bank PIN", "1234");
        addOrFail(vault, "Notes", "multi\nline\ttext");
    }

    auto vault{ openOrFail() };
    const auto listed{ vault.containers() };
    ASSERT_TRUE(isOk(listed));
    const auto& items{ std::get<std::vector<securebox::core::Container>>(listed) };
    ASSERT_EQ(items.size(), 2U);
    EXPECT_EQ(items[0].name(), "Bank PIN");
    EXPECT_EQ(items[0].dataView(), "1234");
    EXPECT_EQ(items[1].name(), "Notes");
    EXPECT_EQ(items[1].dataView(), "multi\nline\ttext");
}

TEST_F(VaultServiceTest, WrongPasswordIsAuthFailedEvenForEmptyVault)
{
    {
        auto vault{ createOrFail("right") };
    }
    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("wrong")), VaultError::AuthFailed));
    EXPECT_TRUE(isError(m_service.openVault(m_path, securebox::security::SecureString{}), VaultError::EmptyPassword));
    EXPECT_TRUE(m_audit.saw("vault.open", "failure"));
}

TEST_F(VaultServiceTest, UpdateChangesOnlyWhatIsGiven)
{
    auto vault{ createOrFail() };
    const auto id{ addOrFail(vault, "name", "text") };

    ASSERT_TRUE(isOk(vault.updateContainer(id, std::string{ "renamed" }, std::nullopt)));
    EXPECT_EQ(textOf(vault, id), "text");

    ASSERT_TRUE(isOk(vault.updateContainer(id, std::nullopt, secureStringFrom("new text"))));
    vault.lock();

    auto reopened{ openOrFail() };
    const auto c{ reopened.getContainer(id) };
    ASSERT_TRUE(isOk(c));
    EXPECT_EQ(std::get<securebox::core::Container>(c).name(), "renamed");
    EXPECT_EQ(std::get<securebox::core::Container>(c).dataView(), "new text");
}

TEST_F(VaultServiceTest, UnknownIdsAreNotFound)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "a", "b");

    EXPECT_TRUE(isError(vault.getContainer(9), VaultError::NotFound));
    EXPECT_TRUE(isError(vault.updateContainer(9, std::string{ "x" }, std::nullopt), VaultError::NotFound));
    EXPECT_TRUE(isError(vault.removeContainer(9), VaultError::NotFound));
    EXPECT_TRUE(isError(vault.getContainer(0), VaultError::NotFound));
}

TEST_F(VaultServiceTest, EveryRecordGetsItsOwnIv)
{
    auto vault{ createOrFail() };
    for (int i{ 0 }; i < 8; ++i)
    {
        addOrFail(vault, "same", "same");
    }
    ASSERT_TRUE(isOk(vault.updateContainer(1, std::nullopt, secureStringFrom("same"))));

    const auto snapshot{ m_storage->loadVault(m_path) };
    std::set<securebox::crypto::AeadNonce> nonces{};
    for (const auto& r : snapshot.containers)
    {
        EXPECT_TRUE(nonces.insert(r.box.nonce).second) << "reused iv for id " << r.id;
    }
}

TEST_F(VaultServiceTest, LockedVaultRefusesEverything)
{
    auto vault{ createOrFail() };
    const auto id{ addOrFail(vault, "a", "b") };
    vault.lock();

    EXPECT_TRUE(vault.isLocked());
    EXPECT_TRUE(isError(vault.containers(), VaultError::Locked));
    EXPECT_TRUE(isError(vault.getContainer(id), VaultError::Locked));
    EXPECT_TRUE(isError(vault.addContainer("x", secureStringFrom("y")), VaultError::Locked));
    EXPECT_TRUE(isError(vault.removeContainer(id), VaultError::Locked));
    EXPECT_TRUE(isError(vault.verifyIntegrity(), VaultError::Locked));
    EXPECT_TRUE(isError(vault.regenerateKeys(), VaultError::Locked));
    EXPECT_TRUE(isError(vault.changeMasterPassword(secureStringFrom("n")), VaultError::Locked));
    EXPECT_TRUE(isError(vault.cloudCredentials(), VaultError::Locked));
}

TEST_F(VaultServiceTest, MovedFromVaultIsLocked)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "a", "b");

    auto moved{ std::move(vault) };
    EXPECT_TRUE(vault.isLocked()); // NOLINT(bugprone-use-after-move)
    EXPECT_FALSE(moved.isLocked());
    EXPECT_EQ(idsOf(moved), (std::vector<ContainerId>{ 1 }));
}

TEST_F(VaultServiceTest, VerifyIntegrityPassesOnUntouchedFile)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "a", "1");
    addOrFail(vault, "b", "2");

    const auto reportOrErr{ vault.verifyIntegrity() };
    ASSERT_TRUE(isOk(reportOrErr)) << describe(reportOrErr);
    const auto& report{ std::get<securebox::core::IntegrityReport>(reportOrErr) };
    EXPECT_TRUE(report.passed());
    EXPECT_TRUE(report.keyCheckValid);
    EXPECT_TRUE(report.sealValid);
    EXPECT_EQ(report.containers.size(), 2U);
    EXPECT_TRUE(m_audit.saw("vault.verify", "success"));
}

TEST_F(VaultServiceTest, TamperedRecordIsFlaggedAlone)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "a", "1");
    addOrFail(vault, "b", "2");
    addOrFail(vault, "c", "3");

    editFile([this](securebox::storage::VaultSnapshot& s) { recordIn(s, 2).box.cipherText[0] ^= 0x01U; });

    const auto reportOrErr{ vault.verifyIntegrity() };
    ASSERT_TRUE(isOk(reportOrErr)) << describe(reportOrErr);
    const auto& report{ std::get<securebox::core::IntegrityReport>(reportOrErr) };
    EXPECT_FALSE(report.passed());
    EXPECT_TRUE(report.keyCheckValid);
    EXPECT_EQ(report.failedIds(), (std::vector<ContainerId>{ 2 }));
    EXPECT_TRUE(m_audit.saw("vault.verify", "failure"));

    vault.lock();
    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, TamperedTagFailsSealAndRecord)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "a", "1");
    addOrFail(vault, "b", "2");

    editFile([this](securebox::storage::VaultSnapshot& s) { recordIn(s, 1).box.tag[0] ^= 0x01U; });

    const auto reportOrErr{ vault.verifyIntegrity() };
    ASSERT_TRUE(isOk(reportOrErr));
    const auto& report{ std::get<securebox::core::IntegrityReport>(reportOrErr) };
    EXPECT_FALSE(report.sealValid);
    EXPECT_EQ(report.failedIds(), (std::vector<ContainerId>{ 1 }));
}

TEST_F(VaultServiceTest, RecoverLoadsWhatStillVerifies)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
        addOrFail(vault, "b", "2");
        addOrFail(vault, "c", "3");
    }
    editFile([this](securebox::storage::VaultSnapshot& s) { recordIn(s, 3).box.cipherText.back() ^= 0x80U; });

    auto recoveredOrErr{ m_service.recoverVault(m_path, secureStringFrom("master")) };
    ASSERT_TRUE(isOk(recoveredOrErr)) << describe(recoveredOrErr);
    auto& recovered{ std::get<securebox::core::RecoveredVault>(recoveredOrErr) };
    EXPECT_EQ(recovered.report.failedIds(), (std::vector<ContainerId>{ 3 }));
    EXPECT_EQ(idsOf(recovered.vault), (std::vector<ContainerId>{ 1, 2 }));
    EXPECT_TRUE(m_audit.saw("vault.recover", "degraded"));

    // Saving from recovery drops the damaged record and re-seals the file.
    EXPECT_EQ(addOrFail(recovered.vault, "d", "4"), 4);
    recovered.vault.lock();
    auto reopened{ openOrFail() };
    EXPECT_EQ(idsOf(reopened), (std::vector<ContainerId>{ 1, 2, 4 }));
}

TEST_F(VaultServiceTest, RecoverStillNeedsThePassword)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
    }
    EXPECT_TRUE(isError(m_service.recoverVault(m_path, secureStringFrom("nope")), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, RecordMovedToAnotherIdFails)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
        addOrFail(vault, "b", "2");
        ASSERT_TRUE(isOk(vault.removeContainer(2)));
    }
    editFile([this](securebox::storage::VaultSnapshot& s) { recordIn(s, 1).id = 2; });

    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, DeletedRecordBreaksTheSeal)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
        addOrFail(vault, "b", "2");
    }
    editFile([](securebox::storage::VaultSnapshot& s) { s.containers.pop_back(); });

    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::AuthFailed));

    auto recoveredOrErr{ m_service.recoverVault(m_path, secureStringFrom("master")) };
    ASSERT_TRUE(isOk(recoveredOrErr));
    const auto& report{ std::get<securebox::core::RecoveredVault>(recoveredOrErr).report };
    EXPECT_FALSE(report.sealValid);
    EXPECT_TRUE(report.failedIds().empty());
}

TEST_F(VaultServiceTest, OlderRecordVersionBreaksTheSeal)
{
    securebox::storage::EncryptedContainer older{};
    {
        auto vault{ createOrFail() };
        const auto id{ addOrFail(vault, "a", "old text") };
        auto snapshot{ m_storage->loadVault(m_path) };
        older = recordIn(snapshot, id);
        ASSERT_TRUE(isOk(vault.updateContainer(id, std::nullopt, secureStringFrom("new text"))));
    }
    editFile([this, &older](securebox::storage::VaultSnapshot& s) { recordIn(s, older.id) = older; });

    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, RolledBackIdCounterBreaksTheSeal)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
        addOrFail(vault, "b", "2");
        ASSERT_TRUE(isOk(vault.removeContainer(2)));
    }
    editFile([](securebox::storage::VaultSnapshot& s) { s.nextContainerId = 2; });

    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, EditedKdfParametersFailTheKeyCheck)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
    }
    editFile([](securebox::storage::VaultSnapshot& s) {
        if (s.key.kdf.algorithm == securebox::crypto::KdfAlgorithm::Argon2id)
        {
            s.key.kdf.argon2id.iterations += 1U;
        }
        else
        {
            s.key.kdf.pbkdf2.iterations += 1U;
        }
    });

    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, UnallocatedIdsInFileAreCorrupt)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "1");
        addOrFail(vault, "b", "2");
    }
    auto snapshot{ m_storage->loadVault(m_path) };
    snapshot.containers[1].id = snapshot.containers[0].id;
    // The schema itself refuses duplicate ids.
    EXPECT_THROW(m_storage->replaceVault(m_path, snapshot), std::exception);

    editFile([](securebox::storage::VaultSnapshot& s) { s.containers[0].id = 99; });
    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("master")), VaultError::CorruptFormat));
}

TEST_F(VaultServiceTest, ChangeMasterPasswordKeepsContents)
{
    auto vault{ createOrFail("old") };
    const auto id{ addOrFail(vault, "a", "secret") };

    EXPECT_TRUE(isError(vault.changeMasterPassword(securebox::security::SecureString{}), VaultError::EmptyPassword));
    ASSERT_TRUE(isOk(vault.changeMasterPassword(secureStringFrom("new"))));
    EXPECT_EQ(textOf(vault, id), "secret");
    vault.lock();

    EXPECT_TRUE(isError(m_service.openVault(m_path, secureStringFrom("old")), VaultError::AuthFailed));
    auto reopened{ openOrFail("new") };
    EXPECT_EQ(textOf(reopened, id), "secret");
    EXPECT_TRUE(m_audit.saw("vault.password_change", "success"));
}

TEST_F(VaultServiceTest, RegenerateKeysReencryptsEverything)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "a", "1");
    addOrFail(vault, "b", "2");
    const auto before{ m_storage->loadVault(m_path) };

    ASSERT_TRUE(isOk(vault.regenerateKeys()));
    const auto after{ m_storage->loadVault(m_path) };

    EXPECT_NE(before.key.kdf.salt, after.key.kdf.salt);
    EXPECT_NE(before.key.keyCheck.nonce, after.key.keyCheck.nonce);
    ASSERT_EQ(before.containers.size(), after.containers.size());
    for (std::size_t i{ 0 }; i < after.containers.size(); ++i)
    {
        EXPECT_EQ(before.containers[i].id, after.containers[i].id);
        EXPECT_NE(before.containers[i].box.cipherText, after.containers[i].box.cipherText);
        EXPECT_EQ(after.containers[i].salt, after.key.kdf.salt);
    }
    vault.lock();

    auto reopened{ openOrFail() };
    EXPECT_EQ(textOf(reopened, 1), "1");
    EXPECT_EQ(textOf(reopened, 2), "2");
}

TEST_F(VaultServiceTest, PeekDecryptsOneRecordWithoutOpening)
{
    {
        auto vault{ createOrFail() };
        addOrFail(vault, "a", "first");
        addOrFail(vault, "b", "second");
        ASSERT_TRUE(isOk(vault.setCloudCredentials(secureStringFrom("creds"), secureStringFrom("token"))));
    }
    // Damage to another record does not stop a single read.
    editFile([this](securebox::storage::VaultSnapshot& s) { recordIn(s, 1).box.cipherText[0] ^= 0x01U; });

    const auto peeked{ m_service.peekContainer(m_path, secureStringFrom("master"), 2) };
    ASSERT_TRUE(isOk(peeked)) << describe(peeked);
    EXPECT_EQ(std::get<securebox::core::Container>(peeked).dataView(), "second");

    EXPECT_TRUE(isError(m_service.peekContainer(m_path, secureStringFrom("master"), 1), VaultError::IntegrityFailed));
    EXPECT_TRUE(isError(m_service.peekContainer(m_path, secureStringFrom("master"), 7), VaultError::NotFound));
    EXPECT_TRUE(isError(m_service.peekContainer(m_path, secureStringFrom("master"),
                                                securebox::core::g_credentialContainerId),
                        VaultError::NotFound));
    EXPECT_TRUE(isError(m_service.peekContainer(m_path, secureStringFrom("wrong"), 2), VaultError::AuthFailed));
}

TEST_F(VaultServiceTest, CloudCredentialsAreHiddenContainers)
{
    auto vault{ createOrFail() };
    addOrFail(vault, "visible", "x");

    EXPECT_TRUE(isError(vault.setCloudCredentials(std::nullopt, std::nullopt), VaultError::InvalidArgument));
    EXPECT_TRUE(isError(vault.setCloudCredentials(securebox::security::SecureString{}, std::nullopt),
                        VaultError::InvalidArgument));
    ASSERT_TRUE(isOk(vault.setCloudCredentials(secureStringFrom("{\"type\":\"sa\"}"), secureStringFrom("tok"))));
    EXPECT_EQ(idsOf(vault), (std::vector<ContainerId>{ 1 }));
    EXPECT_EQ(addOrFail(vault, "next", "y"), 2);
    vault.lock();

    auto reopened{ openOrFail() };
    EXPECT_EQ(idsOf(reopened), (std::vector<ContainerId>{ 1, 2 }));
    const auto credsOrErr{ reopened.cloudCredentials() };
    ASSERT_TRUE(isOk(credsOrErr));
    const auto& creds{ std::get<securebox::backup::BackupCredentials>(credsOrErr) };
    EXPECT_EQ(securebox::security::asStringView(creds.credentials), "{\"type\":\"sa\"}");
    EXPECT_EQ(securebox::security::asStringView(creds.token), "tok");

    ASSERT_TRUE(isOk(reopened.signOut()));
    ASSERT_TRUE(isOk(reopened.signOut()));
    const auto afterSignOut{ reopened.cloudCredentials() };
    ASSERT_TRUE(isOk(afterSignOut));
    EXPECT_TRUE(std::get<securebox::backup::BackupCredentials>(afterSignOut).token.empty());
    EXPECT_FALSE(std::get<securebox::backup::BackupCredentials>(afterSignOut).credentials.empty());
}

TEST_F(VaultServiceTest, AuditTrailNeverCarriesSecrets)
{
    auto vault{ createOrFail("hunter2-password") };
    addOrFail(vault, "label", "top-secret-payload");
    ASSERT_TRUE(isOk(vault.setCloudCredentials(secureStringFrom("cred-blob"), secureStringFrom("token-blob"))));
    vault.lock();
    (void)m_service.openVault(m_path, secureStringFrom("wrong-guess"));

    ASSERT_FALSE(m_audit.events().empty());
    for (const auto& e : m_audit.events())
    {
        for (const std::string_view secret : { "hunter2", "top-secret", "cred-blob", "token-blob", "wrong-guess" })
        {
            EXPECT_EQ(e.detail.find(secret), std::string::npos) << e.event;
        }
    }
    EXPECT_TRUE(m_audit.saw("vault.create", "success"));
    EXPECT_TRUE(m_audit.saw("container.add", "success"));
    EXPECT_TRUE(m_audit.saw("vault.lock", "success"));
}
