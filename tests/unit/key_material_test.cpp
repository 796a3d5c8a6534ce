#include "securebox/core/Container.hpp"
#include "securebox/core/IntegrityReport.hpp"
#include "securebox/core/KdfPolicy.hpp"
#include "securebox/core/KeyMaterial.hpp"
#include "securebox/core/VaultError.hpp"
#include "securebox/security/SecureString.hpp"
#include "test_utils/VaultTestSupport.hpp"
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace
{

class KeyMaterialTest : public ::testing::Test
{
protected:
    [[nodiscard]] securebox::core::KeyMaterial generateOrFail(std::string_view password)
    {
        auto keyOrErr{ securebox::core::KeyMaterial::generate(
            *m_crypto, securebox::security::secureStringFrom(password), m_params) };
        if (!std::holds_alternative<securebox::core::KeyMaterial>(keyOrErr))
        {
            ADD_FAILURE() << "generate failed: " << securebox::test_utils::describe(keyOrErr);
            return {};
        }
        return std::get<securebox::core::KeyMaterial>(std::move(keyOrErr));
    }

    std::unique_ptr<securebox::crypto::ICryptoProvider> m_crypto{ securebox::test_utils::makeTestCryptoProvider() };
    securebox::core::KdfParams m_params{ securebox::test_utils::kdfParamsForVaultTests(*m_crypto) };
};

} // namespace

TEST(KdfPolicy, DefaultsAreStrongEnough)
{
    const auto argon{ securebox::core::defaultArgon2idParams() };
    EXPECT_EQ(argon.iterations, 3U);
    EXPECT_EQ(argon.memoryKiB, 65536U);
    EXPECT_EQ(argon.parallelism, 1U);
    EXPECT_EQ(securebox::core::defaultPbkdf2Params().iterations, 600'000U);
    EXPECT_EQ(securebox::core::defaultKdfParams().algorithm, securebox::crypto::KdfAlgorithm::Argon2id);
}

TEST(KdfPolicy, MetadataGetsFreshSaltAndKeepsCost)
{
    const auto params{ securebox::core::defaultKdfParams() };
    const auto a{ securebox::core::makeKdfMetadata(params) };
    const auto b{ securebox::core::makeKdfMetadata(params) };
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());

    EXPECT_NE(a->salt, b->salt);
    EXPECT_EQ(a->argon2id.memoryKiB, params.argon2id.memoryKiB);
    EXPECT_EQ(a->derivedKeyBytes, securebox::crypto::g_kMasterKeyBytes);

    const auto back{ securebox::core::kdfParamsOf(*a) };
    EXPECT_EQ(back.algorithm, params.algorithm);
    EXPECT_EQ(back.argon2id.iterations, params.argon2id.iterations);
    EXPECT_EQ(back.pbkdf2.iterations, params.pbkdf2.iterations);
}

TEST(VaultErrorText, EveryErrorHasAMessage)
{
    for (std::uint8_t v{ 0 }; v <= static_cast<std::uint8_t>(securebox::core::VaultError::Locked); ++v)
    {
        const auto text{ securebox::core::toString(static_cast<securebox::core::VaultError>(v)) };
        EXPECT_FALSE(text.empty());
        EXPECT_NE(text, "unknown error") << static_cast<int>(v);
    }
}

TEST(IntegrityReport, PassedNeedsEveryCheck)
{
    using securebox::core::ContainerStatus;
    securebox::core::IntegrityReport report{ .keyCheckValid = true, .sealValid = true, .containers = {} };
    report.containers = { { 1, ContainerStatus::Verified }, { 3, ContainerStatus::Verified } };
    EXPECT_TRUE(report.passed());
    EXPECT_TRUE(report.failedIds().empty());

    report.containers[1].status = ContainerStatus::CorruptFormat;
    EXPECT_FALSE(report.passed());
    EXPECT_EQ(report.failedIds(), (std::vector<securebox::core::ContainerId>{ 3 }));

    report.containers[1].status = ContainerStatus::Verified;
    report.sealValid = false;
    EXPECT_FALSE(report.passed());
    EXPECT_TRUE(report.failedIds().empty());
}

TEST_F(KeyMaterialTest, GenerateRejectsEmptyPassword)
{
    const auto r{ securebox::core::KeyMaterial::generate(*m_crypto, securebox::security::SecureString{}, m_params) };
    EXPECT_TRUE(securebox::test_utils::isError(r, securebox::core::VaultError::EmptyPassword));
}

TEST_F(KeyMaterialTest, DeriveReproducesGeneratedKey)
{
    const auto key{ generateOrFail("correct horse") };
    ASSERT_FALSE(key.empty());

    auto againOrErr{ securebox::core::KeyMaterial::derive(
        *m_crypto, securebox::security::secureStringFrom("correct horse"), key.kdf(), key.iv()) };
    ASSERT_TRUE(std::holds_alternative<securebox::core::KeyMaterial>(againOrErr));
    const auto& again{ std::get<securebox::core::KeyMaterial>(againOrErr) };

    EXPECT_TRUE(std::ranges::equal(key.containerKey(), again.containerKey()));
    EXPECT_EQ(key.salt(), again.salt());
}

TEST_F(KeyMaterialTest, KeyCheckRejectsWrongPassword)
{
    const auto key{ generateOrFail("right") };
    const auto recordOrErr{ key.sealKeyCheck(*m_crypto) };
    ASSERT_TRUE(std::holds_alternative<securebox::crypto::AeadBox>(recordOrErr));
    const auto& record{ std::get<securebox::crypto::AeadBox>(recordOrErr) };

    EXPECT_TRUE(std::holds_alternative<std::monostate>(key.verifyKeyCheck(*m_crypto, record)));

    auto wrongOrErr{ securebox::core::KeyMaterial::derive(*m_crypto, securebox::security::secureStringFrom("wrong"),
                                                          key.kdf(), key.iv()) };
    ASSERT_TRUE(std::holds_alternative<securebox::core::KeyMaterial>(wrongOrErr));
    const auto& wrong{ std::get<securebox::core::KeyMaterial>(wrongOrErr) };
    EXPECT_TRUE(securebox::test_utils::isError(wrong.verifyKeyCheck(*m_crypto, record),
                                               securebox::core::VaultError::AuthFailed));
}

TEST_F(KeyMaterialTest, KeyCheckFailsWhenKdfCostIsEdited)
{
    const auto key{ generateOrFail("pw") };
    const auto recordOrErr{ key.sealKeyCheck(*m_crypto) };
    ASSERT_TRUE(std::holds_alternative<securebox::crypto::AeadBox>(recordOrErr));

    auto edited{ key.kdf() };
    if (edited.algorithm == securebox::crypto::KdfAlgorithm::Argon2id)
    {
        edited.argon2id.iterations += 1U;
    }
    else
    {
        edited.pbkdf2.iterations += 1U;
    }
    auto otherOrErr{ securebox::core::KeyMaterial::derive(*m_crypto, securebox::security::secureStringFrom("pw"),
                                                          edited, key.iv()) };
    ASSERT_TRUE(std::holds_alternative<securebox::core::KeyMaterial>(otherOrErr));
    const auto& other{ std::get<securebox::core::KeyMaterial>(otherOrErr) };
    EXPECT_TRUE(securebox::test_utils::isError(
        other.verifyKeyCheck(*m_crypto, std::get<securebox::crypto::AeadBox>(recordOrErr)),
        securebox::core::VaultError::AuthFailed));
}

TEST_F(KeyMaterialTest, DeriveReportsUnsupportedMetadata)
{
    const auto key{ generateOrFail("pw") };
    auto bad{ key.kdf() };
    bad.policyVersion += 1U;

    const auto r{ securebox::core::KeyMaterial::derive(*m_crypto, securebox::security::secureStringFrom("pw"), bad,
                                                       key.iv()) };
    EXPECT_TRUE(securebox::test_utils::isError(r, securebox::core::VaultError::UnsupportedKdfMetadata));
}

TEST_F(KeyMaterialTest, MoveLeavesSourceEmpty)
{
    auto key{ generateOrFail("pw") };
    ASSERT_FALSE(key.empty());
    const securebox::core::KeyMaterial moved{ std::move(key) };
    EXPECT_FALSE(moved.empty());
    EXPECT_TRUE(key.empty()); // NOLINT(bugprone-use-after-move)
}

TEST_F(KeyMaterialTest, ContainerRoundTripUsesFreshIv)
{
    const auto key{ generateOrFail("pw") };
    const securebox::core::Container c{ 4, "note", securebox::security::secureStringFrom("secret text") };

    const auto a{ c.encrypt(*m_crypto, key) };
    const auto b{ c.encrypt(*m_crypto, key) };
    ASSERT_TRUE(std::holds_alternative<securebox::storage::EncryptedContainer>(a));
    ASSERT_TRUE(std::holds_alternative<securebox::storage::EncryptedContainer>(b));
    const auto& recA{ std::get<securebox::storage::EncryptedContainer>(a) };
    const auto& recB{ std::get<securebox::storage::EncryptedContainer>(b) };

    EXPECT_EQ(recA.id, 4);
    EXPECT_EQ(recA.salt, key.salt());
    EXPECT_NE(recA.box.nonce, recB.box.nonce);

    const auto back{ securebox::core::Container::decrypt(*m_crypto, key, recA) };
    ASSERT_TRUE(std::holds_alternative<securebox::core::Container>(back));
    EXPECT_EQ(std::get<securebox::core::Container>(back).name(), "note");
    EXPECT_EQ(std::get<securebox::core::Container>(back).dataView(), "secret text");
}

TEST_F(KeyMaterialTest, ContainerDecryptDetectsTamperAndRelocation)
{
    const auto key{ generateOrFail("pw") };
    const securebox::core::Container c{ 2, "n", securebox::security::secureStringFrom("d") };
    const auto encOrErr{ c.encrypt(*m_crypto, key) };
    ASSERT_TRUE(std::holds_alternative<securebox::storage::EncryptedContainer>(encOrErr));
    const auto& record{ std::get<securebox::storage::EncryptedContainer>(encOrErr) };

    auto flipped{ record };
    ASSERT_FALSE(flipped.box.cipherText.empty());
    flipped.box.cipherText[0] ^= 0x01U;
    EXPECT_TRUE(securebox::test_utils::isError(securebox::core::Container::decrypt(*m_crypto, key, flipped),
                                               securebox::core::VaultError::IntegrityFailed));

    auto moved{ record };
    moved.id = 3;
    EXPECT_TRUE(securebox::test_utils::isError(securebox::core::Container::decrypt(*m_crypto, key, moved),
                                               securebox::core::VaultError::IntegrityFailed));

    const auto other{ generateOrFail("pw") };
    EXPECT_TRUE(securebox::test_utils::isError(securebox::core::Container::decrypt(*m_crypto, other, record),
                                               securebox::core::VaultError::IntegrityFailed));
}

TEST(ContainerModel, HiddenIdsAreBelowFirstId)
{
    EXPECT_TRUE((securebox::core::Container{ securebox::core::g_credentialContainerId, "", {} }.isHidden()));
    EXPECT_TRUE((securebox::core::Container{ securebox::core::g_tokenContainerId, "", {} }.isHidden()));
    EXPECT_FALSE((securebox::core::Container{ securebox::core::g_firstContainerId, "", {} }.isHidden()));
}
