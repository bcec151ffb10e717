#include <memory>
#include <optional>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "algorithm_finder.hpp"
#include "config.hpp"
#include "error.hpp"
#include "hash.hpp"
#include "password.hpp"
#include "salt_generator_mock.hpp"
#include "test_utils.hpp"

using ::testing::Return;

namespace {

constexpr char SCRYPT_VECTOR[] =
    "$s0$e0801$AAAAAAAAAAAAAAAAAAAAAA==$"
    "nEqpsQgMlDBF6sosHA8P6nhee9Am3nEosZ6N1mZZbbY=";
constexpr char PEPPERED_BCRYPT[] =
    "$2b$04$......................4mnCV4EFT5dvKvN7Y.Jk2R2Nzqjjs3S";

constexpr char CONFIG[] = R"(
global:
  pepper: pepper
  salt:
    length: 16
hash:
  default: scrypt
  bcrypt:
    rounds: 4
  scrypt:
    workfactor: 16384
  pbkdf2:
    algorithm: PBKDF2WithHmacSHA256
    iterations: 1000
    length: 256
  argon2:
    memory: 1024
    iterations: 1
  md:
    algorithm: SHA-256
)";

} // namespace

class PasswordTest : public testing::Test
{
protected:
    PasswordTest()
    {
        auto conf = Configuration::fromYamlStr(CONFIG);
        if(conf.has_value())
        {
            config = *std::move(conf);
        }
    }

    Configuration config;
};

TEST_F(PasswordTest, CanHashWithGivenSalt)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    ASSIGN_OR_FAIL(Hash h, password.hash("Sup3rSecr4t!")
                   .addSalt(Bytes(16, 0)).withSCrypt());
    EXPECT_EQ(h.encoded(), SCRYPT_VECTOR);
    EXPECT_EQ(h.salt(), Bytes(16, 0));

    ASSIGN_OR_FAIL(bool ok, password.check("Sup3rSecr4t!", SCRYPT_VECTOR)
                   .withSCrypt());
    EXPECT_TRUE(ok);
    ASSIGN_OR_FAIL(ok, password.check("wrong", SCRYPT_VECTOR).withSCrypt());
    EXPECT_FALSE(ok);
}

TEST_F(PasswordTest, GeneratesSaltWithConfiguredLength)
{
    auto gen = std::make_shared<SaltGeneratorMock>();
    EXPECT_CALL(*gen, generate(16)).WillOnce(Return(Bytes(16, 0)));
    AlgorithmFinder finder(config, gen);
    Password password(finder);
    ASSIGN_OR_FAIL(Hash h, password.hash("Sup3rSecr4t!").withSCrypt());
    EXPECT_EQ(h.encoded(), SCRYPT_VECTOR);
}

TEST_F(PasswordTest, CanAddRandomSalt)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    ASSIGN_OR_FAIL(Hash h, password.hash("Sup3rSecr4t!").addRandomSalt(32)
                   .withArgon2());
    EXPECT_EQ(h.salt().size(), 32u);
    ASSIGN_OR_FAIL(h, password.hash("Sup3rSecr4t!").addSalt(Bytes(16, 0))
                   .addRandomSalt().withArgon2());
    EXPECT_EQ(h.salt().size(), 16u);
    EXPECT_NE(h.salt(), Bytes(16, 0));
}

TEST_F(PasswordTest, PrependsPepper)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    ASSIGN_OR_FAIL(Hash h, password.hash("Sup3rSecr4t!").addSalt(Bytes(16, 0))
                   .addPepper().withBCrypt());
    EXPECT_EQ(h.encoded(), PEPPERED_BCRYPT);
    ASSIGN_OR_FAIL(h, password.hash("Sup3rSecr4t!").addSalt(Bytes(16, 0))
                   .addPepper("pepper").withBCrypt());
    EXPECT_EQ(h.encoded(), PEPPERED_BCRYPT);

    ASSIGN_OR_FAIL(bool ok, password.check("Sup3rSecr4t!", PEPPERED_BCRYPT)
                   .addPepper().withBCrypt());
    EXPECT_TRUE(ok);
    ASSIGN_OR_FAIL(ok, password.check("Sup3rSecr4t!", PEPPERED_BCRYPT)
                   .addPepper("salt").withBCrypt());
    EXPECT_FALSE(ok);
    ASSIGN_OR_FAIL(ok, password.check("Sup3rSecr4t!", PEPPERED_BCRYPT)
                   .withBCrypt());
    EXPECT_FALSE(ok);
}

TEST_F(PasswordTest, NoPepperIsConfigured)
{
    AlgorithmFinder finder;
    Password password(finder);
    BCryptParams params;
    params.rounds = 4;
    ASSIGN_OR_FAIL(HashingStrategy s, HashingStrategy::create(params));
    ASSIGN_OR_FAIL(Hash h, password.hash("Sup3rSecr4t!").addSalt(Bytes(16, 0))
                   .addPepper().with(s));
    EXPECT_EQ(h.encoded(),
              "$2b$04$......................p9aXssi0R2JSzHQDTEQGw5t2ZPkK6gG");
}

TEST_F(PasswordTest, CheckWithoutPlainTextFails)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    // The hash is not even looked at.
    ASSIGN_OR_FAIL(bool ok, password.check(std::nullopt, "$s0$garbage")
                   .withSCrypt());
    EXPECT_FALSE(ok);
    ASSIGN_OR_FAIL(HashUpdate update, password.check(std::nullopt,
                                                     SCRYPT_VECTOR)
                   .andUpdate().withSCrypt());
    EXPECT_FALSE(update.verified);
    EXPECT_FALSE(update.hash.has_value());
}

TEST_F(PasswordTest, ChecksWithSeparateSalt)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    ASSIGN_OR_FAIL(Hash h, password.hash("Sup3rSecr4t!").addSalt("NaCl")
                   .addPepper().withPBKDF2());
    ASSIGN_OR_FAIL(bool ok, password.check("Sup3rSecr4t!", h.encoded())
                   .addSalt("NaCl").addPepper().withPBKDF2());
    EXPECT_TRUE(ok);
    ASSIGN_OR_FAIL(ok, password.check("Sup3rSecr4t!", h.encoded())
                   .addPepper().withPBKDF2());
    EXPECT_FALSE(ok);

    ASSIGN_OR_FAIL(h, password.hash("Sup3rSecr4t!").addSalt("NaCl")
                   .withMessageDigest());
    ASSIGN_OR_FAIL(ok, password.check("Sup3rSecr4t!", h.encoded())
                   .addSalt(toBytes("NaCl")).withMessageDigest());
    EXPECT_TRUE(ok);
}

TEST_F(PasswordTest, CanMigrateToAnotherAlgorithm)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    ASSIGN_OR_FAIL(Hash old_hash, password.hash("Sup3rSecr4t!")
                   .addSalt("NaClNaCl").addPepper().withPBKDF2());
    ASSIGN_OR_FAIL(HashingStrategy pbkdf2, finder.pbkdf2());
    ASSIGN_OR_FAIL(HashingStrategy argon2, finder.argon2());

    ASSIGN_OR_FAIL(HashUpdate update, password.check("Sup3rSecr4t!",
                                                     old_hash.encoded())
                   .addSalt("NaClNaCl").addPepper().andUpdate()
                   .with(pbkdf2, argon2));
    ASSERT_TRUE(update.verified);
    ASSERT_TRUE(update.hash.has_value());
    EXPECT_EQ(update.hash->strategy(), argon2);
    EXPECT_EQ(update.hash->salt(), toBytes("NaClNaCl"));
    EXPECT_TRUE(update.hash->encoded().starts_with("$argon2id$"));

    ASSIGN_OR_FAIL(bool ok, password.check("Sup3rSecr4t!",
                                           update.hash->encoded())
                   .addPepper().withArgon2());
    EXPECT_TRUE(ok);

    ASSIGN_OR_FAIL(update, password.check("wrong", old_hash.encoded())
                   .addSalt("NaClNaCl").addPepper().andUpdate()
                   .with(pbkdf2, argon2));
    EXPECT_FALSE(update.verified);
    EXPECT_FALSE(update.hash.has_value());
}

TEST_F(PasswordTest, CanUpdateSaltAndPepper)
{
    AlgorithmFinder finder(config);
    Password password(finder);
    ASSIGN_OR_FAIL(HashUpdate update, password.check("Sup3rSecr4t!",
                                                     SCRYPT_VECTOR)
                   .andUpdate().addNewPepper("new pepper")
                   .addNewRandomSalt(24).withSCrypt());
    ASSERT_TRUE(update.verified);
    ASSERT_TRUE(update.hash.has_value());
    EXPECT_EQ(update.hash->salt().size(), 24u);
    EXPECT_NE(update.hash->encoded(), SCRYPT_VECTOR);

    ASSIGN_OR_FAIL(bool ok, password.check("Sup3rSecr4t!",
                                           update.hash->encoded())
                   .addPepper("new pepper").withSCrypt());
    EXPECT_TRUE(ok);
    ASSIGN_OR_FAIL(ok, password.check("Sup3rSecr4t!", update.hash->encoded())
                   .withSCrypt());
    EXPECT_FALSE(ok);

    ASSIGN_OR_FAIL(update, password.check("Sup3rSecr4t!", SCRYPT_VECTOR)
                   .andUpdate().addNewSalt(Bytes(16, 0)).withSCrypt());
    ASSERT_TRUE(update.hash.has_value());
    EXPECT_EQ(update.hash->encoded(), SCRYPT_VECTOR);
}

TEST_F(PasswordTest, ReportsConfigurationErrors)
{
    Configuration bad;
    bad.properties["hash.bcrypt.rounds"] = "many";
    bad.properties["hash.scrypt.workfactor"] = "1000";
    AlgorithmFinder finder(bad);
    Password password(finder);
    EXPECT_TRUE(holdsError<ConfigurationError>(
        password.hash("aaa").withBCrypt()));
    EXPECT_TRUE(holdsError<ConfigurationError>(
        password.check("aaa", SCRYPT_VECTOR).withSCrypt()));
}
