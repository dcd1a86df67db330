/**
 * @file test_credential_utils.cpp
 * @brief PBKDF2 hashing, identifiers and digests
 */

#include "sentrybox/security/credential_utils.hpp"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

using sentrybox::security::CredentialUtils;

TEST(CredentialUtilsTest, HashVerifiesOnlyTheRightPassword) {
    auto hash = CredentialUtils::HashPassword("correct horse", 1000);
    EXPECT_EQ(hash.rfind("pbkdf2_sha256$1000$", 0), 0u);
    EXPECT_TRUE(CredentialUtils::VerifyPassword("correct horse", hash));
    EXPECT_FALSE(CredentialUtils::VerifyPassword("correct horse ", hash));
    EXPECT_FALSE(CredentialUtils::VerifyPassword("", hash));
}

TEST(CredentialUtilsTest, HashesAreSalted) {
    EXPECT_NE(CredentialUtils::HashPassword("same", 1000), CredentialUtils::HashPassword("same", 1000));
}

TEST(CredentialUtilsTest, MalformedHashNeverVerifies) {
    EXPECT_FALSE(CredentialUtils::VerifyPassword("x", ""));
    EXPECT_FALSE(CredentialUtils::VerifyPassword("x", "md5$1$aa$bb"));
    EXPECT_FALSE(CredentialUtils::VerifyPassword("x", "pbkdf2_sha256$notanumber$aa$bb"));
    EXPECT_FALSE(CredentialUtils::VerifyPassword("x", "pbkdf2_sha256$0$aa$bb"));
}

TEST(CredentialUtilsTest, RejectsNonPositiveIterations) {
    EXPECT_THROW(CredentialUtils::HashPassword("x", 0), std::invalid_argument);
}

TEST(CredentialUtilsTest, IdentifiersAreHexOfExpectedLength) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = CredentialUtils::GenerateId();
        EXPECT_EQ(id.size(), 32u);
        EXPECT_TRUE(CredentialUtils::IsValidHex(id));
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
    EXPECT_EQ(CredentialUtils::GenerateSessionToken().size(), 64u);
}

TEST(CredentialUtilsTest, Sha256KnownVector) {
    EXPECT_EQ(CredentialUtils::SHA256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CredentialUtilsTest, ConstantTimeEquals) {
    EXPECT_TRUE(CredentialUtils::ConstantTimeEquals("abcd", "abcd"));
    EXPECT_FALSE(CredentialUtils::ConstantTimeEquals("abcd", "abce"));
    EXPECT_FALSE(CredentialUtils::ConstantTimeEquals("abc", "abcd"));
}

TEST(CredentialUtilsTest, Base64KnownVectors) {
    EXPECT_EQ(CredentialUtils::Base64Encode(""), "");
    EXPECT_EQ(CredentialUtils::Base64Encode("f"), "Zg==");
    EXPECT_EQ(CredentialUtils::Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(CredentialUtils::Base64Encode("foo"), "Zm9v");
    EXPECT_EQ(CredentialUtils::Base64Decode("Zg=="), "f");
    EXPECT_EQ(CredentialUtils::Base64Decode("Zm8="), "fo");

    const std::string binary("\x00\xff\x10", 3);
    EXPECT_EQ(CredentialUtils::Base64Decode(CredentialUtils::Base64Encode(binary)), binary);
}

TEST(CredentialUtilsTest, MalformedBase64Throws) {
    EXPECT_THROW(CredentialUtils::Base64Decode("abc"), std::invalid_argument);
    EXPECT_THROW(CredentialUtils::Base64Decode("ab!?"), std::invalid_argument);
}
