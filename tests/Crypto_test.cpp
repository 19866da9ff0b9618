/*
 * File:   Crypto_test.cpp
 * Author: me
 *
 * Created on March 22, 2024, 9:20 AM
 */

#include "sdsclient/Crypto.hpp"
#include "sdsclient/FileCipher.hpp"
#include "sdsclient/Errors.hpp"
#include "sdsclient/Util.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace sdsclient;
using sdsclient::test::makeContent;

class FileCipherTest : public ::testing::TestWithParam<size_t> {
protected:
    static const size_t CHUNK = 64 * 1024;

    // Encrypts content in CHUNK sized updates, like the uploader does
    static std::string encrypt(const std::string& content,
            PlainFileKey& key)
    {
        FileEncrypter encrypter;
        std::string cipher;
        for (size_t offset = 0; offset < content.size(); offset += CHUNK)
        {
            size_t len = std::min(CHUNK, content.size() - offset);
            encrypter.update(content.data() + offset, len, cipher);
        }
        encrypter.finalize(cipher);
        key = encrypter.fileKey();
        return cipher;
    }
};

const size_t FileCipherTest::CHUNK;

TEST_P(FileCipherTest, RoundTripsContent)
{
    std::string content = makeContent(GetParam());
    PlainFileKey key;
    std::string cipher = encrypt(content, key);
    EXPECT_EQ(content.size(), cipher.size()) << "GCM adds no padding";
    EXPECT_EQ(PlainFileKey::TAG_SIZE, key.tag.size());

    FileDecrypter decrypter(key, cipher.size());
    // Feed it back in uneven pieces
    size_t offset = 0;
    size_t piece = 1000;
    while (offset < cipher.size())
    {
        size_t len = std::min(piece, cipher.size() - offset);
        decrypter.update(cipher.data() + offset, len);
        offset += len;
        piece = piece * 3 + 7;
    }
    EXPECT_TRUE(decrypter.finalize() == content);
}

INSTANTIATE_TEST_SUITE_P(Sizes, FileCipherTest,
        ::testing::Values(0, 1, 64 * 1024 - 1, 64 * 1024, 64 * 1024 + 1));

TEST(FileCipherTamperTest, TamperedContentFailsAuthentication)
{
    std::string content = makeContent(5000);
    FileEncrypter encrypter;
    std::string cipher;
    encrypter.update(content.data(), content.size(), cipher);
    encrypter.finalize(cipher);

    cipher[1234] ^= 0x01;
    FileDecrypter decrypter(encrypter.fileKey(), cipher.size());
    decrypter.update(cipher.data(), cipher.size());
    EXPECT_THROW(decrypter.finalize(), CryptoError);
}

TEST(FileCipherTamperTest, WrongTagFailsAuthentication)
{
    std::string content = makeContent(100);
    FileEncrypter encrypter;
    std::string cipher;
    encrypter.update(content.data(), content.size(), cipher);
    encrypter.finalize(cipher);

    PlainFileKey key = encrypter.fileKey();
    key.tag[0] ^= 0x80;
    FileDecrypter decrypter(key, cipher.size());
    decrypter.update(cipher.data(), cipher.size());
    EXPECT_THROW(decrypter.finalize(), CryptoError);
}

TEST(FileCipherTamperTest, EncrypterRejectsUpdateAfterFinalize)
{
    FileEncrypter encrypter;
    std::string cipher;
    encrypter.finalize(cipher);
    EXPECT_THROW(encrypter.update("x", 1, cipher), CryptoError);
}

class CryptoTest : public ::testing::Test {
protected:
    static UserKeyPair* spKeyPair;

    static void SetUpTestSuite()
    {
        spKeyPair = new UserKeyPair(
                Crypto::createKeyPair(Secret("correct horse"), 2048));
    }

    static void TearDownTestSuite()
    {
        delete spKeyPair;
        spKeyPair = NULL;
    }
};

UserKeyPair* CryptoTest::spKeyPair = NULL;

TEST_F(CryptoTest, KeyPairCarriesVersionAndPem)
{
    EXPECT_EQ("RSA-2048", spKeyPair->version);
    EXPECT_NE(std::string::npos,
            spKeyPair->publicKey.find("BEGIN PUBLIC KEY"));
    EXPECT_NE(std::string::npos,
            spKeyPair->encryptedPrivateKey.find("ENCRYPTED PRIVATE KEY"));
}

TEST_F(CryptoTest, WrapsAndUnwrapsFileKey)
{
    PlainUserKeyPair plain =
            Crypto::decryptPrivateKey(*spKeyPair, Secret("correct horse"));
    ASSERT_FALSE(plain.privateKey.empty());

    PlainFileKey original = PlainFileKey::generate();
    original.tag = std::string(PlainFileKey::TAG_SIZE, '\x5a');

    FileKey wrapped = Crypto::encryptFileKey(original, spKeyPair->publicKey,
            spKeyPair->version);
    EXPECT_EQ("RSA-2048/AES-256-GCM", wrapped.version);
    EXPECT_EQ(original.iv, Util::base64Decode(wrapped.iv));
    EXPECT_EQ(original.tag, Util::base64Decode(wrapped.tag));

    PlainFileKey unwrapped = Crypto::decryptFileKey(wrapped, plain);
    EXPECT_TRUE(unwrapped.key == original.key);
    EXPECT_EQ(original.iv, unwrapped.iv);
    EXPECT_EQ(original.tag, unwrapped.tag);
}

TEST_F(CryptoTest, WrongSecretIsCryptoError)
{
    EXPECT_THROW(Crypto::decryptPrivateKey(*spKeyPair, Secret("wrong")),
            CryptoError);
}

TEST_F(CryptoTest, EmptySecretIsMissingEncryptionSecret)
{
    EXPECT_THROW(Crypto::decryptPrivateKey(*spKeyPair, Secret()),
            MissingEncryptionSecret);
    EXPECT_THROW(Crypto::createKeyPair(Secret(), 2048),
            MissingEncryptionSecret);
}

TEST_F(CryptoTest, KeyPairJsonRoundTrip)
{
    UserKeyPair copy = UserKeyPair::fromJson(spKeyPair->toJson());
    EXPECT_EQ(spKeyPair->version, copy.version);
    EXPECT_EQ(spKeyPair->publicKey, copy.publicKey);
    EXPECT_EQ(spKeyPair->encryptedPrivateKey, copy.encryptedPrivateKey);
}

TEST(FileKeyTest, IncompleteJsonIsRejected)
{
    Json json;
    json.addString("key", "abc").addString("version", "RSA-4096/AES-256-GCM");
    EXPECT_THROW(FileKey::fromJson(json), CryptoError);
}
