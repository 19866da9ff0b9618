/*
 * File:   KeyPairService_test.cpp
 * Author: me
 *
 * Created on March 26, 2024, 10:20 AM
 */

#include "sdsclient/KeyPairService.hpp"
#include "sdsclient/TokenManager.hpp"
#include "sdsclient/OAuth2Flow.hpp"
#include "sdsclient/Errors.hpp"
#include "TestSupport.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace sdsclient;
using namespace sdsclient::test;
using ::testing::_;
using ::testing::Invoke;

class KeyPairServiceTest : public SdsTest {
protected:
    static UserKeyPair* spKeyPair;

    std::unique_ptr<TokenManager> mpTokens;
    std::unique_ptr<KeyPairService> mpService;
    std::vector<HttpRequest> mRequests;

    static void SetUpTestSuite()
    {
        spKeyPair = new UserKeyPair(
                Crypto::createKeyPair(Secret("unlock-me"), 2048));
    }

    static void TearDownTestSuite()
    {
        delete spKeyPair;
        spKeyPair = NULL;
    }

    virtual void SetUp()
    {
        SdsTest::SetUp();
        mpTokens.reset(new TokenManager(mpCtx));
        mpTokens->connect(OAuth2Flow::preIssued(Secret("tok")));
        mpService.reset(new KeyPairService(*mpCtx, *mpTokens));
    }

    virtual void TearDown()
    {
        mpService.reset();
        mpTokens.reset();
    }

    void expectKeyPairFetch()
    {
        EXPECT_CALL(*mpTransport,
                perform(urlIs(apiUrl("user/account/keypair")), _))
            .WillOnce(Invoke(Reply(200, spKeyPair->toJson().toString(), "",
                &mRequests)));
    }
};

UserKeyPair* KeyPairServiceTest::spKeyPair = NULL;

TEST_F(KeyPairServiceTest, GetUserKeyPairReadsAccountContainer)
{
    expectKeyPairFetch();

    UserKeyPair keyPair = mpService->getUserKeyPair();

    EXPECT_EQ("RSA-2048", keyPair.version);
    EXPECT_EQ(spKeyPair->publicKey, keyPair.publicKey);
    EXPECT_EQ(spKeyPair->encryptedPrivateKey, keyPair.encryptedPrivateKey);
    ASSERT_EQ(1u, mRequests.size());
    EXPECT_EQ(GET, mRequests[0].method);
    EXPECT_EQ("Authorization: Bearer tok",
            mRequests[0].credentialHeader.expose());
}

TEST_F(KeyPairServiceTest, FirstUnlockFetchesThenCaches)
{
    expectKeyPairFetch();

    PlainUserKeyPair first = mpService->getUnlockedKeyPair(
            Secret("unlock-me"));
    EXPECT_TRUE(mpService->isUnlocked());
    EXPECT_FALSE(first.privateKey.empty());
    EXPECT_EQ(spKeyPair->publicKey, first.publicKey);

    // Served from the cache, the strict transport allows no second fetch
    PlainUserKeyPair second = mpService->getUnlockedKeyPair();
    EXPECT_TRUE(first.privateKey == second.privateKey);
    EXPECT_EQ(1u, mRequests.size());
}

TEST_F(KeyPairServiceTest, UnlockedPairUnwrapsFileKeys)
{
    expectKeyPairFetch();
    PlainFileKey fileKey = PlainFileKey::generate();
    FileKey wrapped = Crypto::encryptFileKey(fileKey, spKeyPair->publicKey,
            spKeyPair->version);

    PlainUserKeyPair keyPair = mpService->getUnlockedKeyPair(
            Secret("unlock-me"));

    EXPECT_TRUE(fileKey.key == Crypto::decryptFileKey(wrapped, keyPair).key);
}

TEST_F(KeyPairServiceTest, MissingSecretMakesNoRequest)
{
    EXPECT_THROW(mpService->getUnlockedKeyPair(), MissingEncryptionSecret);
    EXPECT_FALSE(mpService->isUnlocked());
}

TEST_F(KeyPairServiceTest, WrongSecretStaysLocked)
{
    expectKeyPairFetch();

    EXPECT_THROW(mpService->getUnlockedKeyPair(Secret("guess")), CryptoError);
    EXPECT_FALSE(mpService->isUnlocked());
}

TEST_F(KeyPairServiceTest, ClearForgetsUnlockedPair)
{
    expectKeyPairFetch();
    mpService->getUnlockedKeyPair(Secret("unlock-me"));

    mpService->clear();

    EXPECT_FALSE(mpService->isUnlocked());
    EXPECT_THROW(mpService->getUnlockedKeyPair(), MissingEncryptionSecret);
}

TEST_F(KeyPairServiceTest, FetchFailureIsHttpError)
{
    EXPECT_CALL(*mpTransport,
            perform(urlIs(apiUrl("user/account/keypair")), _))
        .WillOnce(Invoke(Reply(404,
            "{\"code\":404,\"message\":\"No key pair\",\"errorCode\":-70020}")));

    try
    {
        mpService->getUnlockedKeyPair(Secret("unlock-me"));
        FAIL() << "expected HttpError";
    }
    catch (const HttpError& e)
    {
        EXPECT_TRUE(e.response().isNotFound());
    }
    EXPECT_FALSE(mpService->isUnlocked());
}
