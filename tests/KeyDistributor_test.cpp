/*
 * File:   KeyDistributor_test.cpp
 * Author: me
 *
 * Created on March 25, 2024, 9:15 AM
 */

#include "sdsclient/KeyDistributor.hpp"
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

class KeyDistributorTest : public SdsTest {
protected:
    static UserKeyPair* spMine;
    static UserKeyPair* spTheirs;

    std::unique_ptr<TokenManager> mpTokens;
    std::vector<HttpRequest> mRequests;
    PlainUserKeyPair mMinePlain;
    PlainFileKey mFileKey;

    static void SetUpTestSuite()
    {
        spMine = new UserKeyPair(Crypto::createKeyPair(Secret("mine"), 2048));
        spTheirs = new UserKeyPair(
                Crypto::createKeyPair(Secret("theirs"), 2048));
    }

    static void TearDownTestSuite()
    {
        delete spMine;
        delete spTheirs;
        spMine = NULL;
        spTheirs = NULL;
    }

    virtual void SetUp()
    {
        SdsTest::SetUp();
        mpTokens.reset(new TokenManager(mpCtx));
        mpTokens->connect(OAuth2Flow::preIssued(Secret("tok")));
        mMinePlain = Crypto::decryptPrivateKey(*spMine, Secret("mine"));
        mFileKey = PlainFileKey::generate();
        mFileKey.tag = std::string(PlainFileKey::TAG_SIZE, '\x11');
    }

    virtual void TearDown()
    {
        mpTokens.reset();
    }

    static Json item(uint64_t userId, uint64_t fileId)
    {
        Json obj;
        obj.addInt64("userId", userId).addInt64("fileId", fileId);
        return obj;
    }

    static Json user(uint64_t id, const UserKeyPair& keyPair)
    {
        Json container;
        container.addString("version", keyPair.version)
            .addString("publicKey", keyPair.publicKey);
        Json obj;
        obj.addInt64("id", id).addObject("publicKeyContainer", container);
        return obj;
    }

    Json file(uint64_t id) const
    {
        Json obj;
        obj.addInt64("id", id).addObject("fileKeyContainer",
                Crypto::encryptFileKey(mFileKey, spMine->publicKey,
                    spMine->version).toJson());
        return obj;
    }

    static std::string missingResponse(const Json& items, const Json& users,
            const Json& files, int64_t total)
    {
        Json range;
        range.addInt64("offset", 0).addInt64("limit", 50)
            .addInt64("total", total);
        Json body;
        body.addObject("items", items).addObject("users", users)
            .addObject("files", files).addObject("range", range);
        return body.toString();
    }

    // The file keys posted in request, unwrapped with keyPair
    static std::vector<PlainFileKey> postedKeys(const HttpRequest& request,
            const PlainUserKeyPair& keyPair, std::vector<uint64_t>& users)
    {
        Json body(request.body);
        std::vector<PlainFileKey> keys;
        for (int i = 0; i < body.getArrayLength("items"); i++)
        {
            Json posted = body.arrayGet("items", i);
            users.push_back((uint64_t) posted.getInt64("userId", (int64_t) 0));
            keys.push_back(Crypto::decryptFileKey(
                    FileKey::fromJson(posted.getNestedObject("fileKey")),
                    keyPair));
        }
        return keys;
    }
};

UserKeyPair* KeyDistributorTest::spMine = NULL;
UserKeyPair* KeyDistributorTest::spTheirs = NULL;

TEST_F(KeyDistributorTest, MissingKeysQueryCarriesFilters)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(200, missingResponse(Json::newArray(),
            Json::newArray(), Json::newArray(), 0), "", &mRequests)));

    KeyDistributor distributor(*mpCtx, *mpTokens);
    MissingKeys missing = distributor.getMissingFileKeys(10, 20, 30);

    EXPECT_TRUE(missing.items.empty());
    EXPECT_EQ(0u, missing.total);
    ASSERT_EQ(1u, mRequests.size());
    EXPECT_EQ(apiUrl("nodes/missingFileKeys") +
            "?file_id=10&room_id=20&user_id=30&limit=50", mRequests[0].url);
    EXPECT_EQ("Authorization: Bearer tok",
            mRequests[0].credentialHeader.expose());
}

TEST_F(KeyDistributorTest, DistributesKnownKeysToUsersWithPublicKeys)
{
    Json items = Json::newArray();
    items.arrayAppend(item(2, 10));
    items.arrayAppend(item(3, 10));
    items.arrayAppend(item(2, 11));
    Json users = Json::newArray();
    users.arrayAppend(user(2, *spTheirs));
    Json files = Json::newArray();
    files.arrayAppend(file(10));

    EXPECT_CALL(*mpTransport,
            perform(urlStartsWith(apiUrl("nodes/missingFileKeys")), _))
        .WillOnce(Invoke(Reply(200,
            missingResponse(items, users, files, 120))));
    EXPECT_CALL(*mpTransport, perform(urlIs(apiUrl("nodes/files/keys")), _))
        .WillOnce(Invoke(Reply(204, "", "", &mRequests)));

    KeyDistributor distributor(*mpCtx, *mpTokens);
    uint64_t total = distributor.distributeMissingKeys(mMinePlain);
    EXPECT_EQ(120u, total);

    ASSERT_EQ(1u, mRequests.size());
    EXPECT_EQ(POST, mRequests[0].method);
    EXPECT_EQ("application/json", requestHeader(mRequests[0],
            "Content-Type"));

    PlainUserKeyPair theirs =
            Crypto::decryptPrivateKey(*spTheirs, Secret("theirs"));
    std::vector<uint64_t> postedUsers;
    std::vector<PlainFileKey> keys =
            postedKeys(mRequests[0], theirs, postedUsers);
    ASSERT_EQ(1u, keys.size()) << "user 3 has no public key, file 11 no key";
    EXPECT_EQ(2u, postedUsers[0]);
    EXPECT_TRUE(keys[0].key == mFileKey.key);
    EXPECT_EQ(mFileKey.iv, keys[0].iv);
}

TEST_F(KeyDistributorTest, DistributeForNewFile)
{
    Json items = Json::newArray();
    items.arrayAppend(item(2, 10));
    Json users = Json::newArray();
    users.arrayAppend(user(2, *spTheirs));

    EXPECT_CALL(*mpTransport,
            perform(urlStartsWith(apiUrl("nodes/missingFileKeys")), _))
        .WillOnce(Invoke(Reply(200,
            missingResponse(items, users, Json::newArray(), 1), "",
            &mRequests)));
    EXPECT_CALL(*mpTransport, perform(urlIs(apiUrl("nodes/files/keys")), _))
        .WillOnce(Invoke(Reply(204, "", "", &mRequests)));

    KeyDistributor distributor(*mpCtx, *mpTokens);
    EXPECT_EQ(1u, distributor.distributeForFile(10, mFileKey));

    ASSERT_EQ(2u, mRequests.size());
    EXPECT_EQ(apiUrl("nodes/missingFileKeys") + "?file_id=10&limit=50",
            mRequests[0].url);
}

TEST_F(KeyDistributorTest, NothingMissingPostsNothing)
{
    EXPECT_CALL(*mpTransport,
            perform(urlStartsWith(apiUrl("nodes/missingFileKeys")), _))
        .WillOnce(Invoke(Reply(200, missingResponse(Json::newArray(),
            Json::newArray(), Json::newArray(), 0))));

    KeyDistributor distributor(*mpCtx, *mpTokens);
    EXPECT_EQ(0u, distributor.distributeForFile(10, mFileKey));
}

TEST_F(KeyDistributorTest, FailedLookupIsHttpError)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(403,
            "{\"code\":403,\"message\":\"Forbidden\"}")));

    KeyDistributor distributor(*mpCtx, *mpTokens);
    EXPECT_THROW(distributor.distributeMissingKeys(mMinePlain), HttpError);
}
