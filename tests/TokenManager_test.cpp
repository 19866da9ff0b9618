/*
 * File:   TokenManager_test.cpp
 * Author: me
 *
 * Created on March 22, 2024, 11:00 AM
 */

#include "sdsclient/TokenManager.hpp"
#include "sdsclient/OAuth2Flow.hpp"
#include "sdsclient/Errors.hpp"
#include "sdsclient/Util.hpp"
#include "TestSupport.hpp"

#include <string>
#include <vector>

using namespace sdsclient;
using namespace sdsclient::test;
using ::testing::_;
using ::testing::Invoke;

class TokenManagerTest : public SdsTest {
protected:
    std::vector<HttpRequest> mRequests;

    void useRotation(int tokenCount)
    {
        Config config = testConfig();
        config.setTokenRotation(tokenCount);
        makeContext(config);
    }

    Reply token(const std::string& access, const std::string& refresh,
            long expiresIn=3600)
    {
        return Reply(200, tokenResponse(access, refresh, expiresIn), "",
                &mRequests);
    }

    static std::string header(TokenManager& tokens)
    {
        return tokens.getAuthHeader().expose();
    }
};

TEST_F(TokenManagerTest, PasswordGrantUsesBasicClientCredentials)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));

    ASSERT_EQ(1u, mRequests.size());
    const HttpRequest& request = mRequests[0];
    EXPECT_EQ(POST, request.method);
    EXPECT_EQ("https://sds.example.com/oauth/token", request.url);
    EXPECT_EQ("Authorization: Basic " +
            Util::base64UrlEncodeNoPad("client:secret"),
            request.credentialHeader.expose());
    EXPECT_EQ("password", formField(request, "grant_type"));
    EXPECT_EQ("alice", formField(request, "username"));
    EXPECT_EQ("pw", formField(request, "password"));
    EXPECT_EQ("application/x-www-form-urlencoded",
            requestHeader(request, "Content-Type"));

    EXPECT_TRUE(tokens.isConnected());
    EXPECT_EQ("Bearer a0", header(tokens));
    EXPECT_EQ("r0", tokens.mainConnection().refreshToken().expose());
}

TEST_F(TokenManagerTest, AuthorizationCodeGrantSendsRedirect)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::authorizationCode(Secret("the-code")));

    ASSERT_EQ(1u, mRequests.size());
    EXPECT_EQ("authorization_code", formField(mRequests[0], "grant_type"));
    EXPECT_EQ("the-code", formField(mRequests[0], "code"));
    EXPECT_EQ("https://sds.example.com/oauth/callback",
            formField(mRequests[0], "redirect_uri"));
    EXPECT_EQ("client", formField(mRequests[0], "client_id"));
    EXPECT_EQ("secret", formField(mRequests[0], "client_secret"));
    EXPECT_TRUE(mRequests[0].credentialHeader.empty());
}

TEST_F(TokenManagerTest, RotationServesPoolInOrder)
{
    useRotation(3);
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")))
        .WillOnce(Invoke(token("a1", "r1")))
        .WillOnce(Invoke(token("a2", "r2")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));

    ASSERT_EQ(3u, mRequests.size());
    EXPECT_EQ("refresh_token", formField(mRequests[1], "grant_type"));
    EXPECT_EQ("r0", formField(mRequests[1], "refresh_token"));
    EXPECT_EQ("r0", formField(mRequests[2], "refresh_token"));

    EXPECT_EQ("Bearer a0", header(tokens));
    EXPECT_EQ("Bearer a1", header(tokens));
    EXPECT_EQ("Bearer a2", header(tokens));
    EXPECT_EQ("Bearer a0", header(tokens));
}

TEST_F(TokenManagerTest, ExpiredSlotIsRefreshedWithoutAdvancing)
{
    useRotation(2);
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")))
        .WillOnce(Invoke(token("a1", "r1")))
        .WillOnce(Invoke(token("a1-renewed", "r1-renewed")))
        .WillOnce(Invoke(token("a0-renewed", "r0-renewed")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));
    EXPECT_EQ("Bearer a0", header(tokens));

    mpClock->current += 3601;

    // Slot 1 has expired: renewed, served, and still current
    EXPECT_EQ("Bearer a1-renewed", header(tokens));
    ASSERT_EQ(3u, mRequests.size());
    EXPECT_EQ("r1", formField(mRequests[2], "refresh_token"));

    EXPECT_EQ("Bearer a1-renewed", header(tokens));
    EXPECT_EQ("Bearer a0-renewed", header(tokens));
    EXPECT_EQ("r0", formField(mRequests[3], "refresh_token"));
}

TEST_F(TokenManagerTest, RefreshKeepsTokenWhenResponseOmitsIt)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::refreshToken(Secret("saved")));

    EXPECT_EQ("saved", formField(mRequests[0], "refresh_token"));
    Connection main = tokens.mainConnection();
    EXPECT_EQ("a0", main.accessToken().expose());
    EXPECT_EQ("saved", main.refreshToken().expose());
}

TEST_F(TokenManagerTest, MissingExpiryNeverExpires)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0", 0)));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));
    EXPECT_EQ(Connection::NEVER_EXPIRES, tokens.mainConnection().expiresIn());
}

TEST_F(TokenManagerTest, RejectedGrantLeavesSessionUntouched)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")))
        .WillOnce(Invoke(Reply(400,
            "{\"error\":\"invalid_grant\","
            "\"error_description\":\"Bad credentials\"}")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));

    try
    {
        tokens.connect(OAuth2Flow::password("alice", Secret("wrong")));
        FAIL() << "rejected grant did not throw";
    }
    catch (const AuthenticationError& e)
    {
        EXPECT_EQ(400, e.httpStatus());
        EXPECT_EQ("invalid_grant", e.error());
        EXPECT_EQ("Bad credentials", e.description());
    }
    EXPECT_EQ("Bearer a0", header(tokens));
    EXPECT_TRUE(mpSleeper->delays.empty()) << "4xx must not be retried";
}

TEST_F(TokenManagerTest, ConnectGivesUpAfterMaxAttemptsOn429)
{
    int maxAttempts = mpCtx->config().maxAttempts();
    EXPECT_CALL(*mpTransport, perform(urlIs(
            "https://sds.example.com/oauth/token"), _))
        .Times(maxAttempts)
        .WillRepeatedly(Invoke(Reply(429,
            "{\"code\":429,\"message\":\"Too many requests\"}")));

    TokenManager tokens(mpCtx);
    try
    {
        tokens.connect(OAuth2Flow::password("alice", Secret("pw")));
        FAIL() << "throttled grant did not throw";
    }
    catch (const AuthenticationError& e)
    {
        FAIL() << "throttling is not a rejected grant: " << e.what();
    }
    catch (const HttpError& e)
    {
        EXPECT_TRUE(e.response().isTooManyRequests());
    }
    EXPECT_FALSE(tokens.isConnected());
    EXPECT_EQ((size_t) (maxAttempts - 1), mpSleeper->delays.size());
}

TEST_F(TokenManagerTest, PreIssuedTokenIgnoresRotation)
{
    useRotation(4);

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::preIssued(Secret("issued-elsewhere")));

    EXPECT_EQ("Bearer issued-elsewhere", header(tokens));
    EXPECT_EQ("Bearer issued-elsewhere", header(tokens));
    EXPECT_EQ(Connection::NEVER_EXPIRES, tokens.mainConnection().expiresIn());
}

TEST_F(TokenManagerTest, NotConnectedHasNoHeader)
{
    TokenManager tokens(mpCtx);
    EXPECT_FALSE(tokens.isConnected());
    EXPECT_THROW(tokens.getAuthHeader(), AuthenticationError);
}

TEST_F(TokenManagerTest, RevokeCoversEveryConnectionAndClears)
{
    useRotation(2);
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")))
        .WillOnce(Invoke(token("a1", "r1")))
        .WillOnce(Invoke(Reply(200, "", "", &mRequests)))
        .WillOnce(Invoke(Reply(400, "{\"error\":\"invalid_token\"}", "",
            &mRequests)))
        .WillOnce(Invoke(Reply(200, "", "", &mRequests)))
        .WillOnce(Invoke(Reply(200, "", "", &mRequests)));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));
    tokens.revoke(true, true);

    EXPECT_FALSE(tokens.isConnected());
    ASSERT_EQ(6u, mRequests.size());
    EXPECT_EQ("https://sds.example.com/oauth/revoke", mRequests[2].url);
    EXPECT_EQ("access_token", formField(mRequests[2], "token_type_hint"));
    EXPECT_EQ("a0", formField(mRequests[2], "token"));
    EXPECT_EQ("refresh_token", formField(mRequests[3], "token_type_hint"));
    EXPECT_EQ("r0", formField(mRequests[3], "token"));
    EXPECT_EQ("a1", formField(mRequests[4], "token"));
    EXPECT_EQ("r1", formField(mRequests[5], "token"));
}

TEST_F(TokenManagerTest, RevokeRefreshOnlyStillClears)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")))
        .WillOnce(Invoke(Reply(200, "", "", &mRequests)));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));
    tokens.revoke(false, true);

    EXPECT_FALSE(tokens.isConnected());
    EXPECT_THROW(tokens.getAuthHeader(), AuthenticationError);
    ASSERT_EQ(2u, mRequests.size());
    EXPECT_EQ("https://sds.example.com/oauth/revoke", mRequests[1].url);
    EXPECT_EQ("refresh_token", formField(mRequests[1], "token_type_hint"));
    EXPECT_EQ("r0", formField(mRequests[1], "token"));
}

TEST_F(TokenManagerTest, RevokeNothingStillClears)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(token("a0", "r0")));

    TokenManager tokens(mpCtx);
    tokens.connect(OAuth2Flow::password("alice", Secret("pw")));
    tokens.revoke(false, false);

    EXPECT_FALSE(tokens.isConnected());
    EXPECT_EQ(1u, mRequests.size());
}

TEST_F(TokenManagerTest, AuthorizeUrlCarriesClientAndState)
{
    std::string url = TokenManager::authorizeUrl(*mpCtx, "xyz");
    EXPECT_EQ(0u, url.find("https://sds.example.com/oauth/authorize?"));
    EXPECT_NE(std::string::npos, url.find("response_type=code"));
    EXPECT_NE(std::string::npos, url.find("client_id=client"));
    EXPECT_NE(std::string::npos, url.find("state=xyz"));
    EXPECT_NE(std::string::npos, url.find(
            "redirect_uri=https%3A%2F%2Fsds.example.com%2Foauth%2Fcallback"));
}
