/*
 * File:   Config_test.cpp
 * Author: me
 *
 * Created on March 21, 2024, 10:40 AM
 */

#include "sdsclient/Config.hpp"
#include "sdsclient/Errors.hpp"

#include <gtest/gtest.h>

using namespace sdsclient;

class ConfigTest : public ::testing::Test {
protected:
    Config mConfig;

    virtual void SetUp()
    {
        mConfig.setBaseUrl("https://sds.example.com")
            .setClientId("client")
            .setClientSecret(Secret("secret"));
    }
};

TEST_F(ConfigTest, Defaults)
{
    Config config;
    EXPECT_EQ(5, config.maxRetries());
    EXPECT_EQ(6, config.maxAttempts());
    EXPECT_EQ(600, config.minRetryDelay());
    EXPECT_EQ(20000, config.maxRetryDelay());
    EXPECT_EQ(1, config.tokenRotation());
    EXPECT_EQ(32u * 1024 * 1024, config.chunkSize());
}

TEST_F(ConfigTest, BaseUrlGetsTrailingSlash)
{
    EXPECT_EQ("https://sds.example.com/", mConfig.baseUrl());
    mConfig.setBaseUrl("https://sds.example.com/");
    EXPECT_EQ("https://sds.example.com/", mConfig.baseUrl());
}

TEST_F(ConfigTest, NumericSettersClamp)
{
    mConfig.setMaxRetries(-3);
    EXPECT_EQ(0, mConfig.maxRetries());
    EXPECT_EQ(1, mConfig.maxAttempts());
    mConfig.setMaxRetries(50);
    EXPECT_EQ(5, mConfig.maxRetries());

    mConfig.setMinRetryDelay(10);
    EXPECT_EQ(300, mConfig.minRetryDelay());
    mConfig.setMinRetryDelay(5000);
    EXPECT_EQ(600, mConfig.minRetryDelay());

    mConfig.setMaxRetryDelay(100);
    EXPECT_EQ(mConfig.minRetryDelay(), mConfig.maxRetryDelay());
    mConfig.setMaxRetryDelay(1000000);
    EXPECT_EQ(20000, mConfig.maxRetryDelay());

    mConfig.setTokenRotation(0);
    EXPECT_EQ(1, mConfig.tokenRotation());
    mConfig.setTokenRotation(9);
    EXPECT_EQ(5, mConfig.tokenRotation());
}

TEST_F(ConfigTest, UserAgentCarriesLibraryName)
{
    EXPECT_EQ("sdsclient|0.9.0", mConfig.userAgent());
    mConfig.setUserAgent("backup-tool/2.1");
    EXPECT_EQ("backup-tool/2.1|sdsclient|0.9.0", mConfig.userAgent());
}

TEST_F(ConfigTest, RedirectUriDefaultsToCallback)
{
    EXPECT_EQ("https://sds.example.com/oauth/callback", mConfig.redirectUri());
    mConfig.setRedirectUri("http://localhost:8080/cb");
    EXPECT_EQ("http://localhost:8080/cb", mConfig.redirectUri());
}

TEST_F(ConfigTest, ValidateAcceptsCompleteConfig)
{
    EXPECT_NO_THROW(mConfig.validate());
}

TEST_F(ConfigTest, ValidateRejectsBadBaseUrl)
{
    mConfig.setBaseUrl("");
    EXPECT_THROW(mConfig.validate(), ConfigurationError);
    mConfig.setBaseUrl("ftp://sds.example.com");
    EXPECT_THROW(mConfig.validate(), ConfigurationError);
    mConfig.setBaseUrl("https://");
    EXPECT_THROW(mConfig.validate(), ConfigurationError);
}

TEST_F(ConfigTest, ValidateRequiresClientCredentials)
{
    Config noId;
    noId.setBaseUrl("https://sds.example.com").setClientSecret(Secret("s"));
    EXPECT_THROW(noId.validate(), ConfigurationError);

    Config noSecret;
    noSecret.setBaseUrl("https://sds.example.com").setClientId("client");
    EXPECT_THROW(noSecret.validate(), ConfigurationError);
    EXPECT_NO_THROW(noSecret.validateEndpoint());
}

TEST_F(ConfigTest, ValidateRejectsZeroChunkSize)
{
    mConfig.setChunkSize(0);
    try
    {
        mConfig.validate();
        FAIL() << "zero chunk size was accepted";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_NE(std::string::npos,
                std::string(e.what()).find("chunk size"));
    }
}
