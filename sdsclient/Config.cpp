/* 
 * File:   Config.cpp
 * Author: me
 * 
 * Created on March 6, 2024, 2:10 PM
 */

#include "Config.hpp"
#include "Errors.hpp"

using namespace std;

namespace sdsclient
{
    /**************************
    * Public Constants
    **************************/
    
    const string Config::APP_NAME = "sdsclient";
    const string Config::APP_VERSION = "0.9.0";
    
    const uint64_t Config::DEFAULT_CHUNK_SIZE = 32 * 1024 * 1024;
    const int Config::DEFAULT_MAX_RETRIES = 5;
    const int Config::MAX_RETRIES = 5;
    const long Config::DEFAULT_MIN_RETRY_DELAY = 600;
    const long Config::MIN_RETRY_DELAY_FLOOR = 300;
    const long Config::MAX_RETRY_DELAY = 20 * 1000;
    const int Config::MIN_TOKEN_COUNT = 1;
    const int Config::MAX_TOKEN_COUNT = 5;
    
    
    Config::Config()
    : mMaxRetries(DEFAULT_MAX_RETRIES), mMinRetryDelay(DEFAULT_MIN_RETRY_DELAY), 
            mMaxRetryDelay(MAX_RETRY_DELAY), mTokenRotation(MIN_TOKEN_COUNT), 
            mChunkSize(DEFAULT_CHUNK_SIZE), mConnectTimeout(0), mReadTimeout(0)
    {
        // No body
    }
    
    Config& Config::setBaseUrl(const string& baseUrl)
    {
        mBaseUrl = baseUrl;
        if (!mBaseUrl.empty() && mBaseUrl[mBaseUrl.size() - 1] != '/')
        {
            mBaseUrl += '/';
        }
        return *this;
    }
    
    Config& Config::setClientId(const string& clientId)
    {
        mClientId = clientId;
        return *this;
    }
    
    Config& Config::setClientSecret(const Secret& clientSecret)
    {
        mClientSecret = clientSecret;
        return *this;
    }
    
    Config& Config::setRedirectUri(const string& redirectUri)
    {
        mRedirectUri = redirectUri;
        return *this;
    }
    
    Config& Config::setUserAgent(const string& userAgent)
    {
        mUserAgent = userAgent;
        return *this;
    }
    
    Config& Config::setMaxRetries(int maxRetries)
    {
        mMaxRetries = (maxRetries < 0) ? 0 : 
            (maxRetries > MAX_RETRIES) ? MAX_RETRIES : maxRetries;
        return *this;
    }
    
    Config& Config::setMinRetryDelay(long milliseconds)
    {
        mMinRetryDelay = (milliseconds < MIN_RETRY_DELAY_FLOOR) ? 
            MIN_RETRY_DELAY_FLOOR : 
            (milliseconds > DEFAULT_MIN_RETRY_DELAY) ? 
                DEFAULT_MIN_RETRY_DELAY : milliseconds;
        if (mMaxRetryDelay < mMinRetryDelay)
        {
            mMaxRetryDelay = mMinRetryDelay;
        }
        return *this;
    }
    
    Config& Config::setMaxRetryDelay(long milliseconds)
    {
        mMaxRetryDelay = (milliseconds < mMinRetryDelay) ? mMinRetryDelay : 
            (milliseconds > MAX_RETRY_DELAY) ? MAX_RETRY_DELAY : milliseconds;
        return *this;
    }
    
    Config& Config::setTokenRotation(int tokenCount)
    {
        mTokenRotation = (tokenCount < MIN_TOKEN_COUNT) ? MIN_TOKEN_COUNT : 
            (tokenCount > MAX_TOKEN_COUNT) ? MAX_TOKEN_COUNT : tokenCount;
        return *this;
    }
    
    Config& Config::setChunkSize(uint64_t chunkSize)
    {
        mChunkSize = chunkSize;
        return *this;
    }
    
    Config& Config::setConnectTimeout(long seconds)
    {
        mConnectTimeout = seconds;
        return *this;
    }
    
    Config& Config::setReadTimeout(long seconds)
    {
        mReadTimeout = seconds;
        return *this;
    }
    
    const string& Config::baseUrl() const
    {
        return mBaseUrl;
    }
    
    const string& Config::clientId() const
    {
        return mClientId;
    }
    
    const Secret& Config::clientSecret() const
    {
        return mClientSecret;
    }
    
    string Config::redirectUri() const
    {
        return mRedirectUri.empty() ? mBaseUrl + "oauth/callback" : mRedirectUri;
    }
    
    string Config::userAgent() const
    {
        string base = APP_NAME + "|" + APP_VERSION;
        return mUserAgent.empty() ? base : mUserAgent + "|" + base;
    }
    
    int Config::maxRetries() const
    {
        return mMaxRetries;
    }
    
    int Config::maxAttempts() const
    {
        return mMaxRetries + 1;
    }
    
    long Config::minRetryDelay() const
    {
        return mMinRetryDelay;
    }
    
    long Config::maxRetryDelay() const
    {
        return mMaxRetryDelay;
    }
    
    int Config::tokenRotation() const
    {
        return mTokenRotation;
    }
    
    uint64_t Config::chunkSize() const
    {
        return mChunkSize;
    }
    
    long Config::connectTimeout() const
    {
        return mConnectTimeout;
    }
    
    long Config::readTimeout() const
    {
        return mReadTimeout;
    }
    
    void Config::validate() const
    {
        validateEndpoint();
        if (mClientId.empty())
        {
            throw ConfigurationError("missing client id");
        }
        if (mClientSecret.empty())
        {
            throw ConfigurationError("missing client secret");
        }
    }
    
    void Config::validateEndpoint() const
    {
        if (mBaseUrl.empty())
        {
            throw ConfigurationError("missing base URL");
        }
        if (mBaseUrl.compare(0, 8, "https://") != 0 && 
                mBaseUrl.compare(0, 7, "http://") != 0)
        {
            throw ConfigurationError("base URL must start with http:// or "
                    "https://");
        }
        size_t hostStart = mBaseUrl.find("//") + 2;
        if (hostStart >= mBaseUrl.size() - 1 || mBaseUrl[hostStart] == '/')
        {
            throw ConfigurationError("base URL has no host");
        }
        if (mChunkSize == 0)
        {
            throw ConfigurationError("chunk size must be greater than 0");
        }
    }

}
