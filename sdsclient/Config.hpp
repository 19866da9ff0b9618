/* 
 * File:   Config.hpp
 * Author: me
 *
 * Created on March 6, 2024, 2:10 PM
 */

#ifndef CONFIG_HPP
#define	CONFIG_HPP

#include "Secret.hpp"

#include <stdint.h>
#include <string>

namespace sdsclient
{
    /*
     * Static client settings. Numeric setters clamp their argument to the
     * limits the service accepts; validate() checks everything else.
     */
    class Config {
    public:
        static const std::string APP_NAME;
        static const std::string APP_VERSION;
        
        static const uint64_t DEFAULT_CHUNK_SIZE;
        static const int DEFAULT_MAX_RETRIES;
        static const int MAX_RETRIES;
        static const long DEFAULT_MIN_RETRY_DELAY;
        static const long MIN_RETRY_DELAY_FLOOR;
        static const long MAX_RETRY_DELAY;
        static const int MIN_TOKEN_COUNT;
        static const int MAX_TOKEN_COUNT;
        
        Config();
        
        Config& setBaseUrl(const std::string& baseUrl);
        
        Config& setClientId(const std::string& clientId);
        
        Config& setClientSecret(const Secret& clientSecret);
        
        Config& setRedirectUri(const std::string& redirectUri);
        
        Config& setUserAgent(const std::string& userAgent);
        
        Config& setMaxRetries(int maxRetries);
        
        Config& setMinRetryDelay(long milliseconds);
        
        Config& setMaxRetryDelay(long milliseconds);
        
        Config& setTokenRotation(int tokenCount);
        
        Config& setChunkSize(uint64_t chunkSize);
        
        Config& setConnectTimeout(long seconds);
        
        Config& setReadTimeout(long seconds);
        
        // Always ends with '/'
        const std::string& baseUrl() const;
        
        const std::string& clientId() const;
        
        const Secret& clientSecret() const;
        
        // Defaults to {baseUrl}oauth/callback
        std::string redirectUri() const;
        
        // "{custom}|sdsclient|{version}" or "sdsclient|{version}"
        std::string userAgent() const;
        
        int maxRetries() const;
        
        // First attempt plus retries
        int maxAttempts() const;
        
        long minRetryDelay() const;
        
        long maxRetryDelay() const;
        
        int tokenRotation() const;
        
        uint64_t chunkSize() const;
        
        long connectTimeout() const;
        
        long readTimeout() const;
        
        // Throws ConfigurationError
        void validate() const;
        
        // Base URL and chunk size only, for sessions without OAuth
        void validateEndpoint() const;
        
    private:
        std::string mBaseUrl;
        std::string mClientId;
        Secret mClientSecret;
        std::string mRedirectUri;
        std::string mUserAgent;
        int mMaxRetries;
        long mMinRetryDelay;
        long mMaxRetryDelay;
        int mTokenRotation;
        uint64_t mChunkSize;
        long mConnectTimeout;
        long mReadTimeout;
        
    };

}

#endif	/* CONFIG_HPP */
