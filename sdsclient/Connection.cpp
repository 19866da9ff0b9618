/* 
 * File:   Connection.cpp
 * Author: me
 * 
 * Created on March 9, 2024, 11:20 AM
 */

#include "Connection.hpp"

#include <openssl/crypto.h>
#include <string>

using namespace std;

namespace sdsclient
{
    const uint64_t Connection::NEVER_EXPIRES = UINT64_MAX;
    
    Connection::Connection()
    : mExpiresIn(0), mIssuedAt(0)
    {
        // No body
    }
    
    Connection::Connection(const Secret& accessToken, 
            const Secret& refreshToken, uint64_t expiresIn, time_t issuedAt)
    : mAccessToken(accessToken), mRefreshToken(refreshToken), 
            mExpiresIn(expiresIn), mIssuedAt(issuedAt)
    {
        // No body
    }
    
    const Secret& Connection::accessToken() const
    {
        return mAccessToken;
    }
    
    const Secret& Connection::refreshToken() const
    {
        return mRefreshToken;
    }
    
    uint64_t Connection::expiresIn() const
    {
        return mExpiresIn;
    }
    
    time_t Connection::issuedAt() const
    {
        return mIssuedAt;
    }
    
    bool Connection::isExpired(time_t now) const
    {
        if (mExpiresIn == NEVER_EXPIRES || now <= mIssuedAt)
        {
            return false;
        }
        return (uint64_t) (now - mIssuedAt) > mExpiresIn;
    }
    
    bool Connection::empty() const
    {
        return mAccessToken.empty();
    }
    
    Secret Connection::authHeader() const
    {
        string header = "Bearer " + mAccessToken.expose();
        Secret result(header);
        OPENSSL_cleanse(&header[0], header.size());
        return result;
    }

}
