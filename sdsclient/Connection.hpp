/* 
 * File:   Connection.hpp
 * Author: me
 *
 * Created on March 9, 2024, 11:20 AM
 */

#ifndef CONNECTION_HPP
#define	CONNECTION_HPP

#include "Secret.hpp"

#include <stdint.h>
#include <time.h>

namespace sdsclient
{
    /*
     * One access/refresh token pair as issued by the token endpoint. Never
     * modified after construction; a refresh produces a new Connection.
     */
    class Connection {
    public:
        // expiresIn value for tokens that don't expire
        static const uint64_t NEVER_EXPIRES;
        
        Connection();
        
        Connection(const Secret& accessToken, const Secret& refreshToken, 
                uint64_t expiresIn, time_t issuedAt);
        
        const Secret& accessToken() const;
        
        // May be empty
        const Secret& refreshToken() const;
        
        uint64_t expiresIn() const;
        
        time_t issuedAt() const;
        
        // now > issuedAt + expiresIn, and never for NEVER_EXPIRES
        bool isExpired(time_t now) const;
        
        bool empty() const;
        
        // "Bearer {access token}"
        Secret authHeader() const;
        
    private:
        Secret mAccessToken;
        Secret mRefreshToken;
        uint64_t mExpiresIn;
        time_t mIssuedAt;
        
    };

}

#endif	/* CONNECTION_HPP */
