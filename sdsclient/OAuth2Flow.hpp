/* 
 * File:   OAuth2Flow.hpp
 * Author: me
 *
 * Created on March 9, 2024, 2:40 PM
 */

#ifndef OAUTH2FLOW_HPP
#define	OAUTH2FLOW_HPP

#include "Secret.hpp"

#include <string>

namespace sdsclient
{
    // The way a session obtains its first connection
    class OAuth2Flow {
    public:
        enum Grant
        {
            GRANT_PASSWORD,
            GRANT_AUTHORIZATION_CODE,
            GRANT_REFRESH_TOKEN,
            // An access token obtained elsewhere. No server round trip.
            GRANT_PRE_ISSUED
        };
        
        static OAuth2Flow password(const std::string& username, 
                const Secret& password);
        
        static OAuth2Flow authorizationCode(const Secret& code);
        
        static OAuth2Flow refreshToken(const Secret& refreshToken);
        
        static OAuth2Flow preIssued(const Secret& accessToken);
        
        Grant grant() const;
        
        // Only set for GRANT_PASSWORD
        const std::string& username() const;
        
        // The password, code or token, depending on the grant
        const Secret& credential() const;
        
        // grant_type value for the token endpoint
        const char* grantType() const;
        
    private:
        Grant mGrant;
        std::string mUsername;
        Secret mCredential;
        
        OAuth2Flow(Grant grant, const std::string& username, 
                const Secret& credential);
    };

}

#endif	/* OAUTH2FLOW_HPP */
