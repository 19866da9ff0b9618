/* 
 * File:   OAuth2Flow.cpp
 * Author: me
 * 
 * Created on March 9, 2024, 2:40 PM
 */

#include "OAuth2Flow.hpp"

using namespace std;

namespace sdsclient
{
    OAuth2Flow OAuth2Flow::password(const string& username, 
            const Secret& password)
    {
        return OAuth2Flow(GRANT_PASSWORD, username, password);
    }
    
    OAuth2Flow OAuth2Flow::authorizationCode(const Secret& code)
    {
        return OAuth2Flow(GRANT_AUTHORIZATION_CODE, "", code);
    }
    
    OAuth2Flow OAuth2Flow::refreshToken(const Secret& refreshToken)
    {
        return OAuth2Flow(GRANT_REFRESH_TOKEN, "", refreshToken);
    }
    
    OAuth2Flow OAuth2Flow::preIssued(const Secret& accessToken)
    {
        return OAuth2Flow(GRANT_PRE_ISSUED, "", accessToken);
    }
    
    OAuth2Flow::Grant OAuth2Flow::grant() const
    {
        return mGrant;
    }
    
    const string& OAuth2Flow::username() const
    {
        return mUsername;
    }
    
    const Secret& OAuth2Flow::credential() const
    {
        return mCredential;
    }
    
    const char* OAuth2Flow::grantType() const
    {
        switch (mGrant)
        {
            case GRANT_PASSWORD:
                return "password";
            case GRANT_AUTHORIZATION_CODE:
                return "authorization_code";
            case GRANT_REFRESH_TOKEN:
                return "refresh_token";
            case GRANT_PRE_ISSUED:
            default:
                return "";
        }
    }
    
    OAuth2Flow::OAuth2Flow(Grant grant, const string& username, 
            const Secret& credential)
    : mGrant(grant), mUsername(username), mCredential(credential)
    {
        // No body
    }

}
