/* 
 * File:   TokenManager.hpp
 * Author: me
 *
 * Created on March 9, 2024, 3:30 PM
 */

#ifndef TOKENMANAGER_HPP
#define	TOKENMANAGER_HPP

#include "CredentialStore.hpp"
#include "Secret.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace sdsclient
{
    class SdsContext;
    class HttpTransfer;
    class OAuth2Flow;
    
    /*
     * Obtains, refreshes and revokes OAuth2 tokens, and hands out 
     * authorization headers. With a rotation pool of N connections, 
     * consecutive headers come from main, additional 0, ..., additional N-2,
     * main, and so on.
     * 
     * Thread safe. The whole check-refresh-advance sequence of 
     * getAuthHeader() runs under one lock.
     */
    class TokenManager {
    public:
        static const std::string URL_AUTH_TOKEN;
        static const std::string URL_AUTH_REVOKE;
        static const std::string URL_AUTH_AUTHORIZE;
        
        explicit TokenManager(std::shared_ptr<SdsContext> ctx);
        
        virtual ~TokenManager();
        
        // URL the user opens in a browser to start the code grant
        static std::string authorizeUrl(const SdsContext& ctx, 
                const std::string& state);
        
        /*
         * connect():   Runs the flow and, if the configured rotation pool is
         *              larger than one, fills the rest of the pool with 
         *              refresh-token exchanges. Any failure leaves the store
         *              as it was.
         * Throws:
         *      AuthenticationError if the server rejected the grant, 
         *      ConnectionError, or HttpError.
         */
        void connect(const OAuth2Flow& flow);
        
        // "Bearer {token}", refreshing the serving connection first if it
        // has expired
        Secret getAuthHeader();
        
        /*
         * revoke():    Revokes the tokens of every connection on the server.
         *              Failures are logged and otherwise ignored; the store 
         *              is cleared in any case.
         */
        void revoke(bool revokeAccess, bool revokeRefresh);
        
        void clear();
        
        bool isConnected() const;
        
        // Copy of the main connection, e.g. to save its refresh token
        Connection mainConnection() const;
        
    private:
        static const std::string FIELDNAME_ACCESSTOKEN;
        static const std::string FIELDNAME_REFRESHTOKEN;
        static const std::string FIELDNAME_EXPIRESIN;
        static const std::string FIELDNAME_CODE;
        static const std::string FIELDNAME_CLIENTID;
        static const std::string FIELDNAME_CLIENTSECRET;
        static const std::string FIELDNAME_GRANTTYPE;
        static const std::string FIELDNAME_REDIRECTURI;
        static const std::string FIELDNAME_USERNAME;
        static const std::string FIELDNAME_PASSWORD;
        static const std::string FIELDNAME_TOKEN;
        static const std::string FIELDNAME_TOKENTYPEHINT;
        
        std::shared_ptr<SdsContext> mpCtx;
        CredentialStore mStore;
        mutable std::mutex mMutex;
        
        Connection exchange(const OAuth2Flow& flow);
        
        Connection refresh(const Connection& connection);
        
        Connection requestToken(HttpTransfer& xfer, 
                const Secret& previousRefreshToken);
        
        void revokeToken(const Secret& token, const std::string& hint);
        
        TokenManager(const TokenManager& orig);
    };

}

#endif	/* TOKENMANAGER_HPP */
