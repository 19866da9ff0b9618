/* 
 * File:   TokenManager.cpp
 * Author: me
 * 
 * Created on March 9, 2024, 3:30 PM
 */

#include "TokenManager.hpp"
#include "OAuth2Flow.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "HttpQuery.hpp"
#include "Timing.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Util.hpp"
#include "Log.hpp"

#include <openssl/crypto.h>

using namespace std;

namespace sdsclient
{
    /**************************
    * Public Constants
    **************************/
    
    const string TokenManager::URL_AUTH_TOKEN = "oauth/token";
    const string TokenManager::URL_AUTH_REVOKE = "oauth/revoke";
    const string TokenManager::URL_AUTH_AUTHORIZE = "oauth/authorize";
    
    /**************************
    * Private Constants
    **************************/
    
    const string TokenManager::FIELDNAME_ACCESSTOKEN = "access_token";
    const string TokenManager::FIELDNAME_REFRESHTOKEN = "refresh_token";
    const string TokenManager::FIELDNAME_EXPIRESIN = "expires_in";
    const string TokenManager::FIELDNAME_CODE = "code";
    const string TokenManager::FIELDNAME_CLIENTID = "client_id";
    const string TokenManager::FIELDNAME_CLIENTSECRET = "client_secret";
    const string TokenManager::FIELDNAME_GRANTTYPE = "grant_type";
    const string TokenManager::FIELDNAME_REDIRECTURI = "redirect_uri";
    const string TokenManager::FIELDNAME_USERNAME = "username";
    const string TokenManager::FIELDNAME_PASSWORD = "password";
    const string TokenManager::FIELDNAME_TOKEN = "token";
    const string TokenManager::FIELDNAME_TOKENTYPEHINT = "token_type_hint";
    
    
    TokenManager::TokenManager(shared_ptr<SdsContext> ctx)
    : mpCtx(ctx)
    {
        // No body
    }

    TokenManager::~TokenManager()
    {
        // Empty
    }
    
    string TokenManager::authorizeUrl(const SdsContext& ctx, 
            const string& state)
    {
        const Config& config = ctx.config();
        HttpQuery query("response_type", "code");
        query.add(FIELDNAME_CLIENTID, config.clientId())
            .add(FIELDNAME_REDIRECTURI, config.redirectUri())
            .add("scope", "all");
        if (!state.empty())
        {
            query.add("state", state);
        }
        return query.assemble(ctx.url(URL_AUTH_AUTHORIZE));
    }
    
    void TokenManager::connect(const OAuth2Flow& flow)
    {
        // Build the whole pool before touching the store
        CredentialStore newStore;
        newStore.setMain(exchange(flow));
        
        int poolSize = mpCtx->config().tokenRotation();
        if (poolSize > 1)
        {
            if (flow.grant() == OAuth2Flow::GRANT_PRE_ISSUED)
            {
                SDS_LOG_WARN << "Token rotation needs a refresh token, "
                        "using a single pre-issued token";
            }
            else
            {
                for (int i = 1; i < poolSize; i++)
                {
                    newStore.addAdditional(refresh(newStore.get(0)));
                }
                SDS_LOG_DEBUG << "Token rotation pool filled";
            }
        }
        
        SDS_LOG_INFO << "Connected with grant " 
                << (flow.grant() == OAuth2Flow::GRANT_PRE_ISSUED ? 
                    "pre-issued" : flow.grantType()) 
                << ", " << newStore.size() << " token(s) in the pool";
        
        lock_guard<mutex> lock(mMutex);
        mStore.swap(newStore);
    }
    
    Secret TokenManager::getAuthHeader()
    {
        lock_guard<mutex> lock(mMutex);
        
        if (mStore.empty())
        {
            throw AuthenticationError(0, "not_connected", 
                    "no token available");
        }
        
        size_t slot = mStore.cursor();
        const Connection& current = mStore.get(slot);
        if (current.isExpired(mpCtx->clock().now()))
        {
            // Refresh only this slot and keep serving it
            SDS_LOG_DEBUG << "Token in slot " << slot 
                    << " has expired, refreshing";
            Connection fresh = refresh(current);
            mStore.replace(slot, fresh);
            return fresh.authHeader();
        }
        
        Secret header = current.authHeader();
        mStore.advance();
        return header;
    }
    
    void TokenManager::revoke(bool revokeAccess, bool revokeRefresh)
    {
        CredentialStore oldStore;
        {
            lock_guard<mutex> lock(mMutex);
            mStore.swap(oldStore);
        }
        
        for (size_t slot = 0; slot < oldStore.size(); slot++)
        {
            const Connection& connection = oldStore.get(slot);
            if (revokeAccess)
            {
                revokeToken(connection.accessToken(), FIELDNAME_ACCESSTOKEN);
            }
            if (revokeRefresh && !connection.refreshToken().empty())
            {
                revokeToken(connection.refreshToken(), 
                        FIELDNAME_REFRESHTOKEN);
            }
        }
    }
    
    void TokenManager::clear()
    {
        lock_guard<mutex> lock(mMutex);
        mStore.clear();
    }
    
    bool TokenManager::isConnected() const
    {
        lock_guard<mutex> lock(mMutex);
        return !mStore.empty();
    }
    
    Connection TokenManager::mainConnection() const
    {
        lock_guard<mutex> lock(mMutex);
        return mStore.empty() ? Connection() : mStore.get(0);
    }
    
    Connection TokenManager::exchange(const OAuth2Flow& flow)
    {
        const Config& config = mpCtx->config();
        
        if (flow.grant() == OAuth2Flow::GRANT_PRE_ISSUED)
        {
            return Connection(flow.credential(), Secret(), 
                    Connection::NEVER_EXPIRES, mpCtx->clock().now());
        }
        if (flow.grant() == OAuth2Flow::GRANT_REFRESH_TOKEN)
        {
            return refresh(Connection(Secret(), flow.credential(), 0, 0));
        }
        
        HttpTransfer xfer(*mpCtx);
        xfer.setRequestType(POST)
            .setUrl(mpCtx->url(URL_AUTH_TOKEN))
            .addPostField(FIELDNAME_GRANTTYPE, flow.grantType());
        
        if (flow.grant() == OAuth2Flow::GRANT_PASSWORD)
        {
            // Client credentials go in a Basic header for this grant
            string clientCredentials = config.clientId() + ":" + 
                    config.clientSecret().expose();
            Secret basic("Basic " + 
                    Util::base64UrlEncodeNoPad(clientCredentials));
            OPENSSL_cleanse(&clientCredentials[0], clientCredentials.size());
            
            xfer.setAuthorization(basic)
                .addPostField(FIELDNAME_USERNAME, flow.username())
                .addPostField(FIELDNAME_PASSWORD, flow.credential().expose());
        }
        else
        {
            xfer.addPostField(FIELDNAME_CODE, flow.credential().expose())
                .addPostField(FIELDNAME_REDIRECTURI, config.redirectUri())
                .addPostField(FIELDNAME_CLIENTID, config.clientId())
                .addPostField(FIELDNAME_CLIENTSECRET, 
                    config.clientSecret().expose());
        }
        
        SDS_LOG_DEBUG << "Requesting token with grant " << flow.grantType();
        return requestToken(xfer, Secret());
    }
    
    Connection TokenManager::refresh(const Connection& connection)
    {
        if (connection.refreshToken().empty())
        {
            throw AuthenticationError(0, "invalid_grant", 
                    "no refresh token to renew the session with");
        }
        
        const Config& config = mpCtx->config();
        
        HttpTransfer xfer(*mpCtx);
        xfer.setRequestType(POST)
            .setUrl(mpCtx->url(URL_AUTH_TOKEN))
            .addPostField(FIELDNAME_GRANTTYPE, FIELDNAME_REFRESHTOKEN)
            .addPostField(FIELDNAME_REFRESHTOKEN, 
                connection.refreshToken().expose())
            .addPostField(FIELDNAME_CLIENTID, config.clientId())
            .addPostField(FIELDNAME_CLIENTSECRET, 
                config.clientSecret().expose());
        
        SDS_LOG_DEBUG << "Refreshing access token";
        return requestToken(xfer, connection.refreshToken());
    }
    
    Connection TokenManager::requestToken(HttpTransfer& xfer, 
            const Secret& previousRefreshToken)
    {
        xfer.execute();
        
        long httpResp = xfer.getHttpResponse();
        Json jsonObj(xfer.getData());
        
        if (!xfer.isSuccess())
        {
            // OAuth errors come as {error, error_description}
            if (jsonObj.isValid() && jsonObj.has("error") && 
                    (httpResp == 400 || httpResp == 401))
            {
                string error = jsonObj.getString("error");
                string description = jsonObj.getString("error_description");
                SDS_LOG_WARN << "Token request rejected: " << error;
                throw AuthenticationError(httpResp, error, description);
            }
            xfer.throwIfFailed();
        }
        
        if (!jsonObj.isValid())
        {
            throw HttpError(ErrorResponse(httpResp, 
                    "token response is not JSON", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        
        string tmpStr = jsonObj.getString(FIELDNAME_ACCESSTOKEN);
        if (tmpStr.empty())
        {
            throw HttpError(ErrorResponse(httpResp, 
                    "token response without access_token", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        Secret accessToken(tmpStr);
        OPENSSL_cleanse(&tmpStr[0], tmpStr.size());
        
        // A refresh response may omit the refresh token. Keep the old one.
        tmpStr = jsonObj.getString(FIELDNAME_REFRESHTOKEN);
        Secret refreshToken = tmpStr.empty() ? 
            previousRefreshToken : Secret(tmpStr);
        if (!tmpStr.empty())
        {
            OPENSSL_cleanse(&tmpStr[0], tmpStr.size());
        }
        
        bool success = false;
        int64_t expiresIn = jsonObj.getInt64(FIELDNAME_EXPIRESIN, success);
        uint64_t lifetime = (success && expiresIn >= 0) ? 
            (uint64_t) expiresIn : Connection::NEVER_EXPIRES;
        
        return Connection(accessToken, refreshToken, lifetime, 
                mpCtx->clock().now());
    }
    
    void TokenManager::revokeToken(const Secret& token, const string& hint)
    {
        const Config& config = mpCtx->config();
        
        HttpTransfer xfer(*mpCtx);
        xfer.setRequestType(POST)
            .setUrl(mpCtx->url(URL_AUTH_REVOKE))
            .addPostField(FIELDNAME_CLIENTID, config.clientId())
            .addPostField(FIELDNAME_CLIENTSECRET, 
                config.clientSecret().expose())
            .addPostField(FIELDNAME_TOKENTYPEHINT, hint)
            .addPostField(FIELDNAME_TOKEN, token.expose());
        
        try
        {
            xfer.execute();
            xfer.throwIfFailed();
            SDS_LOG_DEBUG << "Revoked " << hint;
        }
        catch (const SdsError& e)
        {
            SDS_LOG_WARN << "Could not revoke " << hint << ": " << e.what();
        }
    }

}
