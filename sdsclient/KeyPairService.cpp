/* 
 * File:   KeyPairService.cpp
 * Author: me
 * 
 * Created on March 12, 2024, 10:10 AM
 */

#include "KeyPairService.hpp"
#include "TokenManager.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Log.hpp"

using namespace std;

namespace sdsclient
{
    const string KeyPairService::URL_KEYPAIR = "user/account/keypair";
    
    KeyPairService::KeyPairService(SdsContext& ctx, TokenManager& tokens)
    : mCtx(ctx), mTokens(tokens), mUnlocked(false)
    {
        // No body
    }

    KeyPairService::~KeyPairService()
    {
        // Empty
    }
    
    UserKeyPair KeyPairService::getUserKeyPair()
    {
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(mCtx.apiUrl(URL_KEYPAIR))
            .setAuthorization(mTokens.getAuthHeader())
            .execute();
        xfer.throwIfFailed();
        
        Json jsonObj(xfer.getData());
        if (!jsonObj.isValid())
        {
            throw CryptoError("key pair response is not JSON");
        }
        return UserKeyPair::fromJson(jsonObj);
    }
    
    PlainUserKeyPair KeyPairService::getUnlockedKeyPair(const Secret& secret)
    {
        lock_guard<mutex> lock(mMutex);
        
        if (mUnlocked)
        {
            return mKeyPair;
        }
        if (secret.empty())
        {
            throw MissingEncryptionSecret();
        }
        
        UserKeyPair keyPair = getUserKeyPair();
        mKeyPair = Crypto::decryptPrivateKey(keyPair, secret);
        mUnlocked = true;
        SDS_LOG_DEBUG << "Key pair unlocked (" << mKeyPair.version << ")";
        return mKeyPair;
    }
    
    bool KeyPairService::isUnlocked() const
    {
        lock_guard<mutex> lock(mMutex);
        return mUnlocked;
    }
    
    void KeyPairService::clear()
    {
        lock_guard<mutex> lock(mMutex);
        mKeyPair = PlainUserKeyPair();
        mUnlocked = false;
    }

}
