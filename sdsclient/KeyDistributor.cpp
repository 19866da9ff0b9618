/* 
 * File:   KeyDistributor.cpp
 * Author: me
 * 
 * Created on March 15, 2024, 11:00 AM
 */

#include "KeyDistributor.hpp"
#include "TokenManager.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Util.hpp"
#include "Log.hpp"

using namespace std;

namespace sdsclient
{
    /**************************
    * MissingKeys
    **************************/
    
    MissingKeys::MissingKeys()
    : total(0)
    {
        // No body
    }
    
    MissingKeys MissingKeys::fromJson(const Json& jsonObj)
    {
        MissingKeys missing;
        
        int count = jsonObj.getArrayLength("items");
        for (int i = 0; i < count; i++)
        {
            Json itemObj = jsonObj.arrayGet("items", i);
            Item item;
            item.userId = (uint64_t) itemObj.getInt64("userId", (int64_t) 0);
            item.fileId = (uint64_t) itemObj.getInt64("fileId", (int64_t) 0);
            missing.items.push_back(item);
        }
        
        count = jsonObj.getArrayLength("users");
        for (int i = 0; i < count; i++)
        {
            Json userObj = jsonObj.arrayGet("users", i);
            PublicKey key;
            key.version = userObj.getString("publicKeyContainer/version");
            key.publicKey = userObj.getString("publicKeyContainer/publicKey");
            missing.userPublicKeys[(uint64_t) userObj.getInt64("id", 
                    (int64_t) 0)] = key;
        }
        
        count = jsonObj.getArrayLength("files");
        for (int i = 0; i < count; i++)
        {
            Json fileObj = jsonObj.arrayGet("files", i);
            missing.fileKeys[(uint64_t) fileObj.getInt64("id", (int64_t) 0)] = 
                    FileKey::fromJson(fileObj.getNestedObject("fileKeyContainer"));
        }
        
        missing.total = (uint64_t) jsonObj.getInt64("range/total", 
                (int64_t) missing.items.size());
        return missing;
    }
    
    /**************************
    * KeyDistributor
    **************************/
    
    const string KeyDistributor::URL_MISSING_KEYS = "nodes/missingFileKeys";
    const string KeyDistributor::URL_FILE_KEYS = "nodes/files/keys";
    const int KeyDistributor::BATCH_LIMIT = 50;
    
    KeyDistributor::KeyDistributor(SdsContext& ctx, TokenManager& tokens)
    : mCtx(ctx), mTokens(tokens)
    {
        // No body
    }

    KeyDistributor::~KeyDistributor()
    {
        // Empty
    }
    
    MissingKeys KeyDistributor::getMissingFileKeys(uint64_t fileId, 
            uint64_t roomId, uint64_t userId)
    {
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(mCtx.apiUrl(URL_MISSING_KEYS))
            .setAuthorization(mTokens.getAuthHeader());
        if (fileId != 0)
        {
            xfer.addQuery("file_id", Util::toString(fileId));
        }
        if (roomId != 0)
        {
            xfer.addQuery("room_id", Util::toString(roomId));
        }
        if (userId != 0)
        {
            xfer.addQuery("user_id", Util::toString(userId));
        }
        xfer.addQuery("limit", Util::toString((uint64_t) BATCH_LIMIT))
            .execute();
        xfer.throwIfFailed();
        
        Json jsonObj(xfer.getData());
        if (!jsonObj.isValid())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(), 
                    "unreadable missing keys response", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return MissingKeys::fromJson(jsonObj);
    }
    
    void KeyDistributor::setFileKeys(const vector<UserFileKey>& keys)
    {
        Json body;
        Json items = body.addNewArray("items");
        for (size_t i = 0; i < keys.size(); i++)
        {
            Json item;
            item.addInt64("userId", (int64_t) keys[i].userId)
                .addInt64("fileId", (int64_t) keys[i].fileId)
                .addObject("fileKey", keys[i].fileKey.toJson());
            items.arrayAppend(item);
        }
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(mCtx.apiUrl(URL_FILE_KEYS))
            .setAuthorization(mTokens.getAuthHeader())
            .setJsonBody(body)
            .execute();
        xfer.throwIfFailed();
    }
    
    size_t KeyDistributor::distributeForFile(uint64_t fileId, 
            const PlainFileKey& plainKey)
    {
        MissingKeys missing = getMissingFileKeys(fileId);
        
        vector<UserFileKey> keys;
        for (size_t i = 0; i < missing.items.size(); i++)
        {
            if (missing.items[i].fileId == fileId)
            {
                wrapForUser(missing, missing.items[i], plainKey, keys);
            }
        }
        
        if (!keys.empty())
        {
            setFileKeys(keys);
        }
        SDS_LOG_DEBUG << "Set " << keys.size() << " missing file key(s) for " 
                << fileId;
        return keys.size();
    }
    
    uint64_t KeyDistributor::distributeMissingKeys(
            const PlainUserKeyPair& keyPair, uint64_t fileId, uint64_t roomId, 
            uint64_t userId)
    {
        MissingKeys missing = getMissingFileKeys(fileId, roomId, userId);
        
        // Each file key is unwrapped once
        map<uint64_t, PlainFileKey> plainKeys;
        for (map<uint64_t, FileKey>::const_iterator it = 
                missing.fileKeys.begin(); it != missing.fileKeys.end(); ++it)
        {
            plainKeys[it->first] = Crypto::decryptFileKey(it->second, keyPair);
        }
        
        vector<UserFileKey> keys;
        for (size_t i = 0; i < missing.items.size(); i++)
        {
            map<uint64_t, PlainFileKey>::const_iterator plainKey = 
                    plainKeys.find(missing.items[i].fileId);
            if (plainKey == plainKeys.end())
            {
                SDS_LOG_WARN << "No file key for file " 
                        << missing.items[i].fileId << ", skipping";
                continue;
            }
            wrapForUser(missing, missing.items[i], plainKey->second, keys);
        }
        
        if (!keys.empty())
        {
            setFileKeys(keys);
        }
        SDS_LOG_INFO << "Distributed " << keys.size() << " of " 
                << missing.total << " missing file key(s)";
        return missing.total;
    }
    
    void KeyDistributor::wrapForUser(const MissingKeys& missing, 
            const MissingKeys::Item& item, const PlainFileKey& plainKey, 
            vector<UserFileKey>& out)
    {
        map<uint64_t, MissingKeys::PublicKey>::const_iterator publicKey = 
                missing.userPublicKeys.find(item.userId);
        if (publicKey == missing.userPublicKeys.end())
        {
            SDS_LOG_WARN << "No public key for user " << item.userId 
                    << ", skipping";
            return;
        }
        
        UserFileKey key;
        key.userId = item.userId;
        key.fileId = item.fileId;
        key.fileKey = Crypto::encryptFileKey(plainKey, 
                publicKey->second.publicKey, publicKey->second.version);
        out.push_back(key);
    }

}
