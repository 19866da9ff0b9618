/* 
 * File:   NodeUploadTarget.cpp
 * Author: me
 * 
 * Created on March 15, 2024, 3:40 PM
 */

#include "NodeUploadTarget.hpp"
#include "UploadDescriptor.hpp"
#include "KeyDistributor.hpp"
#include "KeyPairService.hpp"
#include "TokenManager.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Crypto.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Util.hpp"

using namespace std;

namespace sdsclient
{
    const string NodeUploadTarget::URL_UPLOADS = "nodes/files/uploads";
    const string NodeUploadTarget::URL_PROXY_UPLOADS = "uploads";
    
    NodeUploadTarget::NodeUploadTarget(SdsContext& ctx, TokenManager& tokens,
            KeyPairService& keyPairs, const Node& parent)
    : mCtx(ctx), mTokens(tokens), mKeyPairs(keyPairs), mParent(parent)
    {
        // No body
    }

    NodeUploadTarget::~NodeUploadTarget()
    {
        // Empty
    }
    
    bool NodeUploadTarget::isEncrypted()
    {
        return mParent.isEncrypted();
    }
    
    UploadChannel NodeUploadTarget::openChannel(
            const UploadDescriptor& descriptor, bool directS3Upload)
    {
        Json body;
        body.addInt64("parentId", (int64_t) mParent.getId());
        descriptor.addChannelFields(body);
        body.addBoolean("directS3Upload", directS3Upload);
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(mCtx.apiUrl(URL_UPLOADS))
            .setJsonBody(body);
        authorize(xfer);
        xfer.execute();
        xfer.throwIfFailed();
        
        Json jsonObj(xfer.getData());
        UploadChannel channel;
        channel.uploadId = jsonObj.getString("uploadId");
        channel.uploadUrl = jsonObj.getString("uploadUrl");
        channel.token = jsonObj.getString("token");
        if (channel.uploadId.empty())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(), 
                    "upload channel without uploadId", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return channel;
    }
    
    vector<PresignedUrl> NodeUploadTarget::presign(
            const UploadChannel& channel, uint64_t size, int firstPartNumber,
            int lastPartNumber)
    {
        Json body;
        body.addInt64("size", (int64_t) size)
            .addInt64("firstPartNumber", firstPartNumber)
            .addInt64("lastPartNumber", lastPartNumber);
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(mCtx.apiUrl(URL_UPLOADS + "/" + channel.uploadId + 
                "/s3_urls"))
            .setJsonBody(body);
        authorize(xfer);
        xfer.execute();
        xfer.throwIfFailed();
        
        return parsePresignedUrls(Json(xfer.getData()));
    }
    
    void NodeUploadTarget::finalizeS3(const UploadChannel& channel, 
            const UploadDescriptor& descriptor, 
            const vector<UploadedPart>& parts, const PlainFileKey* key)
    {
        Json body;
        body.addObject("parts", partsToJson(parts));
        descriptor.addCompletionFields(body);
        body.addString("fileName", descriptor.getName());
        if (key != NULL)
        {
            body.addObject("fileKey", ownFileKey(*key).toJson());
        }
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(PUT)
            .setUrl(mCtx.apiUrl(URL_UPLOADS + "/" + channel.uploadId + "/s3"))
            .setJsonBody(body);
        authorize(xfer);
        xfer.execute();
        xfer.throwIfFailed();
    }
    
    Node NodeUploadTarget::finalizeNfs(const UploadChannel& channel, 
            const UploadDescriptor& descriptor, const PlainFileKey* key)
    {
        Json body;
        descriptor.addCompletionFields(body);
        body.addString("fileName", descriptor.getName());
        if (key != NULL)
        {
            body.addObject("fileKey", ownFileKey(*key).toJson());
        }
        
        // The token authorizes the call
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(PUT)
            .setUrl(mCtx.apiUrl(URL_PROXY_UPLOADS + "/" + channel.token))
            .setJsonBody(body)
            .execute();
        xfer.throwIfFailed();
        
        return Node::fromJson(Json(xfer.getData()));
    }
    
    string NodeUploadTarget::statusUrl(const UploadChannel& channel)
    {
        return mCtx.apiUrl(URL_UPLOADS + "/" + channel.uploadId);
    }
    
    void NodeUploadTarget::authorize(HttpTransfer& xfer)
    {
        xfer.setAuthorization(mTokens.getAuthHeader());
    }
    
    Node NodeUploadTarget::resultFromStatus(const Json& status)
    {
        Json nodeObj = status.getNestedObject("node");
        if (!nodeObj.isValid())
        {
            throw HttpError(ErrorResponse(200, 
                    "upload done without a node", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return Node::fromJson(nodeObj);
    }
    
    void NodeUploadTarget::afterCompletion(const Node& node, 
            const PlainFileKey& key)
    {
        KeyDistributor distributor(mCtx, mTokens);
        distributor.distributeForFile(node.getId(), key);
    }
    
    vector<PresignedUrl> NodeUploadTarget::parsePresignedUrls(
            const Json& jsonObj)
    {
        vector<PresignedUrl> urls;
        int count = jsonObj.getArrayLength("urls");
        for (int i = 0; i < count; i++)
        {
            Json urlObj = jsonObj.arrayGet("urls", i);
            PresignedUrl url;
            url.url = urlObj.getString("url");
            url.partNumber = (int) urlObj.getInt64("partNumber", (int64_t) 0);
            urls.push_back(url);
        }
        return urls;
    }
    
    Json NodeUploadTarget::partsToJson(const vector<UploadedPart>& parts)
    {
        Json array = Json::newArray();
        for (size_t i = 0; i < parts.size(); i++)
        {
            Json part;
            part.addInt64("partNumber", parts[i].partNumber)
                .addString("partEtag", parts[i].partEtag);
            array.arrayAppend(part);
        }
        return array;
    }
    
    FileKey NodeUploadTarget::ownFileKey(const PlainFileKey& key)
    {
        if (mKeyPairs.isUnlocked())
        {
            PlainUserKeyPair keyPair = mKeyPairs.getUnlockedKeyPair();
            return Crypto::encryptFileKey(key, keyPair.publicKey, 
                    keyPair.version);
        }
        UserKeyPair keyPair = mKeyPairs.getUserKeyPair();
        return Crypto::encryptFileKey(key, keyPair.publicKey, 
                keyPair.version);
    }

}
