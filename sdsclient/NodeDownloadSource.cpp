/* 
 * File:   NodeDownloadSource.cpp
 * Author: me
 * 
 * Created on March 18, 2024, 2:10 PM
 */

#include "NodeDownloadSource.hpp"
#include "KeyPairService.hpp"
#include "TokenManager.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Util.hpp"

using namespace std;

namespace sdsclient
{
    NodeDownloadSource::NodeDownloadSource(SdsContext& ctx, 
            TokenManager& tokens, KeyPairService& keyPairs, const Node& node)
    : mCtx(ctx), mTokens(tokens), mKeyPairs(keyPairs), mNode(node)
    {
        // No body
    }

    NodeDownloadSource::~NodeDownloadSource()
    {
        // Empty
    }
    
    string NodeDownloadSource::requestDownloadUrl()
    {
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(mCtx.apiUrl("nodes/files/" + Util::toString(mNode.getId())
                + "/downloads"))
            .setAuthorization(mTokens.getAuthHeader())
            .execute();
        xfer.throwIfFailed();
        
        string url = Json(xfer.getData()).getString("downloadUrl");
        if (url.empty())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(), 
                    "no downloadUrl in response", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return url;
    }
    
    bool NodeDownloadSource::knownSize(uint64_t& size)
    {
        if (!mNode.hasSize())
        {
            return false;
        }
        size = mNode.getSize();
        return true;
    }
    
    bool NodeDownloadSource::isEncrypted()
    {
        return mNode.isEncrypted();
    }
    
    PlainFileKey NodeDownloadSource::fileKey()
    {
        // Fails with MissingEncryptionSecret unless unlocked before
        PlainUserKeyPair keyPair = mKeyPairs.getUnlockedKeyPair();
        return Crypto::decryptFileKey(getUserFileKey(), keyPair);
    }
    
    FileKey NodeDownloadSource::getUserFileKey()
    {
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(mCtx.apiUrl("nodes/files/" + Util::toString(mNode.getId())
                + "/user_file_key"))
            .setAuthorization(mTokens.getAuthHeader())
            .execute();
        xfer.throwIfFailed();
        
        return FileKey::fromJson(Json(xfer.getData()));
    }

}
