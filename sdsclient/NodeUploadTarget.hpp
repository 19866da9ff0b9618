/* 
 * File:   NodeUploadTarget.hpp
 * Author: me
 *
 * Created on March 15, 2024, 3:40 PM
 */

#ifndef NODEUPLOADTARGET_HPP
#define	NODEUPLOADTARGET_HPP

#include "UploadTarget.hpp"
#include "Crypto.hpp"
#include "Node.hpp"

#include <string>

namespace sdsclient
{
    class SdsContext;
    class TokenManager;
    class KeyPairService;
    
    // Upload into a room or folder of the signed-in user
    class NodeUploadTarget : public UploadTarget {
    public:
        static const std::string URL_UPLOADS;
        static const std::string URL_PROXY_UPLOADS;
        
        NodeUploadTarget(SdsContext& ctx, TokenManager& tokens, 
                KeyPairService& keyPairs, const Node& parent);
        
        virtual ~NodeUploadTarget();
        
        virtual bool isEncrypted();
        
        virtual UploadChannel openChannel(const UploadDescriptor& descriptor,
                bool directS3Upload);
        
        virtual std::vector<PresignedUrl> presign(const UploadChannel& channel,
                uint64_t size, int firstPartNumber, int lastPartNumber);
        
        virtual void finalizeS3(const UploadChannel& channel, 
                const UploadDescriptor& descriptor, 
                const std::vector<UploadedPart>& parts, 
                const PlainFileKey* key);
        
        virtual Node finalizeNfs(const UploadChannel& channel, 
                const UploadDescriptor& descriptor, const PlainFileKey* key);
        
        virtual std::string statusUrl(const UploadChannel& channel);
        
        virtual void authorize(HttpTransfer& xfer);
        
        virtual Node resultFromStatus(const Json& status);
        
        // Gives the content key to everyone else who may read the file
        virtual void afterCompletion(const Node& node, 
                const PlainFileKey& key);
        
        // Parses {urls: [{url, partNumber}]}
        static std::vector<PresignedUrl> parsePresignedUrls(const Json& jsonObj);
        
        static Json partsToJson(const std::vector<UploadedPart>& parts);
        
    private:
        SdsContext& mCtx;
        TokenManager& mTokens;
        KeyPairService& mKeyPairs;
        Node mParent;
        
        // The content key wrapped for the uploading user
        FileKey ownFileKey(const PlainFileKey& key);
        
        NodeUploadTarget(const NodeUploadTarget& orig);
    };

}

#endif	/* NODEUPLOADTARGET_HPP */
