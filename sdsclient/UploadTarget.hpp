/* 
 * File:   UploadTarget.hpp
 * Author: me
 *
 * Created on March 13, 2024, 10:30 AM
 */

#ifndef UPLOADTARGET_HPP
#define	UPLOADTARGET_HPP

#include "Node.hpp"

#include <stdint.h>
#include <string>
#include <vector>

namespace sdsclient
{
    class HttpTransfer;
    class Json;
    class PlainFileKey;
    class UploadDescriptor;
    
    // Returned when an upload channel is opened
    class UploadChannel {
    public:
        std::string uploadId;
        // Proxy uploads POST their chunks here
        std::string uploadUrl;
        std::string token;
    };
    
    class PresignedUrl {
    public:
        std::string url;
        int partNumber;
    };
    
    class UploadedPart {
    public:
        int partNumber;
        std::string partEtag;
    };
    
    /*
     * Where an upload goes: a folder or room of the signed-in user, or a 
     * public upload share. ChunkedUploader drives the protocol and calls 
     * these for the endpoint-specific steps. key arguments are NULL for 
     * unencrypted uploads.
     */
    class UploadTarget {
    public:
        virtual ~UploadTarget();
        
        // Content has to be encrypted on the client
        virtual bool isEncrypted() = 0;
        
        virtual UploadChannel openChannel(const UploadDescriptor& descriptor,
                bool directS3Upload) = 0;
        
        virtual std::vector<PresignedUrl> presign(const UploadChannel& channel,
                uint64_t size, int firstPartNumber, int lastPartNumber) = 0;
        
        virtual void finalizeS3(const UploadChannel& channel, 
                const UploadDescriptor& descriptor, 
                const std::vector<UploadedPart>& parts, 
                const PlainFileKey* key) = 0;
        
        virtual Node finalizeNfs(const UploadChannel& channel, 
                const UploadDescriptor& descriptor, 
                const PlainFileKey* key) = 0;
        
        virtual std::string statusUrl(const UploadChannel& channel) = 0;
        
        // Adds whatever credentials the target's API calls need
        virtual void authorize(HttpTransfer& xfer) = 0;
        
        // The created node, from a status response in state "done"
        virtual Node resultFromStatus(const Json& status) = 0;
        
        // Runs once the node exists, e.g. to hand out missing file keys
        virtual void afterCompletion(const Node& node, 
                const PlainFileKey& key) = 0;
        
    };

}

#endif	/* UPLOADTARGET_HPP */
