/* 
 * File:   UploadDescriptor.hpp
 * Author: me
 *
 * Created on March 8, 2024, 10:02 AM
 */

#ifndef UPLOADDESCRIPTOR_HPP
#define	UPLOADDESCRIPTOR_HPP

#include "SdsEnums.hpp"

#include <stdint.h>
#include <time.h>
#include <string>

namespace sdsclient
{
    class Json;
    
    /*
     * What is being uploaded and how the server should store it. Only the 
     * name and size are required.
     */
    class UploadDescriptor {
    public:
        UploadDescriptor(const std::string& name, uint64_t size);
        
        static const char* toString(Resolution_Strategy strategy);
        
        const std::string& getName() const;
        
        uint64_t getSize() const;
        
        UploadDescriptor& setClassification(int classification);
        
        // The file expires (is deleted) at expireAt
        UploadDescriptor& setExpiration(time_t expireAt);
        
        UploadDescriptor& setTimestampCreation(time_t timestamp);
        
        UploadDescriptor& setTimestampModification(time_t timestamp);
        
        UploadDescriptor& setResolutionStrategy(Resolution_Strategy strategy);
        
        UploadDescriptor& setKeepShareLinks(bool keep);
        
        Resolution_Strategy getResolutionStrategy() const;
        
        bool getKeepShareLinks() const;
        
        // Adds name, size and the optional metadata fields
        void addChannelFields(Json& jsonObj) const;
        
        // Adds resolutionStrategy and keepShareLinks
        void addCompletionFields(Json& jsonObj) const;
        
    private:
        std::string mName;
        uint64_t mSize;
        bool mHasClassification;
        int mClassification;
        bool mHasExpiration;
        time_t mExpireAt;
        bool mHasTimestampCreation;
        time_t mTimestampCreation;
        bool mHasTimestampModification;
        time_t mTimestampModification;
        Resolution_Strategy mResolutionStrategy;
        bool mKeepShareLinks;
        
    };

}

#endif	/* UPLOADDESCRIPTOR_HPP */
