/* 
 * File:   UploadDescriptor.cpp
 * Author: me
 * 
 * Created on March 8, 2024, 10:02 AM
 */

#include "UploadDescriptor.hpp"
#include "Json.hpp"
#include "Util.hpp"

using namespace std;

namespace sdsclient
{
    UploadDescriptor::UploadDescriptor(const string& name, uint64_t size)
    : mName(name), mSize(size), mHasClassification(false), 
            mClassification(0), mHasExpiration(false), mExpireAt(0), 
            mHasTimestampCreation(false), mTimestampCreation(0), 
            mHasTimestampModification(false), mTimestampModification(0), 
            mResolutionStrategy(RESOLUTION_AUTORENAME), mKeepShareLinks(false)
    {
        // No body
    }
    
    const char* UploadDescriptor::toString(Resolution_Strategy strategy)
    {
        switch (strategy)
        {
            case RESOLUTION_OVERWRITE:
                return "overwrite";
            case RESOLUTION_FAIL:
                return "fail";
            case RESOLUTION_AUTORENAME:
            default:
                return "autorename";
        }
    }
    
    const string& UploadDescriptor::getName() const
    {
        return mName;
    }
    
    uint64_t UploadDescriptor::getSize() const
    {
        return mSize;
    }
    
    UploadDescriptor& UploadDescriptor::setClassification(int classification)
    {
        mHasClassification = true;
        mClassification = classification;
        return *this;
    }
    
    UploadDescriptor& UploadDescriptor::setExpiration(time_t expireAt)
    {
        mHasExpiration = true;
        mExpireAt = expireAt;
        return *this;
    }
    
    UploadDescriptor& UploadDescriptor::setTimestampCreation(time_t timestamp)
    {
        mHasTimestampCreation = true;
        mTimestampCreation = timestamp;
        return *this;
    }
    
    UploadDescriptor& 
    UploadDescriptor::setTimestampModification(time_t timestamp)
    {
        mHasTimestampModification = true;
        mTimestampModification = timestamp;
        return *this;
    }
    
    UploadDescriptor& 
    UploadDescriptor::setResolutionStrategy(Resolution_Strategy strategy)
    {
        mResolutionStrategy = strategy;
        return *this;
    }
    
    UploadDescriptor& UploadDescriptor::setKeepShareLinks(bool keep)
    {
        mKeepShareLinks = keep;
        return *this;
    }
    
    Resolution_Strategy UploadDescriptor::getResolutionStrategy() const
    {
        return mResolutionStrategy;
    }
    
    bool UploadDescriptor::getKeepShareLinks() const
    {
        return mKeepShareLinks;
    }
    
    void UploadDescriptor::addChannelFields(Json& jsonObj) const
    {
        jsonObj.addString("name", mName);
        jsonObj.addInt64("size", (int64_t) mSize);
        if (mHasClassification)
        {
            jsonObj.addInt64("classification", mClassification);
        }
        Json expiration;
        expiration.addBoolean("enableExpiration", mHasExpiration);
        if (mHasExpiration)
        {
            expiration.addString("expireAt", 
                    Util::epochTimeToRfc3339(mExpireAt));
        }
        jsonObj.addObject("expiration", expiration);
        if (mHasTimestampCreation)
        {
            jsonObj.addString("timestampCreation", 
                    Util::epochTimeToRfc3339(mTimestampCreation));
        }
        if (mHasTimestampModification)
        {
            jsonObj.addString("timestampModification", 
                    Util::epochTimeToRfc3339(mTimestampModification));
        }
    }
    
    void UploadDescriptor::addCompletionFields(Json& jsonObj) const
    {
        jsonObj.addString("resolutionStrategy", toString(mResolutionStrategy));
        jsonObj.addBoolean("keepShareLinks", mKeepShareLinks);
    }

}
