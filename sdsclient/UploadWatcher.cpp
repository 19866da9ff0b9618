/* 
 * File:   UploadWatcher.cpp
 * Author: me
 * 
 * Created on March 13, 2024, 3:20 PM
 */

#include "UploadWatcher.hpp"
#include "UploadTarget.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Timing.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <limits.h>

using namespace std;

namespace sdsclient
{
    const long UploadWatcher::INITIAL_DELAY = 300;
    
    UploadWatcher::UploadWatcher(SdsContext& ctx, UploadTarget& target)
    : mCtx(ctx), mTarget(target), mPollCount(0)
    {
        // No body
    }

    UploadWatcher::~UploadWatcher()
    {
        // Empty
    }
    
    Upload_State UploadWatcher::parseState(const string& status)
    {
        if (status == "done")
        {
            return UPLOAD_DONE;
        }
        if (status == "error")
        {
            return UPLOAD_ERROR;
        }
        if (status == "finishing")
        {
            return UPLOAD_FINISHING;
        }
        return UPLOAD_TRANSFER;
    }
    
    Node UploadWatcher::waitForCompletion(const UploadChannel& channel)
    {
        long delay = INITIAL_DELAY;
        mPollCount = 0;
        
        for (;;)
        {
            Json status = fetchStatus(channel);
            
            switch (parseState(status.getString("status")))
            {
                case UPLOAD_DONE:
                    SDS_LOG_INFO << "Upload " << channel.uploadId 
                            << " done after " << mPollCount << " poll(s)";
                    return mTarget.resultFromStatus(status);
                    
                case UPLOAD_ERROR:
                {
                    Json details = status.getNestedObject("errorDetails");
                    ErrorResponse error = details.isValid() ? 
                        ErrorResponse::fromApiBody(400, details.toString()) :
                        ErrorResponse(400, "upload failed", 
                            ErrorResponse::FALLBACK_DEBUG_INFO);
                    SDS_LOG_ERROR << "Upload " << channel.uploadId 
                            << " failed: " << error.toString();
                    throw HttpError(error);
                }
                    
                case UPLOAD_TRANSFER:
                case UPLOAD_FINISHING:
                default:
                    SDS_LOG_DEBUG << "Upload " << channel.uploadId << " is " 
                            << status.getString("status") << ", next poll in "
                            << delay << " ms";
                    mCtx.sleeper().sleepMs(delay);
                    if (delay <= LONG_MAX / 2)
                    {
                        delay *= 2;
                    }
                    break;
            }
        }
    }
    
    int UploadWatcher::getPollCount() const
    {
        return mPollCount;
    }
    
    Json UploadWatcher::fetchStatus(const UploadChannel& channel)
    {
        mPollCount++;
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(mTarget.statusUrl(channel));
        mTarget.authorize(xfer);
        xfer.execute();
        xfer.throwIfFailed();
        
        Json status(xfer.getData());
        if (!status.isValid() || !status.has("status"))
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(), 
                    "unreadable upload status", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return status;
    }

}
