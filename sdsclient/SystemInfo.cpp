/* 
 * File:   SystemInfo.cpp
 * Author: me
 * 
 * Created on March 6, 2024, 4:51 PM
 */

#include "SystemInfo.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Log.hpp"

using namespace std;

namespace sdsclient
{
    const string SystemInfo::URL_SYSTEM_INFO = "public/system/info";
    
    SystemInfo::SystemInfo(SdsContext& ctx)
    : mCtx(ctx)
    {
        clear();
    }

    SystemInfo::~SystemInfo()
    {
        // Empty
    }
    
    bool SystemInfo::useS3Storage()
    {
        lock_guard<mutex> lock(mMutex);
        updateIfStale();
        return mUseS3Storage;
    }
    
    bool SystemInfo::s3EnforceDirectUpload()
    {
        lock_guard<mutex> lock(mMutex);
        updateIfStale();
        return mS3EnforceDirectUpload;
    }
    
    void SystemInfo::clear()
    {
        mLoaded = false;
        mUseS3Storage = false;
        mS3EnforceDirectUpload = false;
    }
    
    void SystemInfo::fillFromJson(const Json& jsonObj)
    {
        mUseS3Storage = jsonObj.getBoolean("useS3Storage", false);
        mS3EnforceDirectUpload = 
                jsonObj.getBoolean("s3EnforceDirectUpload", false);
        mLoaded = true;
    }
    
    void SystemInfo::updateIfStale()
    {
        if (!mLoaded)
        {
            update();
        }
    }
    
    void SystemInfo::update()
    {
        clear();
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(mCtx.apiUrl(URL_SYSTEM_INFO))
            .execute();
        xfer.throwIfFailed();
        
        Json jsonObj(xfer.getData());
        if (!jsonObj.isValid())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(), 
                    "unreadable system info", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        fillFromJson(jsonObj);
        SDS_LOG_DEBUG << "System info: useS3Storage=" << mUseS3Storage 
                << " s3EnforceDirectUpload=" << mS3EnforceDirectUpload;
    }

}
