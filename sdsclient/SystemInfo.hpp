/* 
 * File:   SystemInfo.hpp
 * Author: me
 *
 * Created on March 6, 2024, 4:51 PM
 */

#ifndef SYSTEMINFO_HPP
#define	SYSTEMINFO_HPP

#include <mutex>
#include <string>

namespace sdsclient
{
    class SdsContext;
    class Json;
    
    /*
     * Storage backend capabilities from public/system/info. Fetched on first
     * use and kept for the life of the context.
     */
    class SystemInfo {
    public:
        explicit SystemInfo(SdsContext& ctx);
        
        virtual ~SystemInfo();
        
        // Object storage (S3) backs the service
        bool useS3Storage();
        
        // The proxy upload path is disabled
        bool s3EnforceDirectUpload();
        
        // Forget the fetched values. The next access fetches them again.
        void clear();
        
    private:
        static const std::string URL_SYSTEM_INFO;
        
        bool mLoaded;
        bool mUseS3Storage;
        bool mS3EnforceDirectUpload;
        std::mutex mMutex;
        SdsContext& mCtx;
        
        void fillFromJson(const Json& jsonObj);
        
        void updateIfStale();
        
        void update();
        
        SystemInfo(const SystemInfo& orig);
    };

}

#endif	/* SYSTEMINFO_HPP */
