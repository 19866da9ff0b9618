/* 
 * File:   CurlTransport.hpp
 * Author: me
 *
 * Created on March 5, 2024, 10:31 PM
 */

#ifndef CURLTRANSPORT_HPP
#define	CURLTRANSPORT_HPP

#include "HttpTransport.hpp"

#include <mutex>
#include <string>
#include <curl/curl.h>

namespace sdsclient
{
    /*
     * HttpTransport on top of the libcurl easy interface. A preconfigured 
     * template handle is duplicated for each request, so concurrent 
     * requests from several threads don't share a handle.
     */
    class CurlTransport : public HttpTransport {
    public:
        // Timeouts in seconds, 0 for libcurl's defaults
        CurlTransport(const std::string& userAgent, long connectTimeout, 
                long readTimeout);
        
        virtual ~CurlTransport();
        
        virtual void perform(const HttpRequest& request, 
                HttpResponse& response);
        
    private:
        std::string mUserAgent;
        long mConnectTimeout;
        long mReadTimeout;
        CURL* mCurlHandle;
        std::mutex mHandleMutex;
        
        CURL* getCurlHandle();
        
        void setupCurlHandle(CURL* curlHandle);
        
        static bool hasContentType(const HttpRequest& request);
        
        CurlTransport(const CurlTransport& orig);
        
    };

}

#endif	/* CURLTRANSPORT_HPP */
