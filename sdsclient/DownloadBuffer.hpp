/* 
 * File:   DownloadBuffer.hpp
 * Author: me
 *
 * Created on March 5, 2024, 9:40 PM
 */

#ifndef DOWNLOADBUFFER_HPP
#define	DOWNLOADBUFFER_HPP

#include <curl/curl.h>
#include <string>
#include <sstream>

namespace sdsclient
{
    class HttpRequest;
    class HttpResponse;

    /*
     * Collects what libcurl hands back for one request: the header lines and
     * either the body in memory, or, for successful responses to a request
     * with a sink, the body passed straight through to the sink.
     */
    class DownloadBuffer {
    public:
        DownloadBuffer(const HttpRequest& request, HttpResponse& response);
        
        virtual ~DownloadBuffer();
        
        // Performs the transfer and fills in the response
        CURLcode download(CURL* curlHandle);
        
        bool sinkFailed() const;
        
    private:
        const HttpRequest& mRequest;
        HttpResponse& mResponse;
        CURL* mCurlHandle;
        bool mSinkFailed;
        std::stringstream mData;
        std::stringstream mReturnedHeaders;

        static size_t dataCallback(char *newData, size_t size, 
            size_t nmemb, void *userdata);

        static size_t headerCallback(char* buffer, size_t size, size_t nitems,
            void* userdata);
        
        DownloadBuffer(const DownloadBuffer& orig);
        
    };

}

#endif	/* DOWNLOADBUFFER_HPP */
