/* 
 * File:   CurlTransport.cpp
 * Author: me
 * 
 * Created on March 5, 2024, 10:31 PM
 */

#include "CurlTransport.hpp"
#include "DownloadBuffer.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <strings.h>

using namespace std;

namespace sdsclient
{
    CurlTransport::CurlTransport(const string& userAgent, long connectTimeout, 
            long readTimeout)
    : mUserAgent(userAgent), mConnectTimeout(connectTimeout), 
            mReadTimeout(readTimeout), mCurlHandle(NULL)
    {
        if (curl_global_init(CURL_GLOBAL_ALL) != 0)
        {
            throw ConnectionError(ConnectionError::OTHER, 
                    "libcurl initialization failed");
        }
    }

    CurlTransport::~CurlTransport()
    {
        if (mCurlHandle != NULL)
        {
            curl_easy_cleanup(mCurlHandle);
        }
        curl_global_cleanup();
    }
    
    void CurlTransport::perform(const HttpRequest& request, 
            HttpResponse& response)
    {
        CURL* curlHandle = getCurlHandle();
        if (curlHandle == NULL)
        {
            throw ConnectionError(ConnectionError::OTHER, 
                    "could not create a curl handle");
        }

        // Set the request type
        switch (request.method)
        {
            case GET:
                curl_easy_setopt(curlHandle, CURLOPT_HTTPGET, 1L);
                break;

            case POST:
                curl_easy_setopt(curlHandle, CURLOPT_POST, 1L);
                break;

            case PUT:
                // PUT with an in-memory body: send it like POST data and 
                // rename the method.
                curl_easy_setopt(curlHandle, CURLOPT_POST, 1L);
                curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, "PUT");
                break;

            case PATCH:
                curl_easy_setopt(curlHandle, CURLOPT_POST, 1L);
                curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, "PATCH");
                break;

            case DELETE:
                curl_easy_setopt(curlHandle, CURLOPT_HTTPGET, 1L);
                curl_easy_setopt(curlHandle, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
                
            case HEAD:
                curl_easy_setopt(curlHandle, CURLOPT_NOBODY, 1L);
                break;
        }
        
        curl_easy_setopt(curlHandle, CURLOPT_URL, request.url.c_str());
        
        if (request.method == POST || request.method == PUT || 
                request.method == PATCH)
        {
            // A request type that normally has a body always gets an explicit
            // length, 0 if no body was given. The body may be binary.
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDSIZE_LARGE, 
                    (curl_off_t) (request.hasBody ? request.body.size() : 0));
            curl_easy_setopt(curlHandle, CURLOPT_POSTFIELDS, 
                    request.hasBody ? request.body.data() : "");
        }

        // Set headers
        struct curl_slist* pHeaders = NULL;
        for (size_t i = 0; i < request.headers.size(); i++)
        {
            pHeaders = curl_slist_append(pHeaders, request.headers[i].c_str());
        }
        if (!request.credentialHeader.empty())
        {
            pHeaders = curl_slist_append(pHeaders, 
                    request.credentialHeader.expose().c_str());
        }
        // libcurl adds "Expect: 100-continue" to large bodies, which some 
        // storage endpoints reject.
        pHeaders = curl_slist_append(pHeaders, "Expect:");
        if (request.hasBody && !hasContentType(request))
        {
            // Otherwise libcurl labels the body as form data
            pHeaders = curl_slist_append(pHeaders, "Content-Type:");
        }
        curl_easy_setopt(curlHandle, CURLOPT_HTTPHEADER, pHeaders);

        DownloadBuffer resultBuf(request, response);
        CURLcode result = resultBuf.download(curlHandle);
        
        curl_slist_free_all(pHeaders);
        curl_easy_cleanup(curlHandle);
        
        if (result == CURLE_OK)
        {
            return;
        }
        
        if (resultBuf.sinkFailed())
        {
            throw IoError("writing the response body failed");
        }
        
        string message = string("transfer failed: ") + curl_easy_strerror(result);
        SDS_LOG_DEBUG << "curl error " << result << ": " 
                << curl_easy_strerror(result);
        switch (result)
        {
            case CURLE_OPERATION_TIMEDOUT:
                throw ConnectionError(ConnectionError::TIMEOUT, message);
            case CURLE_COULDNT_CONNECT:
                throw ConnectionError(ConnectionError::REFUSED, message);
            default:
                throw ConnectionError(ConnectionError::OTHER, message);
        }
    }
    
    bool CurlTransport::hasContentType(const HttpRequest& request)
    {
        for (size_t i = 0; i < request.headers.size(); i++)
        {
            if (strncasecmp(request.headers[i].c_str(), "Content-Type:", 
                    13) == 0)
            {
                return true;
            }
        }
        return false;
    }
    
    CURL* CurlTransport::getCurlHandle()
    {
        lock_guard<mutex> lock(mHandleMutex);
        if (mCurlHandle == NULL)
        {
            mCurlHandle = curl_easy_init();
            if (mCurlHandle == NULL)
            {
                return NULL;
            }
            setupCurlHandle(mCurlHandle);
        }
        return curl_easy_duphandle(mCurlHandle);
    }

    void CurlTransport::setupCurlHandle(CURL* curlHandle)
    {
        // Accept compressed responses and let libcurl automatically uncompress
        curl_easy_setopt(curlHandle, CURLOPT_ACCEPT_ENCODING, "");

        // Automatically follow redirects
        curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
        
        curl_easy_setopt(curlHandle, CURLOPT_USERAGENT, mUserAgent.c_str());
        
        // Safe for use from several threads
        curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L);
        
        if (mConnectTimeout > 0)
        {
            curl_easy_setopt(curlHandle, CURLOPT_CONNECTTIMEOUT, mConnectTimeout);
        }
        if (mReadTimeout > 0)
        {
            // Abort when the transfer stalls below 1 byte/s for the 
            // configured time.
            curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_TIME, mReadTimeout);
        }
    }

}
