/* 
 * File:   DownloadBuffer.cpp
 * Author: me
 * 
 * Created on March 5, 2024, 9:40 PM
 */

#include "DownloadBuffer.hpp"
#include "HttpTransport.hpp"

using namespace std;
namespace sdsclient
{
    DownloadBuffer::DownloadBuffer(const HttpRequest& request, 
            HttpResponse& response)
    : mRequest(request), mResponse(response), mCurlHandle(NULL), 
            mSinkFailed(false)
    {
        // No body
    }

    DownloadBuffer::~DownloadBuffer()
    {
        // Empty
    }
    
    bool DownloadBuffer::sinkFailed() const
    {
        return mSinkFailed;
    }

    CURLcode DownloadBuffer::download(CURL* curlHandle)
    {
        mCurlHandle = curlHandle;
        mResponse.reset();
        
        curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, dataCallback);
        curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, this);

        // Capture the returned headers with a callback
        curl_easy_setopt(curlHandle, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curlHandle, CURLOPT_HEADERDATA, this);

        // Do the transfer.
        CURLcode resultCode = curl_easy_perform(curlHandle);

        // Get the HTTP response
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, 
                &mResponse.status);
        mResponse.body = mData.str();
        mResponse.headers = mReturnedHeaders.str();
        
        mCurlHandle = NULL;
        return resultCode;
    }

    size_t DownloadBuffer::dataCallback(char *newData, size_t size, 
            size_t nmemb, void *userdata)
    {
        size_t dataSize = size * nmemb;
        if (dataSize == 0)
        {
            return 0;
        }

        DownloadBuffer* pBuffer = (DownloadBuffer*) userdata;
        
        if (pBuffer->mRequest.sink != NULL)
        {
            // The status line has been seen by the time body data arrives.
            long httpResp = 0;
            curl_easy_getinfo(pBuffer->mCurlHandle, CURLINFO_RESPONSE_CODE, 
                    &httpResp);
            if (httpResp >= 200 && httpResp < 300)
            {
                size_t consumed = pBuffer->mRequest.sink(newData, dataSize, 
                        pBuffer->mRequest.sinkUserdata);
                if (consumed != dataSize)
                {
                    pBuffer->mSinkFailed = true;
                    return 0;
                }
                pBuffer->mResponse.bytesToSink += dataSize;
                return dataSize;
            }
            // else an error body, keep it for parsing
        }

        pBuffer->mData.write(newData, dataSize);
        return pBuffer->mData.good() ? dataSize : 0;
    }

    size_t DownloadBuffer::headerCallback(char* buffer, size_t size, 
            size_t nitems, void* userdata)
    {
        DownloadBuffer* pDlBuf = (DownloadBuffer*) userdata;

        size_t newHeaderLength = size * nitems;
        pDlBuf->mReturnedHeaders.write(buffer, newHeaderLength);
        
        return pDlBuf->mReturnedHeaders.good() ? newHeaderLength : 0;
    }

}
