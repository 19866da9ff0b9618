/* 
 * File:   HttpTransfer.cpp
 * Author: me
 * 
 * Created on March 7, 2024, 10:02 AM
 */

#include "HttpTransfer.hpp"
#include "SdsContext.hpp"
#include "Timing.hpp"
#include "Secret.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Util.hpp"
#include "Log.hpp"

#include <stdlib.h>
#include <openssl/crypto.h>

using namespace std;

namespace sdsclient
{
    
    HttpTransfer::HttpTransfer(SdsContext& ctx)
    : mCtx(ctx), mRetry(true), mAttempts(0)
    {
        // No body
    }
        
    HttpTransfer::~HttpTransfer()
    {
        wipeBody();
    }
    
    SdsContext& HttpTransfer::getContext()
    {
        return mCtx;
    }

    HttpTransfer& HttpTransfer::setRequestType(Request_Type requestType)
    {
        mRequest.method = requestType;
        return *this;
    }

    HttpTransfer& HttpTransfer::setUrl(const string& url)
    {
        mRequest.url = url;
        return *this;
    }

    HttpTransfer& HttpTransfer::setBody(const string& body, 
            const string& contentType)
    {
        return setBody(body.data(), body.size(), contentType);
    }
    
    HttpTransfer& HttpTransfer::setBody(const char* data, size_t size, 
            const string& contentType)
    {
        wipeBody();
        mRequest.body.assign(data, size);
        mRequest.hasBody = true;
        if (!contentType.empty())
        {
            addHeader("Content-Type: " + contentType);
        }
        return *this;
    }
    
    HttpTransfer& HttpTransfer::setJsonBody(const Json& json)
    {
        return setBody(json.toString(), "application/json");
    }
    
    HttpTransfer& HttpTransfer::setAuthorization(const Secret& value)
    {
        return setCredentialHeader("Authorization", value);
    }
    
    HttpTransfer& HttpTransfer::setCredentialHeader(const string& name, 
            const Secret& value)
    {
        string header = name + ": " + value.expose();
        mRequest.credentialHeader = Secret(header);
        OPENSSL_cleanse(&header[0], header.size());
        return *this;
    }

    HttpTransfer& HttpTransfer::setSink(DataSinkCallback callback, 
            void* userdata)
    {
        mRequest.sink = callback;
        mRequest.sinkUserdata = userdata;
        return *this;
    }
    
    HttpTransfer& HttpTransfer::setRetry(bool retry)
    {
        mRetry = retry;
        return *this;
    }

    HttpTransfer& HttpTransfer::addQuery(const string& field, 
        const string& value)
    {
        mQuery.add(field, value);
        return *this;
    }

    HttpTransfer& HttpTransfer::addPostField(const string& field, 
        const string& value)
    {
        mPostData.add(field, value);
        return *this;
    }

    HttpTransfer& HttpTransfer::addHeader(const string& header)
    {
        mRequest.headers.push_back(header);
        return *this;
    }

    void HttpTransfer::execute()
    {
        if (mRequest.url.empty())
        {
            throw ConfigurationError("request has no URL");
        }
        
        if (!mQuery.empty())
        {
            mRequest.url = mQuery.assemble(mRequest.url);
        }
        if (!mPostData.empty())
        {
            string postData = mPostData.assembleAsPostData();
            setBody(postData, "application/x-www-form-urlencoded");
            OPENSSL_cleanse(&postData[0], postData.size());
        }
        
        mAttempts = 0;
        executeWithRetry(1);
    }

    long HttpTransfer::getHttpResponse() const
    {
        return mResponse.status;
    }

    const string& HttpTransfer::getData() const
    {
        return mResponse.body;
    }
    
    const string& HttpTransfer::getReturnedHeaders() const
    {
        return mResponse.headers;
    }
    
    string HttpTransfer::getHeader(const string& name) const
    {
        return Util::findHeader(mResponse.headers, name);
    }

    bool HttpTransfer::isSuccess() const
    {
        return mResponse.status >= 200 && mResponse.status < 300;
    }
    
    int HttpTransfer::getAttempts() const
    {
        return mAttempts;
    }
    
    uint64_t HttpTransfer::getBytesToSink() const
    {
        return mResponse.bytesToSink;
    }
    
    void HttpTransfer::throwIfFailed(bool fromStorage) const
    {
        if (isSuccess())
        {
            return;
        }
        ErrorResponse error = fromStorage ? 
            ErrorResponse::fromStorageBody(mResponse.status, mResponse.body) :
            ErrorResponse::fromApiBody(mResponse.status, mResponse.body);
        SDS_LOG_DEBUG << "Request failed: " << error.toString();
        throw HttpError(error);
    }
    
    void HttpTransfer::executeWithRetry(int tryNum)
    {
        mAttempts = tryNum;
        mResponse.reset();
        
        // Presigned URLs carry their signature in the query string
        SDS_LOG_TRACE << "HTTP " << toString(mRequest.method) << " " 
                << mRequest.url.substr(0, mRequest.url.find('?')) 
                << " (attempt " << tryNum << ")";
        
        bool canRetry = mRetry && tryNum < mCtx.config().maxAttempts();
        try
        {
            mCtx.transport().perform(mRequest, mResponse);
        }
        catch (const ConnectionError& e)
        {
            // Data already handed to a sink can't be taken back
            if (!canRetry || mResponse.bytesToSink > 0)
            {
                throw;
            }
            SDS_LOG_WARN << "Connection failed (" << e.what() 
                    << "), retrying";
            mCtx.sleeper().sleepMs(retryDelay(tryNum));
            executeWithRetry(tryNum + 1);
            return;
        }
        
        if (!canRetry || shouldRetry(mResponse.status) == NORETRY)
        {
            return;
        }
        
        long waitTime = retryDelay(tryNum);
        string retryAfter = getHeader("Retry-After");
        if (!retryAfter.empty())
        {
            size_t index = 0;
            uint64_t seconds = Util::strtoull(retryAfter, index);
            if (index == string::npos && seconds * 1000 > (uint64_t) waitTime)
            {
                long maxDelay = mCtx.config().maxRetryDelay();
                waitTime = (seconds * 1000 > (uint64_t) maxDelay) ? 
                    maxDelay : (long) (seconds * 1000);
            }
        }
        SDS_LOG_WARN << "HTTP " << mResponse.status << ", retrying in " 
                << waitTime << " ms";
        mCtx.sleeper().sleepMs(waitTime);
        executeWithRetry(tryNum + 1);
    }
    
    HttpTransfer::Retry_Method HttpTransfer::shouldRetry(long httpResp) const
    {
        if (httpResp >= 500 || httpResp == 429)
        {
            return RETRY;
        }
        return NORETRY;
    }
    
    long HttpTransfer::retryDelay(int tryNum) const
    {
        const Config& config = mCtx.config();
        long maxDelay = config.maxRetryDelay();
        
        // Start with the minimum delay and double it on every try
        long waitTime = config.minRetryDelay();
        for (int i = 1; i < tryNum && waitTime < maxDelay; i++)
        {
            waitTime *= 2;
        }
        
        // Jitter of up to a quarter of the minimum delay
        waitTime += rand() % (config.minRetryDelay() / 4 + 1);
        
        return (waitTime > maxDelay) ? maxDelay : waitTime;
    }
    
    void HttpTransfer::wipeBody()
    {
        if (!mRequest.body.empty())
        {
            OPENSSL_cleanse(&mRequest.body[0], mRequest.body.size());
        }
        mRequest.body.clear();
    }

}
