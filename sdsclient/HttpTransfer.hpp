/* 
 * File:   HttpTransfer.hpp
 * Author: me
 *
 * Created on March 7, 2024, 10:02 AM
 */

#ifndef HTTPTRANSFER_HPP
#define	HTTPTRANSFER_HPP

#include "HttpTransport.hpp"
#include "HttpQuery.hpp"
#include "SdsEnums.hpp"

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace sdsclient
{
    class SdsContext;
    class Json;
    class Secret;
    
    /*
     * One logical HTTP request: built up with the setters, then sent with
     * execute(). Transport failures, 5xx and 429 responses are retried with 
     * exponential backoff up to the configured number of attempts.
     */
    class HttpTransfer {
    public:
        explicit HttpTransfer(SdsContext& ctx);
        
        // Wipes any request body, which may carry credentials
        virtual ~HttpTransfer();
        
        SdsContext& getContext();

        HttpTransfer& setRequestType(Request_Type requestType);

        HttpTransfer& setUrl(const std::string& url);

        HttpTransfer& setBody(const std::string& body, 
                const std::string& contentType="application/octet-stream");
        
        HttpTransfer& setBody(const char* data, size_t size, 
                const std::string& contentType="application/octet-stream");
        
        HttpTransfer& setJsonBody(const Json& json);
        
        // Sends "Authorization: {value}", e.g. value = "Bearer abc"
        HttpTransfer& setAuthorization(const Secret& value);
        
        // Sends "{name}: {value}" with a value that must not be logged
        HttpTransfer& setCredentialHeader(const std::string& name, 
                const Secret& value);

        // Successful response bodies go to callback instead of getData()
        HttpTransfer& setSink(DataSinkCallback callback, void* userdata);
        
        HttpTransfer& setRetry(bool retry);

        HttpTransfer& addQuery(const std::string& field, 
            const std::string& value);

        // Form fields, sent as an application/x-www-form-urlencoded body
        HttpTransfer& addPostField(const std::string& field, 
            const std::string& value);

        HttpTransfer& addHeader(const std::string& header);

        /*
         * execute():   Sends the request. Throws ConnectionError if no 
         *              attempt reached the server, IoError if the sink 
         *              refused data, and ConfigurationError if no URL was 
         *              set. An HTTP error status does not throw; check 
         *              isSuccess() or call throwIfFailed().
         */
        void execute();
        
        long getHttpResponse() const;

        const std::string& getData() const;
        
        const std::string& getReturnedHeaders() const;
        
        // Empty if the response didn't carry the header
        std::string getHeader(const std::string& name) const;

        // 2xx status
        bool isSuccess() const;
        
        int getAttempts() const;
        
        uint64_t getBytesToSink() const;
        
        /*
         * throwIfFailed(): Throws HttpError unless the status is 2xx. The 
         *                  body is read as an S3 XML document if fromStorage
         *                  is true, otherwise as an API JSON error.
         */
        void throwIfFailed(bool fromStorage=false) const;

    private:
        enum Retry_Method
        {
            RETRY,
            NORETRY
        };
        
        SdsContext& mCtx;
        HttpRequest mRequest;
        HttpResponse mResponse;
        HttpQuery mQuery;
        HttpQuery mPostData;
        bool mRetry;
        int mAttempts;
        
        void executeWithRetry(int tryNum);
        
        Retry_Method shouldRetry(long httpResp) const;
        
        long retryDelay(int tryNum) const;
        
        void wipeBody();
        
        HttpTransfer(const HttpTransfer& orig);
        
    };

}

#endif	/* HTTPTRANSFER_HPP */
