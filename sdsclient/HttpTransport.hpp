/* 
 * File:   HttpTransport.hpp
 * Author: me
 *
 * Created on March 5, 2024, 9:02 PM
 */

#ifndef HTTPTRANSPORT_HPP
#define	HTTPTRANSPORT_HPP

#include "SdsEnums.hpp"
#include "Secret.hpp"

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace sdsclient
{
    /*
     * Receives response body bytes as they arrive, for successful (2xx) 
     * responses only. Must return size to continue; any other value aborts 
     * the transfer.
     */
    typedef size_t(*DataSinkCallback)
    (const char* data, size_t size, void* userdata);
    
    const char* toString(Request_Type method);
    
    class HttpRequest {
    public:
        HttpRequest();
        
        Request_Type method;
        std::string url;
        std::vector<std::string> headers;
        // Full "Name: value" header line carrying a credential, if any
        Secret credentialHeader;
        bool hasBody;
        std::string body;
        DataSinkCallback sink;
        void* sinkUserdata;
    };
    
    class HttpResponse {
    public:
        HttpResponse();
        
        void reset();
        
        long status;
        // Body of the response, unless it went to the request's sink
        std::string body;
        // Raw header block(s), one "Name: value" per line
        std::string headers;
        uint64_t bytesToSink;
    };
    
    /*
     * Sends one HTTP request. Implementations throw ConnectionError when the
     * request could not be carried out at all. An HTTP error status is NOT 
     * an error at this level.
     */
    class HttpTransport {
    public:
        virtual ~HttpTransport();
        
        virtual void perform(const HttpRequest& request, 
                HttpResponse& response) = 0;
    };

}

#endif	/* HTTPTRANSPORT_HPP */
