/* 
 * File:   HttpTransport.cpp
 * Author: me
 * 
 * Created on March 5, 2024, 9:02 PM
 */

#include "HttpTransport.hpp"

namespace sdsclient
{
    const char* toString(Request_Type method)
    {
        switch (method)
        {
            case GET:
                return "GET";
            case POST:
                return "POST";
            case PUT:
                return "PUT";
            case PATCH:
                return "PATCH";
            case DELETE:
                return "DELETE";
            case HEAD:
                return "HEAD";
            default:
                return "UNKNOWN";
        }
    }
    
    HttpRequest::HttpRequest()
    : method(GET), hasBody(false), sink(NULL), sinkUserdata(NULL)
    {
        // No body
    }
    
    HttpResponse::HttpResponse()
    : status(0), bytesToSink(0)
    {
        // No body
    }
    
    void HttpResponse::reset()
    {
        status = 0;
        body.clear();
        headers.clear();
        bytesToSink = 0;
    }
    
    HttpTransport::~HttpTransport()
    {
        // Empty
    }
}
