/* 
 * File:   Errors.hpp
 * Author: me
 *
 * Created on March 3, 2024, 11:40 AM
 */

#ifndef ERRORS_HPP
#define	ERRORS_HPP

#include <stdint.h>
#include <stdexcept>
#include <string>

namespace sdsclient
{
    /*
     * Error payload returned by the API ({code, message, debugInfo, 
     * errorCode}) or by the storage backend (S3 XML). Unparseable bodies 
     * become a fallback built from the HTTP status.
     */
    class ErrorResponse {
    public:
        static const std::string FALLBACK_DEBUG_INFO;
        
        ErrorResponse();
        
        ErrorResponse(long code, const std::string& message, 
                const std::string& debugInfo="");
        
        // Parses the JSON error body of an API response.
        static ErrorResponse fromApiBody(long httpStatus, 
                const std::string& body);
        
        // Parses an S3 <Error> document. Falls back to the API format if the
        // body turns out to be JSON.
        static ErrorResponse fromStorageBody(long httpStatus, 
                const std::string& body);
        
        static ErrorResponse fallback(long httpStatus);
        
        long code() const;
        
        const std::string& message() const;
        
        const std::string& debugInfo() const;
        
        bool hasErrorCode() const;
        
        int64_t errorCode() const;
        
        ErrorResponse& setErrorCode(int64_t errorCode);
        
        bool isStorageError() const;
        
        const std::string& storageCode() const;
        
        const std::string& requestId() const;
        
        const std::string& hostId() const;
        
        const std::string& argumentName() const;
        
        bool isUnauthorized() const;
        
        bool isForbidden() const;
        
        bool isNotFound() const;
        
        bool isConflict() const;
        
        bool isPreconditionFailed() const;
        
        bool isTooManyRequests() const;
        
        bool isServerError() const;
        
        std::string toString() const;
        
    private:
        long mCode;
        std::string mMessage;
        std::string mDebugInfo;
        bool mHasErrorCode;
        int64_t mErrorCode;
        bool mIsStorageError;
        std::string mStorageCode;
        std::string mRequestId;
        std::string mHostId;
        std::string mArgumentName;
        
    };
    
    class SdsError : public std::runtime_error
    {
    public:
        explicit SdsError(const std::string& message);
    };
    
    class ConfigurationError : public SdsError
    {
    public:
        explicit ConfigurationError(const std::string& message);
    };
    
    class ConnectionError : public SdsError
    {
    public:
        enum Kind
        {
            TIMEOUT,
            REFUSED,
            OTHER
        };
        
        ConnectionError(Kind kind, const std::string& message);
        
        Kind kind() const;
        
    private:
        Kind mKind;
    };
    
    class AuthenticationError : public SdsError
    {
    public:
        AuthenticationError(long httpStatus, const std::string& error, 
                const std::string& description);
        
        long httpStatus() const;
        
        const std::string& error() const;
        
        const std::string& description() const;
        
    private:
        long mHttpStatus;
        std::string mError;
        std::string mDescription;
    };
    
    class HttpError : public SdsError
    {
    public:
        explicit HttpError(const ErrorResponse& response);
        
        const ErrorResponse& response() const;
        
    private:
        ErrorResponse mResponse;
    };
    
    class CryptoError : public SdsError
    {
    public:
        explicit CryptoError(const std::string& message);
    };
    
    class MissingEncryptionSecret : public SdsError
    {
    public:
        MissingEncryptionSecret();
    };
    
    class MissingArgument : public SdsError
    {
    public:
        explicit MissingArgument(const std::string& argument);
    };
    
    class IoError : public SdsError
    {
    public:
        explicit IoError(const std::string& message);
    };

}

#endif	/* ERRORS_HPP */
