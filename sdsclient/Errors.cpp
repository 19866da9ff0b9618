/* 
 * File:   Errors.cpp
 * Author: me
 * 
 * Created on March 3, 2024, 11:40 AM
 */

#include "Errors.hpp"
#include "Json.hpp"
#include "Util.hpp"

#include <sstream>

using namespace std;

namespace sdsclient
{
    const string ErrorResponse::FALLBACK_DEBUG_INFO = 
        "failed to parse error body";
    
    ErrorResponse::ErrorResponse()
    : mCode(0), mHasErrorCode(false), mErrorCode(0), mIsStorageError(false)
    {
        // No body
    }
    
    ErrorResponse::ErrorResponse(long code, const string& message, 
            const string& debugInfo)
    : mCode(code), mMessage(message), mDebugInfo(debugInfo), 
            mHasErrorCode(false), mErrorCode(0), mIsStorageError(false)
    {
        // No body
    }
    
    ErrorResponse ErrorResponse::fromApiBody(long httpStatus, 
            const string& body)
    {
        Json jsonObj(body);
        if (!jsonObj.isValid() || !jsonObj.has("message"))
        {
            return fallback(httpStatus);
        }
        
        ErrorResponse response(jsonObj.getInt64("code", (int64_t) httpStatus), 
                jsonObj.getString("message"), 
                jsonObj.getString("debugInfo"));
        bool hasErrorCode = false;
        int64_t errorCode = jsonObj.getInt64("errorCode", hasErrorCode);
        if (hasErrorCode)
        {
            response.setErrorCode(errorCode);
        }
        return response;
    }
    
    ErrorResponse ErrorResponse::fromStorageBody(long httpStatus, 
            const string& body)
    {
        if (body.find("<Error>") == string::npos)
        {
            // Some gateways in front of the storage answer with the API's
            // own JSON format.
            return fromApiBody(httpStatus, body);
        }
        
        ErrorResponse response(httpStatus, 
                Util::extractXmlElement(body, "Message"));
        response.mIsStorageError = true;
        response.mStorageCode = Util::extractXmlElement(body, "Code");
        response.mRequestId = Util::extractXmlElement(body, "RequestId");
        response.mHostId = Util::extractXmlElement(body, "HostId");
        response.mArgumentName = Util::extractXmlElement(body, "ArgumentName");
        if (response.mMessage.empty())
        {
            response.mMessage = Util::statusReason(httpStatus);
        }
        response.mDebugInfo = response.mStorageCode;
        return response;
    }
    
    ErrorResponse ErrorResponse::fallback(long httpStatus)
    {
        return ErrorResponse(httpStatus, Util::statusReason(httpStatus), 
                FALLBACK_DEBUG_INFO);
    }
    
    long ErrorResponse::code() const
    {
        return mCode;
    }
    
    const string& ErrorResponse::message() const
    {
        return mMessage;
    }
    
    const string& ErrorResponse::debugInfo() const
    {
        return mDebugInfo;
    }
    
    bool ErrorResponse::hasErrorCode() const
    {
        return mHasErrorCode;
    }
    
    int64_t ErrorResponse::errorCode() const
    {
        return mErrorCode;
    }
    
    ErrorResponse& ErrorResponse::setErrorCode(int64_t errorCode)
    {
        mHasErrorCode = true;
        mErrorCode = errorCode;
        return *this;
    }
    
    bool ErrorResponse::isStorageError() const
    {
        return mIsStorageError;
    }
    
    const string& ErrorResponse::storageCode() const
    {
        return mStorageCode;
    }
    
    const string& ErrorResponse::requestId() const
    {
        return mRequestId;
    }
    
    const string& ErrorResponse::hostId() const
    {
        return mHostId;
    }
    
    const string& ErrorResponse::argumentName() const
    {
        return mArgumentName;
    }
    
    bool ErrorResponse::isUnauthorized() const
    {
        return mCode == 401;
    }
    
    bool ErrorResponse::isForbidden() const
    {
        return mCode == 403;
    }
    
    bool ErrorResponse::isNotFound() const
    {
        return mCode == 404;
    }
    
    bool ErrorResponse::isConflict() const
    {
        return mCode == 409;
    }
    
    bool ErrorResponse::isPreconditionFailed() const
    {
        return mCode == 412;
    }
    
    bool ErrorResponse::isTooManyRequests() const
    {
        return mCode == 429;
    }
    
    bool ErrorResponse::isServerError() const
    {
        return mCode >= 500;
    }
    
    string ErrorResponse::toString() const
    {
        stringstream ss;
        ss << "Error " << mCode << ": " << mMessage;
        if (mHasErrorCode)
        {
            ss << " (error code " << mErrorCode << ")";
        }
        if (mIsStorageError && !mStorageCode.empty())
        {
            ss << " [" << mStorageCode << "]";
        }
        if (!mDebugInfo.empty() && mDebugInfo != mStorageCode)
        {
            ss << " - " << mDebugInfo;
        }
        return ss.str();
    }
    
    
    SdsError::SdsError(const string& message)
    : runtime_error(message)
    {
        // No body
    }
    
    ConfigurationError::ConfigurationError(const string& message)
    : SdsError("Invalid configuration: " + message)
    {
        // No body
    }
    
    ConnectionError::ConnectionError(Kind kind, const string& message)
    : SdsError(message), mKind(kind)
    {
        // No body
    }
    
    ConnectionError::Kind ConnectionError::kind() const
    {
        return mKind;
    }
    
    AuthenticationError::AuthenticationError(long httpStatus, 
            const string& error, const string& description)
    : SdsError("Authentication failed: " + error + 
            (description.empty() ? string() : " - " + description)), 
            mHttpStatus(httpStatus), mError(error), mDescription(description)
    {
        // No body
    }
    
    long AuthenticationError::httpStatus() const
    {
        return mHttpStatus;
    }
    
    const string& AuthenticationError::error() const
    {
        return mError;
    }
    
    const string& AuthenticationError::description() const
    {
        return mDescription;
    }
    
    HttpError::HttpError(const ErrorResponse& response)
    : SdsError(response.toString()), mResponse(response)
    {
        // No body
    }
    
    const ErrorResponse& HttpError::response() const
    {
        return mResponse;
    }
    
    CryptoError::CryptoError(const string& message)
    : SdsError("Crypto error: " + message)
    {
        // No body
    }
    
    MissingEncryptionSecret::MissingEncryptionSecret()
    : SdsError("Missing encryption secret: key pair is locked")
    {
        // No body
    }
    
    MissingArgument::MissingArgument(const string& argument)
    : SdsError("Missing argument: " + argument)
    {
        // No body
    }
    
    IoError::IoError(const string& message)
    : SdsError("I/O error: " + message)
    {
        // No body
    }

}
