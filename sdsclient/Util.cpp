/* 
 * File:   Util.cpp
 * Author: me
 * 
 * Created on March 3, 2024, 3:32 PM
 */

#include "Util.hpp"
#include "Errors.hpp"

#include <ctype.h>
#include <errno.h>
#include <libgen.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

using namespace std;
namespace sdsclient
{
    namespace
    {
        // dirname() may modify its argument, so it gets a copy
        string parentOf(const string& path)
        {
            vector<char> buf(path.begin(), path.end());
            buf.push_back('\0');
            return dirname(&buf[0]);
        }
        
        // The five entities XML predefines. Anything else is left as is.
        string decodeXmlEntities(const string& text)
        {
            static const char* const entities[][2] = {
                { "&amp;", "&" },
                { "&lt;", "<" },
                { "&gt;", ">" },
                { "&quot;", "\"" },
                { "&apos;", "'" }
            };
            
            const size_t entityCount = sizeof(entities) / sizeof(entities[0]);
            
            string result;
            result.reserve(text.size());
            size_t pos = 0;
            while (pos < text.size())
            {
                size_t amp = text.find('&', pos);
                if (amp == string::npos)
                {
                    result.append(text, pos, string::npos);
                    break;
                }
                result.append(text, pos, amp - pos);
                
                size_t matched = 0;
                for (size_t i = 0; i < entityCount && matched == 0; i++)
                {
                    if (text.compare(amp, strlen(entities[i][0]), 
                            entities[i][0]) == 0)
                    {
                        result += entities[i][1];
                        matched = strlen(entities[i][0]);
                    }
                }
                if (matched == 0)
                {
                    result += '&';
                    matched = 1;
                }
                pos = amp + matched;
            }
            return result;
        }
    }
    
    uint64_t Util::divideCeil(uint64_t dividend, uint64_t divisor)
    {
        // Integer division rounds down.  If there's a remainder, add 1.
        return (dividend % divisor == 0) ? 
            (dividend / divisor) : 
            (dividend / divisor + 1);
    }

    FILE* Util::recursiveFopen(const string& path, const string& mode)
    {
        // The only files we create hold credentials.
        mode_t oldUmask = umask(S_IRGRP | S_IWGRP | S_IXGRP | 
                                S_IROTH | S_IWOTH | S_IXOTH);

        string parentDir = parentOf(path);

        FILE* returnVal = NULL;
        if (access(parentDir.c_str(), F_OK) == 0 || 
                recursiveMkdir(parentDir) == 0)
        {
            returnVal = fopen(path.c_str(), mode.c_str());
        }

        umask(oldUmask);
        return returnVal;
    }

    int Util::recursiveMkdir(const string& path)
    {
        string parentDir = parentOf(path);

        if (parentDir != path && access(parentDir.c_str(), F_OK) != 0)
        {
            int parentResult = recursiveMkdir(parentDir);
            if (parentResult != 0)
            {
                return parentResult;
            }
        }

        if (mkdir(path.c_str(), 0700) != 0 && errno != EEXIST)
        {
            return -1;
        }
        return 0;
    }
    
    uint64_t Util::strtoull(const string& nstr, size_t& index)
    {
        const char* nptr = nstr.c_str();
        const char* startptr = nptr + index;
        char* endptr = NULL;
        uint64_t returnVal = ::strtoull(startptr, &endptr, 10);
        size_t newIndex = endptr - nptr;
        index = (newIndex >= nstr.length()) ? string::npos : newIndex;
        return returnVal;
    }
    
    string Util::toString(uint64_t value)
    {
        stringstream ss;
        ss << value;
        return ss.str();
    }
    
    string Util::epochTimeToRfc3339(time_t t)
    {
        struct tm brokenDown;
        if (gmtime_r(&t, &brokenDown) == NULL)
        {
            return "";
        }
        char buffer[32];
        size_t len = ::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", 
                &brokenDown);
        return string(buffer, len);
    }
    
    string Util::base64Encode(const string& data)
    {
        if (data.empty())
        {
            return "";
        }
        // 4 output characters for every 3 input bytes, plus the terminator
        vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
        int len = EVP_EncodeBlock(&out[0], 
                reinterpret_cast<const unsigned char*>(data.data()), 
                (int) data.size());
        return string(reinterpret_cast<const char*>(&out[0]), len);
    }
    
    string Util::base64Decode(const string& data)
    {
        if (data.empty())
        {
            return "";
        }
        if (data.size() % 4 != 0)
        {
            throw CryptoError("base64 input has invalid length");
        }
        vector<unsigned char> out(3 * (data.size() / 4) + 1);
        int len = EVP_DecodeBlock(&out[0], 
                reinterpret_cast<const unsigned char*>(data.data()), 
                (int) data.size());
        if (len < 0)
        {
            throw CryptoError("invalid base64 input");
        }
        
        // EVP_DecodeBlock() counts the padding as zero bytes.
        size_t padding = 0;
        if (data[data.size() - 1] == '=')
        {
            padding++;
            if (data[data.size() - 2] == '=')
            {
                padding++;
            }
        }
        return string(reinterpret_cast<const char*>(&out[0]), len - padding);
    }
    
    string Util::base64UrlEncodeNoPad(const string& data)
    {
        string encoded = base64Encode(data);
        for (size_t i = 0; i < encoded.size(); i++)
        {
            if (encoded[i] == '+')
            {
                encoded[i] = '-';
            }
            else if (encoded[i] == '/')
            {
                encoded[i] = '_';
            }
        }
        size_t padStart = encoded.find('=');
        if (padStart != string::npos)
        {
            encoded.erase(padStart);
        }
        return encoded;
    }
    
    string Util::extractXmlElement(const string& xml, const string& tag)
    {
        string openTag = "<" + tag + ">";
        string closeTag = "</" + tag + ">";
        
        size_t start = xml.find(openTag);
        if (start == string::npos)
        {
            return "";
        }
        start += openTag.length();
        
        size_t end = xml.find(closeTag, start);
        if (end == string::npos)
        {
            return "";
        }
        return decodeXmlEntities(xml.substr(start, end - start));
    }
    
    string Util::findHeader(const string& rawHeaders, const string& name)
    {
        string wanted;
        for (size_t i = 0; i < name.size(); i++)
        {
            wanted += (char) tolower((unsigned char) name[i]);
        }
        
        string result;
        istringstream lines(rawHeaders);
        string line;
        while (getline(lines, line))
        {
            size_t colon = line.find(':');
            if (colon == string::npos || colon != wanted.size())
            {
                continue;
            }
            
            bool matches = true;
            for (size_t i = 0; i < colon && matches; i++)
            {
                matches = (tolower((unsigned char) line[i]) == wanted[i]);
            }
            if (!matches)
            {
                continue;
            }
            
            // Trim the separator whitespace and the trailing "\r"
            size_t valueStart = line.find_first_not_of(" \t", colon + 1);
            size_t valueEnd = line.find_last_not_of(" \t\r");
            result = (valueStart == string::npos || valueEnd < valueStart) ? 
                string() : 
                line.substr(valueStart, valueEnd - valueStart + 1);
        }
        return result;
    }
    
    bool Util::parseContentRangeTotal(const string& contentRange, 
            uint64_t& total)
    {
        size_t slash = contentRange.rfind('/');
        if (slash == string::npos || slash + 1 >= contentRange.size() || 
                !isdigit((unsigned char) contentRange[slash + 1]))
        {
            // Missing, or "*" for an unknown length
            return false;
        }
        size_t index = slash + 1;
        total = Util::strtoull(contentRange, index);
        return true;
    }
    
    string Util::stripQuotes(const string& value)
    {
        if (value.size() >= 2 && value[0] == '"' && 
                value[value.size() - 1] == '"')
        {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }
    
    string Util::statusReason(long httpStatus)
    {
        switch (httpStatus)
        {
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 402: return "Payment Required";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 406: return "Not Acceptable";
            case 408: return "Request Timeout";
            case 409: return "Conflict";
            case 410: return "Gone";
            case 412: return "Precondition Failed";
            case 413: return "Payload Too Large";
            case 415: return "Unsupported Media Type";
            case 416: return "Range Not Satisfiable";
            case 429: return "Too Many Requests";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            case 504: return "Gateway Timeout";
            case 507: return "Insufficient Storage";
            default:
                return (httpStatus >= 500) ? "Server Error" : "Client Error";
        }
    }

}
