/* 
 * File:   HttpQuery.cpp
 * Author: me
 * 
 * Created on March 6, 2024, 9:43 AM
 */

#include "HttpQuery.hpp"

#include <algorithm>
#include <new>
#include <sstream>
#include <curl/curl.h>

using namespace std;

namespace sdsclient
{
    HttpQuery::HttpQuery()
    {
        // Empty
    }
    
    HttpQuery::HttpQuery(const string& field, const string& value)
    {
        add(field, value);
    }
    
    HttpQuery::~HttpQuery()
    {
        // Form fields may hold passwords and tokens.
        for (size_t i = 0; i < mFields.size(); i++)
        {
            string& value = mFields[i].second;
            if (!value.empty())
            {
                fill(value.begin(), value.end(), '\0');
            }
        }
    }

    HttpQuery& HttpQuery::add(const string& field, const string& value)
    {
        mFields.push_back(make_pair(field, value));
        return *this;
    }
    
    bool HttpQuery::empty() const
    {
        return mFields.empty();
    }

    string HttpQuery::assemble(const string& url) const
    {
        if (mFields.empty())
        {
            return url;
        }
        
        // Add to an existing query string if the URL already has one.
        char separator = (url.find('?') == string::npos) ? '?' : '&';
        return url + separator + assembleAsPostData();
    }
    
    string HttpQuery::assembleAsPostData() const
    {
        stringstream outStream;
        for (size_t i = 0; i < mFields.size(); i++)
        {
            if (i > 0)
            {
                outStream << '&';
            }
            outStream << escape(mFields[i].first) << '=' 
                    << escape(mFields[i].second);
        }
        return outStream.str();
    }
    
    string HttpQuery::escape(const string& str)
    {
        CURL* curlHandle = curl_easy_init();
        if (curlHandle == NULL)
        {
            throw bad_alloc();
        }
        char* escaped = curl_easy_escape(curlHandle, str.data(), 
                (int) str.length());
        if (escaped == NULL)
        {
            curl_easy_cleanup(curlHandle);
            throw bad_alloc();
        }
        string result(escaped);
        curl_free(escaped);
        curl_easy_cleanup(curlHandle);
        return result;
    }
}
