/* 
 * File:   SdsContext.cpp
 * Author: me
 * 
 * Created on March 6, 2024, 4:35 PM
 */

#include "SdsContext.hpp"
#include "HttpTransport.hpp"
#include "Timing.hpp"

using namespace std;

namespace sdsclient
{
    const string SdsContext::API_PREFIX = "api/v4/";
    
    SdsContext::SdsContext(const Config& config, HttpTransport* transport, 
            Clock* clock, Sleeper* sleeper)
    : mConfig(config), mpTransport(transport), mpClock(clock), 
            mpSleeper(sleeper), mSystemInfo(*this)
    {
        // No body
    }

    SdsContext::~SdsContext()
    {
        // Empty
    }
    
    const Config& SdsContext::config() const
    {
        return mConfig;
    }
    
    HttpTransport& SdsContext::transport()
    {
        return *mpTransport;
    }
    
    const Clock& SdsContext::clock() const
    {
        return *mpClock;
    }
    
    Sleeper& SdsContext::sleeper()
    {
        return *mpSleeper;
    }
    
    string SdsContext::url(const string& path) const
    {
        return mConfig.baseUrl() + path;
    }
    
    string SdsContext::apiUrl(const string& path) const
    {
        return mConfig.baseUrl() + API_PREFIX + path;
    }
    
    SystemInfo& SdsContext::systemInfo()
    {
        return mSystemInfo;
    }

}
