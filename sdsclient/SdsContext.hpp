/* 
 * File:   SdsContext.hpp
 * Author: me
 *
 * Created on March 6, 2024, 4:35 PM
 */

#ifndef SDSCONTEXT_HPP
#define	SDSCONTEXT_HPP

#include "Config.hpp"
#include "SystemInfo.hpp"

#include <memory>
#include <string>

namespace sdsclient
{
    class HttpTransport;
    class Clock;
    class Sleeper;
    
    /*
     * Everything a request needs that doesn't depend on the session state:
     * the configuration, the transport, and the time sources. Shared by all
     * states of a client, and by everything the client hands out.
     */
    class SdsContext {
    public:
        static const std::string API_PREFIX;
        
        // Takes ownership of transport, clock and sleeper.
        SdsContext(const Config& config, HttpTransport* transport, 
                Clock* clock, Sleeper* sleeper);
        
        virtual ~SdsContext();
        
        const Config& config() const;
        
        HttpTransport& transport();
        
        const Clock& clock() const;
        
        Sleeper& sleeper();
        
        // {baseUrl}{path}
        std::string url(const std::string& path) const;
        
        // {baseUrl}api/v4/{path}
        std::string apiUrl(const std::string& path) const;
        
        SystemInfo& systemInfo();
        
    private:
        Config mConfig;
        std::unique_ptr<HttpTransport> mpTransport;
        std::unique_ptr<Clock> mpClock;
        std::unique_ptr<Sleeper> mpSleeper;
        SystemInfo mSystemInfo;
        
        SdsContext(const SdsContext& orig);
        SdsContext& operator=(const SdsContext& orig);
    };

}

#endif	/* SDSCONTEXT_HPP */
