/* 
 * File:   Timing.hpp
 * Author: me
 *
 * Created on March 5, 2024, 7:48 PM
 */

#ifndef TIMING_HPP
#define	TIMING_HPP

#include <time.h>

namespace sdsclient
{
    // Source of the current time for token expiry decisions
    class Clock {
    public:
        virtual ~Clock();
        
        // Seconds since the epoch
        virtual time_t now() const;
    };
    
    // Blocks the calling thread for backoff and polling waits
    class Sleeper {
    public:
        virtual ~Sleeper();
        
        virtual void sleepMs(long milliseconds);
    };

}

#endif	/* TIMING_HPP */
