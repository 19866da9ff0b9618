/* 
 * File:   Timing.cpp
 * Author: me
 * 
 * Created on March 5, 2024, 7:48 PM
 */

#include "Timing.hpp"

#include <errno.h>

namespace sdsclient
{
    Clock::~Clock()
    {
        // Empty
    }
    
    time_t Clock::now() const
    {
        return time(NULL);
    }
    
    Sleeper::~Sleeper()
    {
        // Empty
    }
    
    void Sleeper::sleepMs(long milliseconds)
    {
        if (milliseconds <= 0)
        {
            return;
        }
        struct timespec waitTime;
        // Intentional integer division:
        waitTime.tv_sec = milliseconds / 1000;
        waitTime.tv_nsec = (milliseconds % 1000) * 1000000L;
        
        // Keep sleeping for the remainder if a signal interrupts us.
        struct timespec remaining;
        while (nanosleep(&waitTime, &remaining) != 0 && errno == EINTR)
        {
            waitTime = remaining;
        }
    }
}
