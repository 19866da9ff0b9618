/* 
 * File:   UploadWatcher.hpp
 * Author: me
 *
 * Created on March 13, 2024, 3:20 PM
 */

#ifndef UPLOADWATCHER_HPP
#define	UPLOADWATCHER_HPP

#include "SdsEnums.hpp"
#include "Node.hpp"

#include <string>

namespace sdsclient
{
    class SdsContext;
    class UploadTarget;
    class UploadChannel;
    class Json;
    
    /*
     * Polls the status of a finalized object storage upload until the 
     * server has assembled the file. The delay between polls starts at 
     * INITIAL_DELAY and doubles every time. There is no limit on the number
     * of polls; wrap the call in a timeout if a bound is needed.
     */
    class UploadWatcher {
    public:
        static const long INITIAL_DELAY;
        
        UploadWatcher(SdsContext& ctx, UploadTarget& target);
        
        virtual ~UploadWatcher();
        
        static Upload_State parseState(const std::string& status);
        
        /*
         * waitForCompletion(): Returns the created node once the status is
         *                      "done". Throws HttpError with the reported 
         *                      error details if the status is "error".
         */
        Node waitForCompletion(const UploadChannel& channel);
        
        int getPollCount() const;
        
    private:
        SdsContext& mCtx;
        UploadTarget& mTarget;
        int mPollCount;
        
        Json fetchStatus(const UploadChannel& channel);
        
        UploadWatcher(const UploadWatcher& orig);
    };

}

#endif	/* UPLOADWATCHER_HPP */
