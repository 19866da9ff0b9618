/* 
 * File:   ChunkPlan.hpp
 * Author: me
 *
 * Created on March 13, 2024, 9:05 AM
 */

#ifndef CHUNKPLAN_HPP
#define	CHUNKPLAN_HPP

#include <stdint.h>

namespace sdsclient
{
    /*
     * How a transfer of a given size is cut into parts. Every part but the
     * last is chunkSize bytes long. An empty transfer still has one (empty)
     * part, and a size that is an exact multiple of chunkSize never gets a 
     * trailing empty part.
     */
    class ChunkPlan {
    public:
        // chunkSize must be greater than 0
        static ChunkPlan calculate(uint64_t totalSize, uint64_t chunkSize);
        
        uint64_t getPartCount() const;
        
        uint64_t getLastPartSize() const;
        
        uint64_t getChunkSize() const;
        
        uint64_t getTotalSize() const;
        
        // Parts are numbered from 1
        uint64_t partSize(uint64_t partNumber) const;
        
        uint64_t partOffset(uint64_t partNumber) const;
        
    private:
        uint64_t mPartCount;
        uint64_t mLastPartSize;
        uint64_t mChunkSize;
        uint64_t mTotalSize;
        
        ChunkPlan(uint64_t partCount, uint64_t lastPartSize, 
                uint64_t chunkSize, uint64_t totalSize);
    };

}

#endif	/* CHUNKPLAN_HPP */
