/* 
 * File:   ChunkPlan.cpp
 * Author: me
 * 
 * Created on March 13, 2024, 9:05 AM
 */

#include "ChunkPlan.hpp"
#include "Errors.hpp"
#include "Util.hpp"

namespace sdsclient
{
    ChunkPlan ChunkPlan::calculate(uint64_t totalSize, uint64_t chunkSize)
    {
        if (chunkSize == 0)
        {
            throw ConfigurationError("chunk size must be greater than 0");
        }
        if (totalSize == 0)
        {
            return ChunkPlan(1, 0, chunkSize, 0);
        }
        
        uint64_t remainder = totalSize % chunkSize;
        return ChunkPlan(Util::divideCeil(totalSize, chunkSize), 
                (remainder == 0) ? chunkSize : remainder, chunkSize, totalSize);
    }
    
    uint64_t ChunkPlan::getPartCount() const
    {
        return mPartCount;
    }
    
    uint64_t ChunkPlan::getLastPartSize() const
    {
        return mLastPartSize;
    }
    
    uint64_t ChunkPlan::getChunkSize() const
    {
        return mChunkSize;
    }
    
    uint64_t ChunkPlan::getTotalSize() const
    {
        return mTotalSize;
    }
    
    uint64_t ChunkPlan::partSize(uint64_t partNumber) const
    {
        return (partNumber < mPartCount) ? mChunkSize : mLastPartSize;
    }
    
    uint64_t ChunkPlan::partOffset(uint64_t partNumber) const
    {
        return (partNumber - 1) * mChunkSize;
    }
    
    ChunkPlan::ChunkPlan(uint64_t partCount, uint64_t lastPartSize, 
            uint64_t chunkSize, uint64_t totalSize)
    : mPartCount(partCount), mLastPartSize(lastPartSize), 
            mChunkSize(chunkSize), mTotalSize(totalSize)
    {
        // No body
    }

}
