/* 
 * File:   ChunkedUploader.hpp
 * Author: me
 *
 * Created on March 14, 2024, 9:30 AM
 */

#ifndef CHUNKEDUPLOADER_HPP
#define	CHUNKEDUPLOADER_HPP

#include "Node.hpp"
#include "UploadTarget.hpp"

#include <stdint.h>
#include <istream>
#include <string>
#include <vector>

namespace sdsclient
{
    class SdsContext;
    class UploadDescriptor;
    class ChunkPlan;
    class PlainFileKey;
    
    // Called after every chunk with the bytes processed so far
    typedef void (*ProgressCallback)
    (uint64_t bytesSoFar, uint64_t totalBytes, void* userdata);
    
    /*
     * Uploads a stream in chunks. The backend decides between presigned 
     * multipart uploads straight to object storage and chunk uploads through
     * the API (proxy). The target decides whether the content is encrypted
     * first. Encrypted content is read and encrypted as a whole before the 
     * first chunk is sent.
     */
    class ChunkedUploader {
    public:
        ChunkedUploader(SdsContext& ctx, UploadTarget& target);
        
        virtual ~ChunkedUploader();
        
        ChunkedUploader& setProgressCallback(ProgressCallback callback, 
                void* userdata);
        
        // 0 selects the configured chunk size
        ChunkedUploader& setChunkSize(uint64_t chunkSize);
        
        /*
         * upload():    Reads descriptor.getSize() bytes from source and 
         *              uploads them. Returns the created node.
         * Throws:
         *      IoError if source can't supply the declared size, HttpError,
         *      ConnectionError, CryptoError.
         */
        Node upload(const UploadDescriptor& descriptor, std::istream& source);
        
    private:
        SdsContext& mCtx;
        UploadTarget& mTarget;
        ProgressCallback mCallback;
        void* mCallbackUserdata;
        uint64_t mChunkSize;
        
        /*
         * Supplies the bytes of consecutive chunks, either straight from the
         * caller's stream or from an in-memory buffer.
         */
        class ChunkSource {
        public:
            explicit ChunkSource(std::istream& stream);
            
            explicit ChunkSource(const std::string& buffer);
            
            // Replaces out with the next size bytes
            void next(uint64_t size, std::string& out);
            
        private:
            std::istream* mpStream;
            const std::string* mpBuffer;
            uint64_t mOffset;
        };
        
        Node uploadToS3(const UploadDescriptor& descriptor, 
                ChunkSource& source, const PlainFileKey* key);
        
        Node uploadToNfs(const UploadDescriptor& descriptor, 
                ChunkSource& source, const PlainFileKey* key);
        
        UploadedPart uploadPart(const UploadChannel& channel, 
                int partNumber, const std::string& chunk);
        
        void uploadProxyChunk(const UploadChannel& channel, uint64_t offset,
                uint64_t totalSize, const std::string& chunk);
        
        void reportProgress(uint64_t soFar, uint64_t total);
        
        uint64_t effectiveChunkSize() const;
        
        ChunkedUploader(const ChunkedUploader& orig);
    };

}

#endif	/* CHUNKEDUPLOADER_HPP */
