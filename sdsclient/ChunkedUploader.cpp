/* 
 * File:   ChunkedUploader.cpp
 * Author: me
 * 
 * Created on March 14, 2024, 9:30 AM
 */

#include "ChunkedUploader.hpp"
#include "UploadDescriptor.hpp"
#include "UploadWatcher.hpp"
#include "ChunkPlan.hpp"
#include "FileCipher.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Errors.hpp"
#include "Util.hpp"
#include "Log.hpp"

#include <sstream>

#include <openssl/crypto.h>

using namespace std;

namespace sdsclient
{
    namespace
    {
        void wipe(string& buffer)
        {
            if (!buffer.empty())
            {
                OPENSSL_cleanse(&buffer[0], buffer.size());
            }
            buffer.clear();
        }
    }
    
    /**************************
    * ChunkSource
    **************************/
    
    ChunkedUploader::ChunkSource::ChunkSource(istream& stream)
    : mpStream(&stream), mpBuffer(NULL), mOffset(0)
    {
        // No body
    }
    
    ChunkedUploader::ChunkSource::ChunkSource(const string& buffer)
    : mpStream(NULL), mpBuffer(&buffer), mOffset(0)
    {
        // No body
    }
    
    void ChunkedUploader::ChunkSource::next(uint64_t size, string& out)
    {
        if (mpBuffer != NULL)
        {
            if (mOffset + size > mpBuffer->size())
            {
                throw IoError("buffer holds fewer bytes than planned");
            }
            out.assign(*mpBuffer, mOffset, size);
            mOffset += size;
            return;
        }
        
        out.resize(size);
        if (size > 0)
        {
            mpStream->read(&out[0], size);
            if ((uint64_t) mpStream->gcount() != size)
            {
                stringstream ss;
                ss << "source ended after " << (mOffset + mpStream->gcount()) 
                        << " bytes";
                throw IoError(ss.str());
            }
        }
        mOffset += size;
    }
    
    /**************************
    * ChunkedUploader
    **************************/
    
    ChunkedUploader::ChunkedUploader(SdsContext& ctx, UploadTarget& target)
    : mCtx(ctx), mTarget(target), mCallback(NULL), mCallbackUserdata(NULL), 
            mChunkSize(0)
    {
        // No body
    }

    ChunkedUploader::~ChunkedUploader()
    {
        // Empty
    }
    
    ChunkedUploader& ChunkedUploader::setProgressCallback(
            ProgressCallback callback, void* userdata)
    {
        mCallback = callback;
        mCallbackUserdata = userdata;
        return *this;
    }
    
    ChunkedUploader& ChunkedUploader::setChunkSize(uint64_t chunkSize)
    {
        mChunkSize = chunkSize;
        return *this;
    }
    
    Node ChunkedUploader::upload(const UploadDescriptor& descriptor, 
            istream& source)
    {
        bool useS3 = mCtx.systemInfo().useS3Storage();
        bool encrypted = mTarget.isEncrypted();
        SDS_LOG_INFO << "Uploading " << descriptor.getName() << " (" 
                << descriptor.getSize() << " bytes, " 
                << (encrypted ? "encrypted" : "unencrypted") << ", " 
                << (useS3 ? "object storage" : "proxy") << ")";
        
        if (!encrypted)
        {
            ChunkSource chunks(source);
            return useS3 ? 
                uploadToS3(descriptor, chunks, NULL) :
                uploadToNfs(descriptor, chunks, NULL);
        }
        
        // Encrypt the whole content up front
        string plaintext;
        ChunkSource(source).next(descriptor.getSize(), plaintext);
        
        FileEncrypter encrypter;
        string ciphertext;
        ciphertext.reserve(plaintext.size());
        try
        {
            encrypter.update(plaintext.data(), plaintext.size(), ciphertext);
            encrypter.finalize(ciphertext);
        }
        catch (...)
        {
            wipe(plaintext);
            throw;
        }
        wipe(plaintext);
        
        ChunkSource chunks(ciphertext);
        const PlainFileKey& key = encrypter.fileKey();
        Node node = useS3 ? 
            uploadToS3(descriptor, chunks, &key) :
            uploadToNfs(descriptor, chunks, &key);
        
        mTarget.afterCompletion(node, key);
        return node;
    }
    
    Node ChunkedUploader::uploadToS3(const UploadDescriptor& descriptor, 
            ChunkSource& source, const PlainFileKey* key)
    {
        UploadChannel channel = mTarget.openChannel(descriptor, true);
        SDS_LOG_DEBUG << "Opened upload channel " << channel.uploadId;
        
        ChunkPlan plan = ChunkPlan::calculate(descriptor.getSize(), 
                effectiveChunkSize());
        
        vector<UploadedPart> parts;
        string chunk;
        uint64_t soFar = 0;
        for (uint64_t partNumber = 1; partNumber <= plan.getPartCount(); 
                partNumber++)
        {
            source.next(plan.partSize(partNumber), chunk);
            parts.push_back(uploadPart(channel, (int) partNumber, chunk));
            soFar += chunk.size();
            reportProgress(soFar, descriptor.getSize());
        }
        
        SDS_LOG_DEBUG << "Finalizing upload " << channel.uploadId << " with "
                << parts.size() << " part(s)";
        mTarget.finalizeS3(channel, descriptor, parts, key);
        
        UploadWatcher watcher(mCtx, mTarget);
        return watcher.waitForCompletion(channel);
    }
    
    Node ChunkedUploader::uploadToNfs(const UploadDescriptor& descriptor, 
            ChunkSource& source, const PlainFileKey* key)
    {
        UploadChannel channel = mTarget.openChannel(descriptor, false);
        SDS_LOG_DEBUG << "Opened upload channel " << channel.uploadId;
        
        ChunkPlan plan = ChunkPlan::calculate(descriptor.getSize(), 
                effectiveChunkSize());
        
        string chunk;
        for (uint64_t partNumber = 1; partNumber <= plan.getPartCount(); 
                partNumber++)
        {
            source.next(plan.partSize(partNumber), chunk);
            uint64_t offset = plan.partOffset(partNumber);
            uploadProxyChunk(channel, offset, descriptor.getSize(), chunk);
            reportProgress(offset + chunk.size(), descriptor.getSize());
        }
        
        SDS_LOG_DEBUG << "Finalizing upload " << channel.uploadId;
        Node node = mTarget.finalizeNfs(channel, descriptor, key);
        SDS_LOG_INFO << "Upload " << channel.uploadId << " done";
        return node;
    }
    
    UploadedPart ChunkedUploader::uploadPart(const UploadChannel& channel, 
            int partNumber, const string& chunk)
    {
        vector<PresignedUrl> urls = mTarget.presign(channel, chunk.size(), 
                partNumber, partNumber);
        if (urls.empty())
        {
            throw HttpError(ErrorResponse(500, 
                    "no presigned URL for part " + 
                    Util::toString((uint64_t) partNumber), 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        
        // Presigned URLs carry their own authorization
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(PUT)
            .setUrl(urls[0].url)
            .setBody(chunk, "")
            .execute();
        xfer.throwIfFailed(true);
        
        UploadedPart part;
        part.partNumber = partNumber;
        part.partEtag = Util::stripQuotes(xfer.getHeader("ETag"));
        if (part.partEtag.empty())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(), 
                    "storage response without ETag", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        SDS_LOG_DEBUG << "Uploaded part " << partNumber << " (" 
                << chunk.size() << " bytes)";
        return part;
    }
    
    void ChunkedUploader::uploadProxyChunk(const UploadChannel& channel, 
            uint64_t offset, uint64_t totalSize, const string& chunk)
    {
        // End is inclusive. An empty upload still sends bytes 0-0/0.
        uint64_t end = chunk.empty() ? offset : offset + chunk.size() - 1;
        stringstream range;
        range << "Content-Range: bytes " << offset << "-" << end << "/" 
                << totalSize;
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(channel.uploadUrl)
            .setBody(chunk, "application/octet-stream")
            .addHeader(range.str())
            .execute();
        xfer.throwIfFailed();
        SDS_LOG_DEBUG << "Uploaded chunk at " << offset << " (" 
                << chunk.size() << " bytes)";
    }
    
    void ChunkedUploader::reportProgress(uint64_t soFar, uint64_t total)
    {
        if (mCallback != NULL)
        {
            mCallback(soFar, total, mCallbackUserdata);
        }
    }
    
    uint64_t ChunkedUploader::effectiveChunkSize() const
    {
        return (mChunkSize > 0) ? mChunkSize : mCtx.config().chunkSize();
    }

}
