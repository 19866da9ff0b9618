/* 
 * File:   Downloader.cpp
 * Author: me
 * 
 * Created on March 18, 2024, 9:45 AM
 */

#include "Downloader.hpp"
#include "FileCipher.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Errors.hpp"
#include "Util.hpp"
#include "Log.hpp"

#include <memory>
#include <sstream>

using namespace std;

namespace sdsclient
{
    DownloadSource::~DownloadSource()
    {
        // Empty
    }
    
    Downloader::Downloader(SdsContext& ctx, DownloadSource& source)
    : mCtx(ctx), mSource(source), mCallback(NULL), mCallbackUserdata(NULL), 
            mChunkSize(0)
    {
        // No body
    }

    Downloader::~Downloader()
    {
        // Empty
    }
    
    Downloader& Downloader::setProgressCallback(ProgressCallback callback, 
            void* userdata)
    {
        mCallback = callback;
        mCallbackUserdata = userdata;
        return *this;
    }
    
    Downloader& Downloader::setChunkSize(uint64_t chunkSize)
    {
        mChunkSize = chunkSize;
        return *this;
    }
    
    void Downloader::download(ostream& writer)
    {
        bool encrypted = mSource.isEncrypted();
        
        // Unwrap the key before any content is fetched
        PlainFileKey plainKey;
        if (encrypted)
        {
            plainKey = mSource.fileKey();
        }
        
        string url = mSource.requestDownloadUrl();
        uint64_t total = 0;
        if (!mSource.knownSize(total))
        {
            total = discoverSize(url);
        }
        SDS_LOG_DEBUG << "Downloading " << total << " bytes" 
                << (encrypted ? " (encrypted)" : "");
        
        unique_ptr<FileDecrypter> pDecrypter;
        if (encrypted)
        {
            pDecrypter.reset(new FileDecrypter(plainKey, total));
        }
        
        SinkState state;
        state.pWriter = encrypted ? NULL : &writer;
        state.pDecrypter = pDecrypter.get();
        state.callback = mCallback;
        state.callbackUserdata = mCallbackUserdata;
        state.soFar = 0;
        state.total = total;
        
        uint64_t chunkSize = effectiveChunkSize();
        while (state.soFar < total)
        {
            if (state.soFar > 0)
            {
                url = mSource.requestDownloadUrl();
            }
            uint64_t start = state.soFar;
            uint64_t end = (total - 1 < start + chunkSize - 1) ? 
                total - 1 : start + chunkSize - 1;
            fetchRange(url, start, end, state);
        }
        
        if (encrypted)
        {
            const string& plaintext = pDecrypter->finalize();
            writer.write(plaintext.data(), plaintext.size());
        }
        writer.flush();
        if (!writer)
        {
            throw IoError("writing the download failed");
        }
    }
    
    uint64_t Downloader::discoverSize(const string& url)
    {
        HttpTransfer head(mCtx);
        head.setRequestType(HEAD)
            .setUrl(url)
            .execute();
        if (head.isSuccess())
        {
            string contentLength = head.getHeader("Content-Length");
            size_t index = 0;
            uint64_t size = Util::strtoull(contentLength, index);
            if (!contentLength.empty() && index == string::npos)
            {
                return size;
            }
        }
        
        // Some storages refuse HEAD on URLs signed for GET
        HttpTransfer rangeXfer(mCtx);
        rangeXfer.setRequestType(GET)
            .setUrl(url)
            .addHeader("Range: bytes=0-0")
            .execute();
        rangeXfer.throwIfFailed(true);
        
        uint64_t total = 0;
        if (!Util::parseContentRangeTotal(rangeXfer.getHeader("Content-Range"), 
                total))
        {
            throw HttpError(ErrorResponse(rangeXfer.getHttpResponse(), 
                    "could not determine the download size", 
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return total;
    }
    
    void Downloader::fetchRange(const string& url, uint64_t start, 
            uint64_t end, SinkState& state)
    {
        stringstream range;
        range << "Range: bytes=" << start << "-" << end;
        
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(url)
            .addHeader(range.str())
            .setSink(sinkCallback, &state);
        try
        {
            xfer.execute();
        }
        catch (const IoError&)
        {
            if (state.cryptoError)
            {
                rethrow_exception(state.cryptoError);
            }
            throw;
        }
        xfer.throwIfFailed(true);
        
        if (xfer.getBytesToSink() == 0)
        {
            stringstream ss;
            ss << "storage returned no data for bytes " << start << "-" << end;
            throw IoError(ss.str());
        }
        SDS_LOG_TRACE << "Received " << xfer.getBytesToSink() 
                << " bytes at offset " << start;
    }
    
    size_t Downloader::sinkCallback(const char* data, size_t size, 
            void* userdata)
    {
        SinkState* pState = (SinkState*) userdata;
        
        if (pState->pDecrypter != NULL)
        {
            try
            {
                pState->pDecrypter->update(data, size);
            }
            catch (const CryptoError&)
            {
                // Returning less than size aborts the transfer
                pState->cryptoError = current_exception();
                return 0;
            }
        }
        else
        {
            pState->pWriter->write(data, size);
            if (!*pState->pWriter)
            {
                return 0;
            }
        }
        
        pState->soFar += size;
        if (pState->callback != NULL)
        {
            pState->callback(pState->soFar, pState->total, 
                    pState->callbackUserdata);
        }
        return size;
    }
    
    uint64_t Downloader::effectiveChunkSize() const
    {
        return (mChunkSize > 0) ? mChunkSize : mCtx.config().chunkSize();
    }

}
