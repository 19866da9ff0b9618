/* 
 * File:   Downloader.hpp
 * Author: me
 *
 * Created on March 18, 2024, 9:45 AM
 */

#ifndef DOWNLOADER_HPP
#define	DOWNLOADER_HPP

#include "ChunkedUploader.hpp"
#include "Crypto.hpp"

#include <stddef.h>
#include <stdint.h>
#include <exception>
#include <ostream>
#include <string>

namespace sdsclient
{
    class SdsContext;
    class FileDecrypter;
    
    /*
     * A file that can be downloaded: a node of the signed-in user or the 
     * file behind a public download share.
     */
    class DownloadSource {
    public:
        virtual ~DownloadSource();
        
        // A new short-lived URL on every call
        virtual std::string requestDownloadUrl() = 0;
        
        // Returns false if the size isn't known without asking the storage
        virtual bool knownSize(uint64_t& size) = 0;
        
        virtual bool isEncrypted() = 0;
        
        // Only called for encrypted sources
        virtual PlainFileKey fileKey() = 0;
        
    };
    
    /*
     * Downloads a file with sequential range requests of at most chunk size
     * bytes, each on a freshly requested URL after the first. Plain content
     * goes to the writer as it arrives. Encrypted content is collected and
     * decrypted, and only written once the authentication tag checks out.
     */
    class Downloader {
    public:
        Downloader(SdsContext& ctx, DownloadSource& source);
        
        virtual ~Downloader();
        
        Downloader& setProgressCallback(ProgressCallback callback, 
                void* userdata);
        
        // 0 selects the configured chunk size
        Downloader& setChunkSize(uint64_t chunkSize);
        
        /*
         * download(): Throws HttpError (parsed as a storage error) if any 
         *             range request fails, IoError if the writer fails or the
         *             storage delivers less than requested, CryptoError.
         */
        void download(std::ostream& writer);
        
        // HEAD for Content-Length, then a one byte range for Content-Range
        uint64_t discoverSize(const std::string& url);
        
    private:
        SdsContext& mCtx;
        DownloadSource& mSource;
        ProgressCallback mCallback;
        void* mCallbackUserdata;
        uint64_t mChunkSize;
        
        // Where the bytes of a range go
        class SinkState {
        public:
            std::ostream* pWriter;
            FileDecrypter* pDecrypter;
            ProgressCallback callback;
            void* callbackUserdata;
            uint64_t soFar;
            uint64_t total;
            std::exception_ptr cryptoError;
        };
        
        void fetchRange(const std::string& url, uint64_t start, uint64_t end,
                SinkState& state);
        
        static size_t sinkCallback(const char* data, size_t size, 
                void* userdata);
        
        uint64_t effectiveChunkSize() const;
        
        Downloader(const Downloader& orig);
    };

}

#endif	/* DOWNLOADER_HPP */
