/*
 * File:   PublicShares.hpp
 * Author: me
 *
 * Created on March 19, 2024, 10:05 AM
 */

#ifndef PUBLICSHARES_HPP
#define	PUBLICSHARES_HPP

#include "UploadTarget.hpp"
#include "Downloader.hpp"
#include "ChunkedUploader.hpp"
#include "Crypto.hpp"
#include "Secret.hpp"
#include "Node.hpp"

#include <stdint.h>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace sdsclient
{
    class SdsContext;
    class UploadDescriptor;

    // A public key of a user allowed to read files dropped into a share
    class ShareRecipient {
    public:
        uint64_t userId;
        std::string version;
        std::string publicKey;
    };

    /*
     * Upload into a public upload share. Anonymous: no authorization header
     * on any call. The content key is wrapped for every recipient the share
     * lists, so nothing is left to distribute afterwards.
     */
    class ShareUploadTarget : public UploadTarget {
    public:
        static const std::string URL_SHARE_UPLOADS;

        ShareUploadTarget(SdsContext& ctx, const std::string& accessKey,
                const Secret& password=Secret());

        virtual ~ShareUploadTarget();

        // Fetches the share info on first use
        virtual bool isEncrypted();

        virtual UploadChannel openChannel(const UploadDescriptor& descriptor,
                bool directS3Upload);

        virtual std::vector<PresignedUrl> presign(const UploadChannel& channel,
                uint64_t size, int firstPartNumber, int lastPartNumber);

        virtual void finalizeS3(const UploadChannel& channel,
                const UploadDescriptor& descriptor,
                const std::vector<UploadedPart>& parts,
                const PlainFileKey* key);

        virtual Node finalizeNfs(const UploadChannel& channel,
                const UploadDescriptor& descriptor, const PlainFileKey* key);

        virtual std::string statusUrl(const UploadChannel& channel);

        virtual void authorize(HttpTransfer& xfer);

        // Only the file name is known; the id is 0
        virtual Node resultFromStatus(const Json& status);

        virtual void afterCompletion(const Node& node,
                const PlainFileKey& key);

        const std::vector<ShareRecipient>& getRecipients();

        // Parses userUserPublicKeyList{items: [{id, publicKeyContainer}]}
        static std::vector<ShareRecipient> parseRecipients(const Json& info);

    private:
        SdsContext& mCtx;
        std::string mAccessKey;
        Secret mPassword;
        bool mInfoLoaded;
        bool mEncrypted;
        std::vector<ShareRecipient> mRecipients;

        void loadInfo();

        std::string shareUrl(const std::string& suffix="") const;

        // [{userId, fileKey}] for every recipient
        Json wrapForRecipients(const PlainFileKey& key);

        ShareUploadTarget(const ShareUploadTarget& orig);
    };

    /*
     * The file behind a public download share. A protected share needs the
     * password to get a download URL; an encrypted share needs it to unlock
     * the private key the share carries.
     */
    class ShareDownloadSource : public DownloadSource {
    public:
        static const std::string URL_SHARE_DOWNLOADS;

        /*
         * Fetches the share info. Throws MissingArgument("password") if the
         * share is protected or encrypted and password is empty.
         */
        ShareDownloadSource(SdsContext& ctx, const std::string& accessKey,
                const Secret& password);

        virtual ~ShareDownloadSource();

        virtual std::string requestDownloadUrl();

        virtual bool knownSize(uint64_t& size);

        virtual bool isEncrypted();

        virtual PlainFileKey fileKey();

        const std::string& getFileName() const;

        bool isProtected() const;

    private:
        SdsContext& mCtx;
        std::string mAccessKey;
        Secret mPassword;
        bool mProtected;
        bool mEncrypted;
        std::string mFileName;
        bool mHasSize;
        uint64_t mSize;
        FileKey mFileKey;
        UserKeyPair mKeyPair;

        std::string shareUrl() const;

        ShareDownloadSource(const ShareDownloadSource& orig);
    };

    /*
     * Transfers through public share links. Available on every session
     * state since none of it needs a signed-in user.
     */
    class PublicShares {
    public:
        explicit PublicShares(std::shared_ptr<SdsContext> ctx);

        virtual ~PublicShares();

        /*
         * uploadToShare(): Uploads source into the upload share with the
         *                  given access key. chunkSize 0 selects the
         *                  configured size. Returns a node carrying only
         *                  the stored file name.
         */
        Node uploadToShare(const std::string& accessKey,
                const UploadDescriptor& descriptor, std::istream& source,
                ProgressCallback callback=NULL, void* userdata=NULL,
                uint64_t chunkSize=0, const Secret& password=Secret());

        // Returns the name of the downloaded file
        std::string downloadFromShare(const std::string& accessKey,
                std::ostream& writer, const Secret& password=Secret(),
                ProgressCallback callback=NULL, void* userdata=NULL,
                uint64_t chunkSize=0);

    private:
        std::shared_ptr<SdsContext> mCtx;
    };

}

#endif	/* PUBLICSHARES_HPP */
