/*
 * File:   PublicShares.cpp
 * Author: me
 *
 * Created on March 19, 2024, 10:05 AM
 */

#include "PublicShares.hpp"
#include "UploadDescriptor.hpp"
#include "SdsContext.hpp"
#include "HttpTransfer.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Log.hpp"

using namespace std;

namespace sdsclient
{
    const string ShareUploadTarget::URL_SHARE_UPLOADS =
            "public/shares/uploads";
    const string ShareDownloadSource::URL_SHARE_DOWNLOADS =
            "public/shares/downloads";

    /**************************
    * ShareUploadTarget
    **************************/

    ShareUploadTarget::ShareUploadTarget(SdsContext& ctx,
            const string& accessKey, const Secret& password)
    : mCtx(ctx), mAccessKey(accessKey), mPassword(password),
            mInfoLoaded(false), mEncrypted(false)
    {
        if (accessKey.empty())
        {
            throw MissingArgument("accessKey");
        }
    }

    ShareUploadTarget::~ShareUploadTarget()
    {
        // Empty
    }

    bool ShareUploadTarget::isEncrypted()
    {
        loadInfo();
        return mEncrypted;
    }

    UploadChannel ShareUploadTarget::openChannel(
            const UploadDescriptor& descriptor, bool directS3Upload)
    {
        Json body;
        descriptor.addChannelFields(body);
        body.addBoolean("directS3Upload", directS3Upload);
        if (!mPassword.empty())
        {
            body.addString("password", mPassword.expose());
        }

        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(shareUrl())
            .setJsonBody(body)
            .execute();
        xfer.throwIfFailed();

        Json jsonObj(xfer.getData());
        UploadChannel channel;
        channel.uploadId = jsonObj.getString("uploadId");
        channel.uploadUrl = jsonObj.getString("uploadUrl");
        channel.token = jsonObj.getString("token");
        if (channel.uploadId.empty())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(),
                    "upload channel without uploadId",
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return channel;
    }

    vector<PresignedUrl> ShareUploadTarget::presign(
            const UploadChannel& channel, uint64_t size, int firstPartNumber,
            int lastPartNumber)
    {
        Json body;
        body.addInt64("size", (int64_t) size)
            .addInt64("firstPartNumber", firstPartNumber)
            .addInt64("lastPartNumber", lastPartNumber);

        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(shareUrl("/" + channel.uploadId + "/s3_urls"))
            .setJsonBody(body)
            .execute();
        xfer.throwIfFailed();

        Json jsonObj(xfer.getData());
        vector<PresignedUrl> urls;
        int count = jsonObj.getArrayLength("urls");
        for (int i = 0; i < count; i++)
        {
            Json urlObj = jsonObj.arrayGet("urls", i);
            PresignedUrl url;
            url.url = urlObj.getString("url");
            url.partNumber = (int) urlObj.getInt64("partNumber", (int64_t) 0);
            urls.push_back(url);
        }
        return urls;
    }

    void ShareUploadTarget::finalizeS3(const UploadChannel& channel,
            const UploadDescriptor& descriptor,
            const vector<UploadedPart>& parts, const PlainFileKey* key)
    {
        Json partsArray = Json::newArray();
        for (size_t i = 0; i < parts.size(); i++)
        {
            Json part;
            part.addInt64("partNumber", parts[i].partNumber)
                .addString("partEtag", parts[i].partEtag);
            partsArray.arrayAppend(part);
        }

        Json body;
        body.addObject("parts", partsArray);
        if (key != NULL)
        {
            body.addObject("userFileKeyList", wrapForRecipients(*key));
        }

        HttpTransfer xfer(mCtx);
        xfer.setRequestType(PUT)
            .setUrl(shareUrl("/" + channel.uploadId + "/s3"))
            .setJsonBody(body)
            .execute();
        xfer.throwIfFailed();
    }

    Node ShareUploadTarget::finalizeNfs(const UploadChannel& channel,
            const UploadDescriptor& descriptor, const PlainFileKey* key)
    {
        Json body;
        if (key != NULL)
        {
            body.addObject("items", wrapForRecipients(*key));
        }
        else
        {
            body.addObject("items", Json::newArray());
        }

        HttpTransfer xfer(mCtx);
        xfer.setRequestType(PUT)
            .setUrl(shareUrl("/" + channel.uploadId))
            .setJsonBody(body)
            .execute();
        xfer.throwIfFailed();

        // The response names the stored file, which may have been renamed
        Json jsonObj(xfer.getData());
        string fileName = jsonObj.getString("name");
        Node node;
        node.setName(fileName.empty() ? descriptor.getName() : fileName)
            .setType(NODE_FILE)
            .setSize(descriptor.getSize())
            .setEncrypted(key != NULL);
        return node;
    }

    string ShareUploadTarget::statusUrl(const UploadChannel& channel)
    {
        return shareUrl("/" + channel.uploadId);
    }

    void ShareUploadTarget::authorize(HttpTransfer& xfer)
    {
        // Anonymous
    }

    Node ShareUploadTarget::resultFromStatus(const Json& status)
    {
        Node node;
        node.setName(status.getString("fileName"))
            .setType(NODE_FILE)
            .setEncrypted(mEncrypted);
        return node;
    }

    void ShareUploadTarget::afterCompletion(const Node& node,
            const PlainFileKey& key)
    {
        // Every recipient got the key with the finalize call
    }

    const vector<ShareRecipient>& ShareUploadTarget::getRecipients()
    {
        loadInfo();
        return mRecipients;
    }

    vector<ShareRecipient> ShareUploadTarget::parseRecipients(
            const Json& info)
    {
        vector<ShareRecipient> recipients;
        int count = info.getArrayLength("userUserPublicKeyList/items");
        for (int i = 0; i < count; i++)
        {
            Json item = info.arrayGet("userUserPublicKeyList/items", i);
            ShareRecipient recipient;
            recipient.userId = (uint64_t) item.getInt64("id", (int64_t) 0);
            recipient.version = item.getString("publicKeyContainer/version");
            recipient.publicKey =
                    item.getString("publicKeyContainer/publicKey");
            recipients.push_back(recipient);
        }
        return recipients;
    }

    void ShareUploadTarget::loadInfo()
    {
        if (mInfoLoaded)
        {
            return;
        }

        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(shareUrl())
            .execute();
        xfer.throwIfFailed();

        Json info(xfer.getData());
        mEncrypted = info.getBoolean("isEncrypted", false);
        mRecipients = parseRecipients(info);
        mInfoLoaded = true;

        SDS_LOG_DEBUG << "Upload share is "
                << (mEncrypted ? "encrypted" : "unencrypted") << " with "
                << mRecipients.size() << " recipient key(s)";
    }

    string ShareUploadTarget::shareUrl(const string& suffix) const
    {
        return mCtx.apiUrl(URL_SHARE_UPLOADS + "/" + mAccessKey + suffix);
    }

    Json ShareUploadTarget::wrapForRecipients(const PlainFileKey& key)
    {
        const vector<ShareRecipient>& recipients = getRecipients();
        if (recipients.empty())
        {
            throw CryptoError("encrypted share lists no public keys");
        }

        Json items = Json::newArray();
        for (size_t i = 0; i < recipients.size(); i++)
        {
            FileKey wrapped = Crypto::encryptFileKey(key,
                    recipients[i].publicKey, recipients[i].version);
            Json item;
            item.addInt64("userId", (int64_t) recipients[i].userId)
                .addObject("fileKey", wrapped.toJson());
            items.arrayAppend(item);
        }
        return items;
    }

    /**************************
    * ShareDownloadSource
    **************************/

    ShareDownloadSource::ShareDownloadSource(SdsContext& ctx,
            const string& accessKey, const Secret& password)
    : mCtx(ctx), mAccessKey(accessKey), mPassword(password),
            mProtected(false), mEncrypted(false), mHasSize(false), mSize(0)
    {
        if (accessKey.empty())
        {
            throw MissingArgument("accessKey");
        }

        HttpTransfer xfer(mCtx);
        xfer.setRequestType(GET)
            .setUrl(shareUrl())
            .execute();
        xfer.throwIfFailed();

        Json info(xfer.getData());
        mProtected = info.getBoolean("isProtected", false);
        mEncrypted = info.getBoolean("isEncrypted", false);
        mFileName = info.getString("fileName");
        bool success = false;
        int64_t size = info.getInt64("size", success);
        if (success && size >= 0)
        {
            mHasSize = true;
            mSize = (uint64_t) size;
        }

        if ((mProtected || mEncrypted) && mPassword.empty())
        {
            throw MissingArgument("password");
        }

        if (mEncrypted)
        {
            mFileKey = FileKey::fromJson(info.getNestedObject("fileKey"));
            mKeyPair.version = info.getString("privateKeyContainer/version");
            mKeyPair.encryptedPrivateKey =
                    info.getString("privateKeyContainer/privateKey");
            if (mKeyPair.encryptedPrivateKey.empty())
            {
                throw CryptoError("encrypted share without private key");
            }
        }
    }

    ShareDownloadSource::~ShareDownloadSource()
    {
        // Empty
    }

    string ShareDownloadSource::requestDownloadUrl()
    {
        HttpTransfer xfer(mCtx);
        xfer.setRequestType(POST)
            .setUrl(shareUrl());
        if (mProtected)
        {
            Json body;
            body.addString("password", mPassword.expose());
            xfer.setJsonBody(body);
        }
        xfer.execute();
        xfer.throwIfFailed();

        string url = Json(xfer.getData()).getString("downloadUrl");
        if (url.empty())
        {
            throw HttpError(ErrorResponse(xfer.getHttpResponse(),
                    "no downloadUrl in response",
                    ErrorResponse::FALLBACK_DEBUG_INFO));
        }
        return url;
    }

    bool ShareDownloadSource::knownSize(uint64_t& size)
    {
        if (!mHasSize)
        {
            return false;
        }
        size = mSize;
        return true;
    }

    bool ShareDownloadSource::isEncrypted()
    {
        return mEncrypted;
    }

    PlainFileKey ShareDownloadSource::fileKey()
    {
        // The share password also locks the share's private key
        PlainUserKeyPair keyPair =
                Crypto::decryptPrivateKey(mKeyPair, mPassword);
        return Crypto::decryptFileKey(mFileKey, keyPair);
    }

    const string& ShareDownloadSource::getFileName() const
    {
        return mFileName;
    }

    bool ShareDownloadSource::isProtected() const
    {
        return mProtected;
    }

    string ShareDownloadSource::shareUrl() const
    {
        return mCtx.apiUrl(URL_SHARE_DOWNLOADS + "/" + mAccessKey);
    }

    /**************************
    * PublicShares
    **************************/

    PublicShares::PublicShares(shared_ptr<SdsContext> ctx)
    : mCtx(ctx)
    {
        // No body
    }

    PublicShares::~PublicShares()
    {
        // Empty
    }

    Node PublicShares::uploadToShare(const string& accessKey,
            const UploadDescriptor& descriptor, istream& source,
            ProgressCallback callback, void* userdata, uint64_t chunkSize,
            const Secret& password)
    {
        ShareUploadTarget target(*mCtx, accessKey, password);
        ChunkedUploader uploader(*mCtx, target);
        uploader.setProgressCallback(callback, userdata)
            .setChunkSize(chunkSize);
        return uploader.upload(descriptor, source);
    }

    string PublicShares::downloadFromShare(const string& accessKey,
            ostream& writer, const Secret& password,
            ProgressCallback callback, void* userdata, uint64_t chunkSize)
    {
        ShareDownloadSource source(*mCtx, accessKey, password);
        Downloader downloader(*mCtx, source);
        downloader.setProgressCallback(callback, userdata)
            .setChunkSize(chunkSize);
        downloader.download(writer);
        return source.getFileName();
    }

}
