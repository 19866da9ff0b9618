/*
 * File:   Downloader_test.cpp
 * Author: me
 *
 * Created on March 23, 2024, 10:05 AM
 */

#include "sdsclient/Downloader.hpp"
#include "sdsclient/FileCipher.hpp"
#include "sdsclient/Errors.hpp"
#include "sdsclient/Util.hpp"
#include "TestSupport.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace sdsclient;
using namespace sdsclient::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::DoAll;
using ::testing::SetArgReferee;

class MockDownloadSource : public DownloadSource {
public:
    MOCK_METHOD(std::string, requestDownloadUrl, (), (override));
    MOCK_METHOD(bool, knownSize, (uint64_t& size), (override));
    MOCK_METHOD(bool, isEncrypted, (), (override));
    MOCK_METHOD(PlainFileKey, fileKey, (), (override));
};

/*
 * Plays the object storage: answers "Range: bytes=s-e" with that slice of
 * the stored object.
 */
class RangeReply {
public:
    RangeReply(const std::string& object, std::vector<HttpRequest>* log)
    : mObject(object), mpLog(log)
    {
        // No body
    }

    void operator()(const HttpRequest& request, HttpResponse& response) const
    {
        mpLog->push_back(request);

        std::string range = requestHeader(request, "Range");
        size_t index = range.find('=') + 1;
        uint64_t start = Util::strtoull(range, index);
        index++;
        uint64_t end = Util::strtoull(range, index);

        std::string slice = mObject.substr(start, end - start + 1);
        Reply(206, slice)(request, response);
    }

private:
    std::string mObject;
    std::vector<HttpRequest>* mpLog;
};

class DownloaderTest : public SdsTest {
protected:
    ::testing::StrictMock<MockDownloadSource> mSource;
    std::vector<HttpRequest> mRequests;
    int mUrlCount;

    virtual void SetUp()
    {
        SdsTest::SetUp();
        mUrlCount = 0;
        ON_CALL(mSource, requestDownloadUrl())
            .WillByDefault(Invoke(this, &DownloaderTest::nextUrl));
    }

    std::string nextUrl()
    {
        std::stringstream ss;
        ss << "https://s3.example.com/object?sig=" << ++mUrlCount;
        return ss.str();
    }

    void expectPlainSource(uint64_t size)
    {
        EXPECT_CALL(mSource, isEncrypted()).WillRepeatedly(Return(false));
        EXPECT_CALL(mSource, knownSize(_))
            .WillOnce(DoAll(SetArgReferee<0>(size), Return(true)));
        EXPECT_CALL(mSource, requestDownloadUrl()).Times(::testing::AtLeast(1));
    }
};

TEST_F(DownloaderTest, FetchesRangesOnFreshUrls)
{
    std::string object = makeContent(2500);
    expectPlainSource(object.size());
    EXPECT_CALL(*mpTransport, perform(_, _))
        .Times(3)
        .WillRepeatedly(Invoke(RangeReply(object, &mRequests)));

    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    downloader.setChunkSize(1024).download(out);

    EXPECT_TRUE(out.str() == object);
    ASSERT_EQ(3u, mRequests.size());
    EXPECT_EQ("bytes=0-1023", requestHeader(mRequests[0], "Range"));
    EXPECT_EQ("bytes=1024-2047", requestHeader(mRequests[1], "Range"));
    EXPECT_EQ("bytes=2048-2499", requestHeader(mRequests[2], "Range"));
    EXPECT_EQ("https://s3.example.com/object?sig=1", mRequests[0].url);
    EXPECT_EQ("https://s3.example.com/object?sig=2", mRequests[1].url);
    EXPECT_EQ("https://s3.example.com/object?sig=3", mRequests[2].url);
    EXPECT_TRUE(mRequests[0].credentialHeader.empty())
            << "presigned URLs carry no token";
}

static void recordProgress(uint64_t soFar, uint64_t total, void* userdata)
{
    static_cast<std::vector<uint64_t>*>(userdata)->push_back(soFar);
}

TEST_F(DownloaderTest, ReportsProgress)
{
    std::string object = makeContent(300);
    expectPlainSource(object.size());
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillRepeatedly(Invoke(RangeReply(object, &mRequests)));

    std::vector<uint64_t> progress;
    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    downloader.setChunkSize(100)
        .setProgressCallback(recordProgress, &progress)
        .download(out);

    ASSERT_EQ(3u, progress.size());
    EXPECT_EQ(100u, progress[0]);
    EXPECT_EQ(300u, progress[2]);
}

TEST_F(DownloaderTest, EmptyFileNeedsNoRange)
{
    expectPlainSource(0);

    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    downloader.download(out);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DownloaderTest, SizeFromHead)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(200, "", "Content-Length: 4242\r\n",
            &mRequests)));

    Downloader downloader(*mpCtx, mSource);
    EXPECT_EQ(4242u, downloader.discoverSize("https://s3.example.com/o"));
    ASSERT_EQ(1u, mRequests.size());
    EXPECT_EQ(HEAD, mRequests[0].method);
}

TEST_F(DownloaderTest, SizeFromRangeRequestWhenHeadFails)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(403, "", "", &mRequests)))
        .WillOnce(Invoke(Reply(206, "x", "Content-Range: bytes 0-0/98765\r\n",
            &mRequests)));

    Downloader downloader(*mpCtx, mSource);
    EXPECT_EQ(98765u, downloader.discoverSize("https://s3.example.com/o"));
    ASSERT_EQ(2u, mRequests.size());
    EXPECT_EQ(GET, mRequests[1].method);
    EXPECT_EQ("bytes=0-0", requestHeader(mRequests[1], "Range"));
}

TEST_F(DownloaderTest, UnknownSizeIsHttpError)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(405, "")))
        .WillOnce(Invoke(Reply(206, "x", "Content-Range: bytes 0-0/*\r\n")));

    Downloader downloader(*mpCtx, mSource);
    EXPECT_THROW(downloader.discoverSize("https://s3.example.com/o"),
            HttpError);
}

TEST_F(DownloaderTest, StorageErrorIsParsedAsXml)
{
    expectPlainSource(10);
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(403,
            "<Error><Code>AccessDenied</Code><Message>Expired</Message>"
            "</Error>")));

    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    try
    {
        downloader.download(out);
        FAIL() << "403 did not throw";
    }
    catch (const HttpError& e)
    {
        EXPECT_TRUE(e.response().isStorageError());
        EXPECT_EQ("AccessDenied", e.response().storageCode());
    }
}

TEST_F(DownloaderTest, EmptyRangeResponseIsIoError)
{
    expectPlainSource(10);
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillOnce(Invoke(Reply(206, "")));

    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    EXPECT_THROW(downloader.download(out), IoError);
}

class EncryptedDownloaderTest : public DownloaderTest {
protected:
    std::string mPlaintext;
    std::string mCiphertext;
    PlainFileKey mKey;

    virtual void SetUp()
    {
        DownloaderTest::SetUp();
        mPlaintext = makeContent(3000);
        FileEncrypter encrypter;
        encrypter.update(mPlaintext.data(), mPlaintext.size(), mCiphertext);
        encrypter.finalize(mCiphertext);
        mKey = encrypter.fileKey();

        EXPECT_CALL(mSource, isEncrypted()).WillRepeatedly(Return(true));
        EXPECT_CALL(mSource, fileKey()).WillOnce(Return(mKey));
        EXPECT_CALL(mSource, knownSize(_))
            .WillOnce(DoAll(SetArgReferee<0>((uint64_t) mCiphertext.size()),
                Return(true)));
        EXPECT_CALL(mSource, requestDownloadUrl())
            .Times(::testing::AtLeast(1));
    }
};

TEST_F(EncryptedDownloaderTest, DecryptsAfterLastRange)
{
    EXPECT_CALL(*mpTransport, perform(_, _))
        .Times(3)
        .WillRepeatedly(Invoke(RangeReply(mCiphertext, &mRequests)));

    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    downloader.setChunkSize(1024).download(out);
    EXPECT_TRUE(out.str() == mPlaintext);
}

TEST_F(EncryptedDownloaderTest, TamperedContentWritesNothing)
{
    std::string tampered = mCiphertext;
    tampered[2000] ^= 0x10;
    EXPECT_CALL(*mpTransport, perform(_, _))
        .WillRepeatedly(Invoke(RangeReply(tampered, &mRequests)));

    std::ostringstream out;
    Downloader downloader(*mpCtx, mSource);
    EXPECT_THROW(downloader.setChunkSize(1024).download(out), CryptoError);
    EXPECT_TRUE(out.str().empty());
}
