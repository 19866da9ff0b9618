/*
 * File:   UploadWatcher_test.cpp
 * Author: me
 *
 * Created on March 23, 2024, 2:30 PM
 */

#include "sdsclient/UploadWatcher.hpp"
#include "sdsclient/Errors.hpp"
#include "TestSupport.hpp"

#include <string>

using namespace sdsclient;
using namespace sdsclient::test;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

static const std::string STATUS_URL =
        "https://sds.example.com/api/v4/nodes/files/uploads/u-1";

class UploadWatcherTest : public SdsTest {
protected:
    ::testing::StrictMock<MockUploadTarget> mTarget;
    UploadChannel mChannel;

    virtual void SetUp()
    {
        SdsTest::SetUp();
        mChannel.uploadId = "u-1";
        EXPECT_CALL(mTarget, statusUrl(_)).WillRepeatedly(Return(STATUS_URL));
        EXPECT_CALL(mTarget, authorize(_)).Times(::testing::AnyNumber());
    }

    static Reply status(const std::string& state)
    {
        return Reply(200, "{\"status\":\"" + state + "\"}");
    }
};

TEST_F(UploadWatcherTest, ParsesStates)
{
    EXPECT_EQ(UPLOAD_DONE, UploadWatcher::parseState("done"));
    EXPECT_EQ(UPLOAD_ERROR, UploadWatcher::parseState("error"));
    EXPECT_EQ(UPLOAD_FINISHING, UploadWatcher::parseState("finishing"));
    EXPECT_EQ(UPLOAD_TRANSFER, UploadWatcher::parseState("transfer"));
    EXPECT_EQ(UPLOAD_TRANSFER, UploadWatcher::parseState("something new"));
}

TEST_F(UploadWatcherTest, SleepsOnceBeforeDone)
{
    Node created;
    created.setId(77).setName("report.pdf");

    EXPECT_CALL(*mpTransport, perform(urlIs(STATUS_URL), _))
        .WillOnce(Invoke(status("transfer")))
        .WillOnce(Invoke(Reply(200,
            "{\"status\":\"done\",\"node\":{\"id\":77}}")));
    EXPECT_CALL(mTarget, resultFromStatus(_)).WillOnce(Return(created));

    UploadWatcher watcher(*mpCtx, mTarget);
    Node node = watcher.waitForCompletion(mChannel);

    EXPECT_EQ(77u, node.getId());
    EXPECT_EQ(2, watcher.getPollCount());
    ASSERT_EQ(1u, mpSleeper->delays.size());
    EXPECT_EQ(UploadWatcher::INITIAL_DELAY, mpSleeper->delays[0]);
}

TEST_F(UploadWatcherTest, DelayDoublesWithoutLimit)
{
    EXPECT_CALL(*mpTransport, perform(urlIs(STATUS_URL), _))
        .WillOnce(Invoke(status("transfer")))
        .WillOnce(Invoke(status("finishing")))
        .WillOnce(Invoke(status("finishing")))
        .WillOnce(Invoke(status("finishing")))
        .WillOnce(Invoke(status("finishing")))
        .WillOnce(Invoke(status("finishing")))
        .WillOnce(Invoke(status("finishing")))
        .WillOnce(Invoke(status("done")));
    EXPECT_CALL(mTarget, resultFromStatus(_)).WillOnce(Return(Node()));

    UploadWatcher watcher(*mpCtx, mTarget);
    watcher.waitForCompletion(mChannel);

    const std::vector<long>& delays = mpSleeper->delays;
    ASSERT_EQ(7u, delays.size());
    long expected = 300;
    for (size_t i = 0; i < delays.size(); i++)
    {
        EXPECT_EQ(expected, delays[i]) << "poll " << i + 1;
        expected *= 2;
    }
    EXPECT_EQ(19200, delays[6]);
}

TEST_F(UploadWatcherTest, ErrorStatusCarriesDetails)
{
    EXPECT_CALL(*mpTransport, perform(urlIs(STATUS_URL), _))
        .WillOnce(Invoke(Reply(200,
            "{\"status\":\"error\",\"errorDetails\":{\"code\":409,"
            "\"message\":\"File already exists\",\"errorCode\":-40010}}")));

    UploadWatcher watcher(*mpCtx, mTarget);
    try
    {
        watcher.waitForCompletion(mChannel);
        FAIL() << "error status did not throw";
    }
    catch (const HttpError& e)
    {
        EXPECT_EQ(409, e.response().code());
        EXPECT_EQ("File already exists", e.response().message());
        EXPECT_EQ(-40010, e.response().errorCode());
    }
    EXPECT_TRUE(mpSleeper->delays.empty());
}

TEST_F(UploadWatcherTest, ErrorStatusWithoutDetails)
{
    EXPECT_CALL(*mpTransport, perform(urlIs(STATUS_URL), _))
        .WillOnce(Invoke(status("error")));

    UploadWatcher watcher(*mpCtx, mTarget);
    EXPECT_THROW(watcher.waitForCompletion(mChannel), HttpError);
}

TEST_F(UploadWatcherTest, UnreadableStatusIsHttpError)
{
    EXPECT_CALL(*mpTransport, perform(urlIs(STATUS_URL), _))
        .WillOnce(Invoke(Reply(200, "not json")));

    UploadWatcher watcher(*mpCtx, mTarget);
    EXPECT_THROW(watcher.waitForCompletion(mChannel), HttpError);
}

TEST_F(UploadWatcherTest, FailedPollIsHttpError)
{
    EXPECT_CALL(*mpTransport, perform(urlIs(STATUS_URL), _))
        .WillOnce(Invoke(Reply(404,
            "{\"code\":404,\"message\":\"Upload not found\"}")));

    UploadWatcher watcher(*mpCtx, mTarget);
    EXPECT_THROW(watcher.waitForCompletion(mChannel), HttpError);
}
