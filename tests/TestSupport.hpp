/*
 * File:   TestSupport.hpp
 * Author: me
 *
 * Created on March 21, 2024, 9:00 AM
 */

#ifndef TESTSUPPORT_HPP
#define	TESTSUPPORT_HPP

#include "sdsclient/HttpTransport.hpp"
#include "sdsclient/Timing.hpp"
#include "sdsclient/Config.hpp"
#include "sdsclient/SdsContext.hpp"
#include "sdsclient/Json.hpp"
#include "sdsclient/UploadTarget.hpp"
#include "sdsclient/UploadDescriptor.hpp"
#include "sdsclient/HttpTransfer.hpp"
#include "sdsclient/Crypto.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace sdsclient
{
namespace test
{
    class MockHttpTransport : public HttpTransport {
    public:
        MOCK_METHOD(void, perform,
                (const HttpRequest& request, HttpResponse& response),
                (override));
    };

    class MockUploadTarget : public UploadTarget {
    public:
        MOCK_METHOD(bool, isEncrypted, (), (override));
        MOCK_METHOD(UploadChannel, openChannel,
                (const UploadDescriptor& descriptor, bool directS3Upload),
                (override));
        MOCK_METHOD(std::vector<PresignedUrl>, presign,
                (const UploadChannel& channel, uint64_t size,
                    int firstPartNumber, int lastPartNumber),
                (override));
        MOCK_METHOD(void, finalizeS3,
                (const UploadChannel& channel,
                    const UploadDescriptor& descriptor,
                    const std::vector<UploadedPart>& parts,
                    const PlainFileKey* key),
                (override));
        MOCK_METHOD(Node, finalizeNfs,
                (const UploadChannel& channel,
                    const UploadDescriptor& descriptor,
                    const PlainFileKey* key),
                (override));
        MOCK_METHOD(std::string, statusUrl, (const UploadChannel& channel),
                (override));
        MOCK_METHOD(void, authorize, (HttpTransfer& xfer), (override));
        MOCK_METHOD(Node, resultFromStatus, (const Json& status),
                (override));
        MOCK_METHOD(void, afterCompletion,
                (const Node& node, const PlainFileKey& key), (override));
    };

    class FakeClock : public Clock {
    public:
        FakeClock();

        virtual time_t now() const;

        time_t current;
    };

    class RecordingSleeper : public Sleeper {
    public:
        virtual void sleepMs(long milliseconds);

        std::vector<long> delays;
    };

    /*
     * Answers a request the way CurlTransport would: 2xx bodies go to the
     * request's sink if it has one, everything else to response.body. If
     * log isn't NULL, a copy of every request answered is appended to it.
     */
    class Reply {
    public:
        Reply(long status, const std::string& body,
                const std::string& headers="",
                std::vector<HttpRequest>* log=NULL);

        void operator()(const HttpRequest& request,
                HttpResponse& response) const;

    private:
        long mStatus;
        std::string mBody;
        std::string mHeaders;
        std::vector<HttpRequest>* mpLog;
    };

    // Keeps a copy of the request, then throws ConnectionError
    class FailConnection {
    public:
        explicit FailConnection(std::vector<HttpRequest>* log=NULL);

        void operator()(const HttpRequest& request,
                HttpResponse& response) const;

    private:
        std::vector<HttpRequest>* mpLog;
    };

    ::testing::Matcher<const HttpRequest&> urlIs(const std::string& url);

    ::testing::Matcher<const HttpRequest&> urlStartsWith(
            const std::string& prefix);

    // The value of a "Name: value" header line, or "" if absent
    std::string requestHeader(const HttpRequest& request,
            const std::string& name);

    // Decoded value of a field in an x-www-form-urlencoded body
    std::string formField(const HttpRequest& request,
            const std::string& name);

    std::string tokenResponse(const std::string& accessToken,
            const std::string& refreshToken, long expiresIn);

    // A predictable pattern of size bytes
    std::string makeContent(size_t size);

    /*
     * Builds a context around a strict mock transport, a fake clock and a
     * recording sleeper. The context owns them; the raw pointers stay valid
     * for the test's lifetime.
     */
    class SdsTest : public ::testing::Test {
    protected:
        static const char* const BASE_URL;

        ::testing::StrictMock<MockHttpTransport>* mpTransport;
        FakeClock* mpClock;
        RecordingSleeper* mpSleeper;
        std::shared_ptr<SdsContext> mpCtx;

        virtual void SetUp();

        // Replaces the context, e.g. to apply a changed configuration
        void makeContext(const Config& config);

        static Config testConfig();

        std::string apiUrl(const std::string& path) const;
    };

}
}

#endif	/* TESTSUPPORT_HPP */
