/*
 * File:   TestSupport.cpp
 * Author: me
 *
 * Created on March 21, 2024, 9:00 AM
 */

#include "TestSupport.hpp"
#include "sdsclient/Errors.hpp"

#include <stdlib.h>
#include <strings.h>
#include <sstream>

using namespace std;

namespace sdsclient
{
namespace test
{
    const char* const SdsTest::BASE_URL = "https://sds.example.com/";

    FakeClock::FakeClock()
    : current(1700000000)
    {
        // No body
    }

    time_t FakeClock::now() const
    {
        return current;
    }

    void RecordingSleeper::sleepMs(long milliseconds)
    {
        delays.push_back(milliseconds);
    }

    /**************************
    * Canned transport replies
    **************************/

    Reply::Reply(long status, const string& body, const string& headers,
            vector<HttpRequest>* log)
    : mStatus(status), mBody(body), mHeaders(headers), mpLog(log)
    {
        // No body
    }

    void Reply::operator()(const HttpRequest& request,
            HttpResponse& response) const
    {
        if (mpLog != NULL)
        {
            mpLog->push_back(request);
        }

        response.status = mStatus;
        response.headers = mHeaders;
        bool success = mStatus >= 200 && mStatus < 300;
        if (!success || request.sink == NULL)
        {
            response.body = mBody;
            return;
        }

        if (mBody.empty())
        {
            return;
        }
        size_t taken = request.sink(mBody.data(), mBody.size(),
                request.sinkUserdata);
        if (taken != mBody.size())
        {
            throw IoError("writing the response body failed");
        }
        response.bytesToSink += mBody.size();
    }

    FailConnection::FailConnection(vector<HttpRequest>* log)
    : mpLog(log)
    {
        // No body
    }

    void FailConnection::operator()(const HttpRequest& request,
            HttpResponse& response) const
    {
        if (mpLog != NULL)
        {
            mpLog->push_back(request);
        }
        throw ConnectionError(ConnectionError::REFUSED, "connection refused");
    }

    /**************************
    * Request inspection
    **************************/

    ::testing::Matcher<const HttpRequest&> urlIs(const string& url)
    {
        return ::testing::Field(&HttpRequest::url, ::testing::Eq(url));
    }

    ::testing::Matcher<const HttpRequest&> urlStartsWith(const string& prefix)
    {
        return ::testing::Field(&HttpRequest::url,
                ::testing::StartsWith(prefix));
    }

    string requestHeader(const HttpRequest& request, const string& name)
    {
        string prefix = name + ":";
        for (size_t i = 0; i < request.headers.size(); i++)
        {
            const string& line = request.headers[i];
            if (line.size() >= prefix.size() &&
                    strncasecmp(line.c_str(), prefix.c_str(),
                        prefix.size()) == 0)
            {
                size_t start = line.find_first_not_of(' ', prefix.size());
                return (start == string::npos) ? "" : line.substr(start);
            }
        }
        return "";
    }

    static string formDecode(const string& encoded)
    {
        string result;
        for (size_t i = 0; i < encoded.size(); i++)
        {
            if (encoded[i] == '%' && i + 2 < encoded.size())
            {
                string hex = encoded.substr(i + 1, 2);
                result += (char) strtol(hex.c_str(), NULL, 16);
                i += 2;
            }
            else if (encoded[i] == '+')
            {
                result += ' ';
            }
            else
            {
                result += encoded[i];
            }
        }
        return result;
    }

    string formField(const HttpRequest& request, const string& name)
    {
        istringstream fields(request.body);
        string pair;
        while (getline(fields, pair, '&'))
        {
            size_t eq = pair.find('=');
            if (eq != string::npos && formDecode(pair.substr(0, eq)) == name)
            {
                return formDecode(pair.substr(eq + 1));
            }
        }
        return "";
    }

    string tokenResponse(const string& accessToken,
            const string& refreshToken, long expiresIn)
    {
        Json json;
        json.addString("access_token", accessToken)
            .addString("token_type", "bearer");
        if (!refreshToken.empty())
        {
            json.addString("refresh_token", refreshToken);
        }
        if (expiresIn > 0)
        {
            json.addInt64("expires_in", expiresIn);
        }
        return json.toString();
    }

    string makeContent(size_t size)
    {
        string content(size, '\0');
        for (size_t i = 0; i < size; i++)
        {
            content[i] = (char) ((i * 31 + 7) % 251);
        }
        return content;
    }

    /**************************
    * Fixture
    **************************/

    void SdsTest::SetUp()
    {
        makeContext(testConfig());
    }

    void SdsTest::makeContext(const Config& config)
    {
        mpTransport = new ::testing::StrictMock<MockHttpTransport>();
        mpClock = new FakeClock();
        mpSleeper = new RecordingSleeper();
        mpCtx = std::shared_ptr<SdsContext>(
                new SdsContext(config, mpTransport, mpClock, mpSleeper));
    }

    Config SdsTest::testConfig()
    {
        Config config;
        config.setBaseUrl(BASE_URL)
            .setClientId("client")
            .setClientSecret(Secret("secret"));
        return config;
    }

    string SdsTest::apiUrl(const string& path) const
    {
        return mpCtx->apiUrl(path);
    }

}
}
