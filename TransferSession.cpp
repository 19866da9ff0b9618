/*
 * File:   TransferSession.cpp
 * Author: me
 *
 * Created on October 16, 2015, 11:49 PM
 */

#include "TransferSession.hpp"
#include "sdsclient/OAuth2Flow.hpp"
#include "sdsclient/Errors.hpp"
#include "sdsclient/Json.hpp"
#include "sdsclient/Log.hpp"
#include "sdsclient/Util.hpp"

#include <sys/stat.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <utility>

using namespace std;
using namespace sdsclient;

namespace sdstransfer
{
    const char* const TransferSession::ENV_CLIENT_SECRET = "SDS_CLIENT_SECRET";
    const char* const TransferSession::ENV_PASSWORD = "SDS_PASSWORD";
    const char* const TransferSession::ENV_ENCRYPTION_SECRET =
            "SDS_ENCRYPTION_SECRET";
    const char* const TransferSession::ENV_SHARE_PASSWORD =
            "SDS_SHARE_PASSWORD";

    const string TransferSession::FIELDNAME_REFRESHTOKEN = "refresh_token";
    const string TransferSession::FIELDNAME_BASEURL = "base_url";

    TransferSession::TransferSession(const Options& options)
    : mOptions(options)
    {
        // No body
    }

    TransferSession::~TransferSession()
    {
        // Empty
    }

    DisconnectedClient TransferSession::buildClient()
    {
        ClientBuilder builder;
        builder.baseUrl(mOptions.base_url)
            .clientId(mOptions.client_id)
            .clientSecret(secretFromEnv(ENV_CLIENT_SECRET))
            .userAgent(mOptions.user_agent);
        if (mOptions.chunk_size > 0)
        {
            builder.chunkSize(mOptions.chunk_size);
        }
        if (mOptions.max_retries >= 0)
        {
            builder.maxRetries(mOptions.max_retries);
        }
        if (mOptions.token_rotation > 0)
        {
            builder.tokenRotation(mOptions.token_rotation);
        }
        return builder.build();
    }

    ConnectedClient TransferSession::connect(DisconnectedClient&& client)
    {
        if (!mOptions.auth_code.empty())
        {
            ConnectedClient connected = std::move(client).connect(
                    OAuth2Flow::authorizationCode(Secret(mOptions.auth_code)));
            writeAuthFile(connected.mainConnection());
            return connected;
        }

        Secret refreshToken = readAuthFile();
        Secret password = secretFromEnv(ENV_PASSWORD);
        if (!refreshToken.empty())
        {
            try
            {
                ConnectedClient connected = std::move(client).connect(
                        OAuth2Flow::refreshToken(refreshToken));
                writeAuthFile(connected.mainConnection());
                return connected;
            }
            catch (const AuthenticationError& e)
            {
                if (mOptions.username.empty() || password.empty())
                {
                    throw;
                }
                // The saved login expired; fall back to the password
                SDS_LOG_INFO << "Saved login rejected (" << e.error()
                        << "), logging in with password";
            }
        }

        if (mOptions.username.empty() || password.empty())
        {
            throw MissingArgument("username and " + string(ENV_PASSWORD) +
                    ", or --code (see authorize-url)");
        }
        ConnectedClient connected = std::move(client).connect(
                OAuth2Flow::password(mOptions.username, password));
        writeAuthFile(connected.mainConnection());
        return connected;
    }

    Secret TransferSession::readAuthFile()
    {
        const string& filename = mOptions.auth_file;
        if (filename.empty())
        {
            return Secret();
        }

        // Make sure the file exists and is a regular file.
        struct stat st;
        if (stat(filename.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        {
            return Secret();
        }

        FILE* inFile = fopen(filename.c_str(), "r");
        if (inFile == NULL)
        {
            SDS_LOG_WARN << "Could not read auth file " << filename;
            return Secret();
        }

        string buffer(st.st_size, '\0');
        size_t bytesRead = fread(&buffer[0], 1, buffer.size(), inFile);
        fclose(inFile);
        buffer.resize(bytesRead);

        Json jsonObj(buffer);
        Secret refreshToken;
        if (jsonObj.isValid() &&
                jsonObj.getString(FIELDNAME_BASEURL) ==
                    buildBaseUrl(mOptions.base_url))
        {
            refreshToken = Secret(jsonObj.getString(FIELDNAME_REFRESHTOKEN));
        }
        if (!buffer.empty())
        {
            memset(&buffer[0], 0, buffer.size());
        }
        return refreshToken;
    }

    bool TransferSession::writeAuthFile(const Connection& connection)
    {
        if (mOptions.auth_file.empty() || connection.refreshToken().empty())
        {
            // Nothing worth saving
            return false;
        }

        FILE* outFile = Util::recursiveFopen(mOptions.auth_file, "w");
        if (outFile == NULL)
        {
            SDS_LOG_WARN << "Could not write auth file "
                    << mOptions.auth_file;
            return false;
        }

        Json jsonObj;
        jsonObj.addString(FIELDNAME_BASEURL, buildBaseUrl(mOptions.base_url))
            .addString(FIELDNAME_REFRESHTOKEN,
                connection.refreshToken().expose());
        int success = fputs(jsonObj.toString(true).c_str(), outFile);
        fclose(outFile);

        return success >= 0;
    }

    bool TransferSession::removeAuthFile()
    {
        return unlink(mOptions.auth_file.c_str()) == 0;
    }

    Secret TransferSession::secretFromEnv(const char* name)
    {
        const char* value = getenv(name);
        return value ? Secret(value, strlen(value)) : Secret();
    }

    string TransferSession::buildBaseUrl(const string& baseUrl)
    {
        return Config().setBaseUrl(baseUrl).baseUrl();
    }

}
