/*
 * File:   sds-transfer.cpp
 * Author: me
 *
 * Created on October 13, 2015, 11:10 PM
 */



// Library and standard headers
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <libgen.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fstream>
#include <utility>
#include <vector>


// Project header(s)
#include "Options.hpp"
#include "TransferSession.hpp"
#include "sdsclient/Client.hpp"
#include "sdsclient/UploadDescriptor.hpp"
#include "sdsclient/Errors.hpp"
#include "sdsclient/Log.hpp"
#include "sdsclient/Util.hpp"

using namespace std;
using namespace sdsclient;
using namespace sdstransfer;


static void sdst_progress(uint64_t bytesSoFar, uint64_t totalBytes,
        void* userdata);

static uint64_t sdst_parse_id(const string& arg);

static UploadDescriptor sdst_descriptor_for(const string& localPath,
        const Options& options);

static int sdst_upload(TransferSession& session, const Options& options);

static int sdst_download(TransferSession& session, const Options& options);

static int sdst_share_upload(TransferSession& session,
        const Options& options);

static int sdst_share_download(TransferSession& session,
        const Options& options);

static int sdst_distribute_keys(TransferSession& session,
        const Options& options);

static int sdst_logout(TransferSession& session);

static void sdst_unlock_if_possible(ConnectedClient& client);


static void sdst_progress(uint64_t bytesSoFar, uint64_t totalBytes,
        void* userdata)
{
    const char* name = (const char*) userdata;
    int percent = totalBytes > 0 ? (int) (bytesSoFar * 100 / totalBytes) : 100;
    fprintf(stderr, "\r%s: %llu of %llu bytes (%d%%)", name,
            (unsigned long long) bytesSoFar,
            (unsigned long long) totalBytes, percent);
    if (bytesSoFar >= totalBytes)
    {
        fputc('\n', stderr);
    }
}

static uint64_t sdst_parse_id(const string& arg)
{
    size_t index = 0;
    uint64_t id = Util::strtoull(arg, index);
    if (index != string::npos || id == 0)
    {
        throw MissingArgument("a numeric node id instead of '" + arg + "'");
    }
    return id;
}

static UploadDescriptor sdst_descriptor_for(const string& localPath,
        const Options& options)
{
    struct stat st;
    if (stat(localPath.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        throw IoError("not a readable file: " + localPath);
    }

    // basename() may modify its argument
    vector<char> pathBuf(localPath.begin(), localPath.end());
    pathBuf.push_back('\0');
    UploadDescriptor descriptor(basename(&pathBuf[0]), (uint64_t) st.st_size);
    descriptor.setResolutionStrategy(options.resolution)
        .setTimestampModification(st.st_mtime);
    return descriptor;
}

static void sdst_unlock_if_possible(ConnectedClient& client)
{
    Secret secret =
            TransferSession::secretFromEnv(TransferSession::ENV_ENCRYPTION_SECRET);
    if (!secret.empty())
    {
        client.getUnlockedKeyPair(secret);
    }
}

static int sdst_upload(TransferSession& session, const Options& options)
{
    const string& localPath = options.args[0];
    uint64_t parentId = sdst_parse_id(options.args[1]);
    UploadDescriptor descriptor = sdst_descriptor_for(localPath, options);

    ifstream source(localPath.c_str(), ios::in | ios::binary);
    if (!source)
    {
        throw IoError("could not open " + localPath);
    }

    ConnectedClient client = session.connect(session.buildClient());
    sdst_unlock_if_possible(client);

    Node node = client.upload(parentId, descriptor, source,
            options.progress ? sdst_progress : NULL,
            (void*) descriptor.getName().c_str());
    printf("%llu\t%s\n", (unsigned long long) node.getId(),
            node.getName().c_str());
    return 0;
}

static int sdst_download(TransferSession& session, const Options& options)
{
    uint64_t nodeId = sdst_parse_id(options.args[0]);
    const string& localPath = options.args[1];

    ConnectedClient client = session.connect(session.buildClient());
    Node node = client.getNode(nodeId);
    if (node.isEncrypted())
    {
        Secret secret = TransferSession::secretFromEnv(
                TransferSession::ENV_ENCRYPTION_SECRET);
        if (secret.empty())
        {
            throw MissingEncryptionSecret();
        }
        client.getUnlockedKeyPair(secret);
    }

    ofstream writer(localPath.c_str(),
            ios::out | ios::binary | ios::trunc);
    if (!writer)
    {
        throw IoError("could not create " + localPath);
    }

    try
    {
        client.download(node, writer,
                options.progress ? sdst_progress : NULL,
                (void*) node.getName().c_str());
        writer.close();
    }
    catch (...)
    {
        // Don't leave a partial file behind
        writer.close();
        unlink(localPath.c_str());
        throw;
    }
    return 0;
}

static int sdst_share_upload(TransferSession& session,
        const Options& options)
{
    const string& accessKey = options.args[0];
    const string& localPath = options.args[1];
    UploadDescriptor descriptor = sdst_descriptor_for(localPath, options);

    ifstream source(localPath.c_str(), ios::in | ios::binary);
    if (!source)
    {
        throw IoError("could not open " + localPath);
    }

    DisconnectedClient client = session.buildClient();
    Node node = client.publicShares().uploadToShare(accessKey, descriptor,
            source, options.progress ? sdst_progress : NULL,
            (void*) descriptor.getName().c_str(), 0,
            TransferSession::secretFromEnv(
                TransferSession::ENV_SHARE_PASSWORD));
    printf("%s\n", node.getName().c_str());
    return 0;
}

static int sdst_share_download(TransferSession& session,
        const Options& options)
{
    const string& accessKey = options.args[0];
    const string& localPath = options.args[1];

    ofstream writer(localPath.c_str(),
            ios::out | ios::binary | ios::trunc);
    if (!writer)
    {
        throw IoError("could not create " + localPath);
    }

    DisconnectedClient client = session.buildClient();
    try
    {
        string name = client.publicShares().downloadFromShare(accessKey,
                writer, TransferSession::secretFromEnv(
                    TransferSession::ENV_SHARE_PASSWORD),
                options.progress ? sdst_progress : NULL,
                (void*) localPath.c_str());
        writer.close();
        printf("%s\n", name.c_str());
    }
    catch (...)
    {
        writer.close();
        unlink(localPath.c_str());
        throw;
    }
    return 0;
}

static int sdst_distribute_keys(TransferSession& session,
        const Options& options)
{
    uint64_t fileId = options.args.empty() ? 0 : sdst_parse_id(options.args[0]);
    Secret secret =
            TransferSession::secretFromEnv(TransferSession::ENV_ENCRYPTION_SECRET);
    if (secret.empty())
    {
        throw MissingEncryptionSecret();
    }

    ConnectedClient client = session.connect(session.buildClient());
    client.getUnlockedKeyPair(secret);
    uint64_t total = client.distributeMissingKeys(fileId);
    printf("%llu missing file key(s) before this run\n",
            (unsigned long long) total);
    return 0;
}

static int sdst_logout(TransferSession& session)
{
    Secret refreshToken = session.readAuthFile();
    if (refreshToken.empty())
    {
        fputs("Not logged in\n", stderr);
        return 0;
    }

    ConnectedClient client = session.connect(session.buildClient());
    std::move(client).disconnect(true, true);
    session.removeAuthFile();
    return 0;
}

int main(int argc, char* argv[])
{
    // Parse command line options
    Options* pOptions;
    try
    {
        pOptions = new Options(argc, argv);
    }
    catch (const exception& e)
    {
        fputs("Error interpreting command line options:\n\t", stderr);
        fputs(e.what(), stderr);
        Options::printUsage(argv[0]);
        return 1;
    }

    if (pOptions->help)
    {
        Options::printUsage(argv[0]);
        delete pOptions;
        return 0;
    }

    initLogging(pOptions->log_level, pOptions->log_file);

    TransferSession session(*pOptions);
    int returnVal = 2;
    try
    {
        switch (pOptions->command)
        {
            case COMMAND_UPLOAD:
                returnVal = sdst_upload(session, *pOptions);
                break;
            case COMMAND_DOWNLOAD:
                returnVal = sdst_download(session, *pOptions);
                break;
            case COMMAND_SHARE_UPLOAD:
                returnVal = sdst_share_upload(session, *pOptions);
                break;
            case COMMAND_SHARE_DOWNLOAD:
                returnVal = sdst_share_download(session, *pOptions);
                break;
            case COMMAND_AUTHORIZE_URL:
                printf("%s\n", session.buildClient().authorizeUrl().c_str());
                returnVal = 0;
                break;
            case COMMAND_DISTRIBUTE_KEYS:
                returnVal = sdst_distribute_keys(session, *pOptions);
                break;
            case COMMAND_LOGOUT:
                returnVal = sdst_logout(session);
                break;
            default:
                Options::printUsage(argv[0]);
                returnVal = 1;
        }
    }
    catch (const HttpError& e)
    {
        SDS_LOG_ERROR << e.response().toString();
        fprintf(stderr, "Request failed: %s\n", e.what());
    }
    catch (const SdsError& e)
    {
        fprintf(stderr, "%s\n", e.what());
    }
    catch (const exception& e)
    {
        SDS_LOG_FATAL << e.what();
        fprintf(stderr, "Unexpected error: %s\n", e.what());
    }

    delete pOptions;
    return returnVal;
}
