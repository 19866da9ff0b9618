/*
 * File:   Client.cpp
 * Author: me
 *
 * Created on March 20, 2024, 11:15 AM
 */

#include "Client.hpp"
#include "SdsContext.hpp"
#include "SystemInfo.hpp"
#include "CurlTransport.hpp"
#include "Timing.hpp"
#include "TokenManager.hpp"
#include "KeyPairService.hpp"
#include "KeyDistributor.hpp"
#include "OAuth2Flow.hpp"
#include "UploadDescriptor.hpp"
#include "NodeUploadTarget.hpp"
#include "NodeDownloadSource.hpp"
#include "Downloader.hpp"
#include "HttpTransfer.hpp"
#include "Json.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "Util.hpp"

#include <utility>

using namespace std;

namespace sdsclient
{
    const string ProvisioningClient::HEADER_SERVICE_TOKEN =
            "X-Sds-Service-Token";

    /**************************
    * ClientBuilder
    **************************/

    ClientBuilder::ClientBuilder()
    {
        // No body
    }

    ClientBuilder::~ClientBuilder()
    {
        // Empty
    }

    ClientBuilder& ClientBuilder::baseUrl(const string& baseUrl)
    {
        mConfig.setBaseUrl(baseUrl);
        return *this;
    }

    ClientBuilder& ClientBuilder::clientId(const string& clientId)
    {
        mConfig.setClientId(clientId);
        return *this;
    }

    ClientBuilder& ClientBuilder::clientSecret(const Secret& clientSecret)
    {
        mConfig.setClientSecret(clientSecret);
        return *this;
    }

    ClientBuilder& ClientBuilder::redirectUri(const string& redirectUri)
    {
        mConfig.setRedirectUri(redirectUri);
        return *this;
    }

    ClientBuilder& ClientBuilder::userAgent(const string& userAgent)
    {
        mConfig.setUserAgent(userAgent);
        return *this;
    }

    ClientBuilder& ClientBuilder::maxRetries(int maxRetries)
    {
        mConfig.setMaxRetries(maxRetries);
        return *this;
    }

    ClientBuilder& ClientBuilder::minRetryDelay(long milliseconds)
    {
        mConfig.setMinRetryDelay(milliseconds);
        return *this;
    }

    ClientBuilder& ClientBuilder::maxRetryDelay(long milliseconds)
    {
        mConfig.setMaxRetryDelay(milliseconds);
        return *this;
    }

    ClientBuilder& ClientBuilder::tokenRotation(int tokenCount)
    {
        mConfig.setTokenRotation(tokenCount);
        return *this;
    }

    ClientBuilder& ClientBuilder::chunkSize(uint64_t chunkSize)
    {
        mConfig.setChunkSize(chunkSize);
        return *this;
    }

    ClientBuilder& ClientBuilder::connectTimeout(long seconds)
    {
        mConfig.setConnectTimeout(seconds);
        return *this;
    }

    ClientBuilder& ClientBuilder::readTimeout(long seconds)
    {
        mConfig.setReadTimeout(seconds);
        return *this;
    }

    ClientBuilder& ClientBuilder::provisioningToken(const Secret& serviceToken)
    {
        mProvisioningToken = serviceToken;
        return *this;
    }

    ClientBuilder& ClientBuilder::transport(HttpTransport* transport)
    {
        mpTransport.reset(transport);
        return *this;
    }

    ClientBuilder& ClientBuilder::clock(Clock* clock)
    {
        mpClock.reset(clock);
        return *this;
    }

    ClientBuilder& ClientBuilder::sleeper(Sleeper* sleeper)
    {
        mpSleeper.reset(sleeper);
        return *this;
    }

    const Config& ClientBuilder::getConfig() const
    {
        return mConfig;
    }

    DisconnectedClient ClientBuilder::build()
    {
        mConfig.validate();
        return DisconnectedClient(makeContext());
    }

    ProvisioningClient ClientBuilder::buildProvisioning()
    {
        mConfig.validateEndpoint();
        if (mProvisioningToken.empty())
        {
            throw ConfigurationError("missing provisioning token");
        }
        return ProvisioningClient(makeContext(), mProvisioningToken);
    }

    shared_ptr<SdsContext> ClientBuilder::makeContext()
    {
        if (!mpTransport)
        {
            mpTransport.reset(new CurlTransport(mConfig.userAgent(),
                    mConfig.connectTimeout(), mConfig.readTimeout()));
        }
        if (!mpClock)
        {
            mpClock.reset(new Clock());
        }
        if (!mpSleeper)
        {
            mpSleeper.reset(new Sleeper());
        }

        return shared_ptr<SdsContext>(new SdsContext(mConfig,
                mpTransport.release(), mpClock.release(),
                mpSleeper.release()));
    }

    /**************************
    * DisconnectedClient
    **************************/

    DisconnectedClient::DisconnectedClient(shared_ptr<SdsContext> ctx)
    : mpCtx(ctx)
    {
        // No body
    }

    DisconnectedClient::DisconnectedClient(DisconnectedClient&& orig)
    : mpCtx(std::move(orig.mpCtx))
    {
        // No body
    }

    DisconnectedClient& DisconnectedClient::operator=(
            DisconnectedClient&& orig)
    {
        mpCtx = std::move(orig.mpCtx);
        return *this;
    }

    DisconnectedClient::~DisconnectedClient()
    {
        // Empty
    }

    string DisconnectedClient::authorizeUrl(const string& state) const
    {
        return TokenManager::authorizeUrl(context(), state);
    }

    ConnectedClient DisconnectedClient::connect(const OAuth2Flow& flow) &&
    {
        SdsContext& ctx = context();
        unique_ptr<TokenManager> tokens(new TokenManager(mpCtx));
        tokens->connect(flow);

        // Only give up this state once the connection is established
        ConnectedClient connected(std::move(mpCtx), std::move(tokens));
        SDS_LOG_DEBUG << "Connected to " << ctx.config().baseUrl();
        return connected;
    }

    PublicShares DisconnectedClient::publicShares() const
    {
        context();
        return PublicShares(mpCtx);
    }

    bool DisconnectedClient::useS3Storage()
    {
        return context().systemInfo().useS3Storage();
    }

    const Config& DisconnectedClient::getConfig() const
    {
        return context().config();
    }

    SdsContext& DisconnectedClient::context() const
    {
        if (!mpCtx)
        {
            throw SdsError("client was moved from");
        }
        return *mpCtx;
    }

    /**************************
    * ConnectedClient
    **************************/

    ConnectedClient::ConnectedClient(shared_ptr<SdsContext> ctx,
            unique_ptr<TokenManager> tokens)
    : mpCtx(ctx), mpTokens(std::move(tokens))
    {
        mpKeyPairs.reset(new KeyPairService(*mpCtx, *mpTokens));
    }

    ConnectedClient::ConnectedClient(ConnectedClient&& orig)
    : mpCtx(std::move(orig.mpCtx)), mpTokens(std::move(orig.mpTokens)),
            mpKeyPairs(std::move(orig.mpKeyPairs))
    {
        // No body
    }

    ConnectedClient& ConnectedClient::operator=(ConnectedClient&& orig)
    {
        mpKeyPairs = std::move(orig.mpKeyPairs);
        mpTokens = std::move(orig.mpTokens);
        mpCtx = std::move(orig.mpCtx);
        return *this;
    }

    ConnectedClient::~ConnectedClient()
    {
        // The key pair service refers to the token manager
        mpKeyPairs.reset();
        mpTokens.reset();
    }

    Secret ConnectedClient::getAuthHeader()
    {
        return tokens().getAuthHeader();
    }

    Connection ConnectedClient::mainConnection() const
    {
        return tokens().mainConnection();
    }

    Node ConnectedClient::getNode(uint64_t nodeId)
    {
        SdsContext& ctx = context();
        HttpTransfer xfer(ctx);
        xfer.setRequestType(GET)
            .setUrl(ctx.apiUrl("nodes/" + Util::toString(nodeId)))
            .setAuthorization(tokens().getAuthHeader())
            .execute();
        xfer.throwIfFailed();

        return Node::fromJson(Json(xfer.getData()));
    }

    Node ConnectedClient::upload(const Node& parent,
            const UploadDescriptor& descriptor, istream& source,
            ProgressCallback callback, void* userdata, uint64_t chunkSize)
    {
        NodeUploadTarget target(context(), tokens(), keyPairs(), parent);
        ChunkedUploader uploader(context(), target);
        uploader.setProgressCallback(callback, userdata)
            .setChunkSize(chunkSize);
        return uploader.upload(descriptor, source);
    }

    Node ConnectedClient::upload(uint64_t parentId,
            const UploadDescriptor& descriptor, istream& source,
            ProgressCallback callback, void* userdata, uint64_t chunkSize)
    {
        Node parent = getNode(parentId);
        return upload(parent, descriptor, source, callback, userdata,
                chunkSize);
    }

    void ConnectedClient::download(const Node& node, ostream& writer,
            ProgressCallback callback, void* userdata, uint64_t chunkSize)
    {
        NodeDownloadSource source(context(), tokens(), keyPairs(), node);
        Downloader downloader(context(), source);
        downloader.setProgressCallback(callback, userdata)
            .setChunkSize(chunkSize);
        downloader.download(writer);
    }

    void ConnectedClient::download(uint64_t nodeId, ostream& writer,
            ProgressCallback callback, void* userdata, uint64_t chunkSize)
    {
        Node node = getNode(nodeId);
        download(node, writer, callback, userdata, chunkSize);
    }

    UserKeyPair ConnectedClient::getUserKeyPair()
    {
        return keyPairs().getUserKeyPair();
    }

    PlainUserKeyPair ConnectedClient::getUnlockedKeyPair(const Secret& secret)
    {
        return keyPairs().getUnlockedKeyPair(secret);
    }

    uint64_t ConnectedClient::distributeMissingKeys(uint64_t fileId,
            uint64_t roomId, uint64_t userId)
    {
        PlainUserKeyPair keyPair = keyPairs().getUnlockedKeyPair();
        KeyDistributor distributor(context(), tokens());
        return distributor.distributeMissingKeys(keyPair, fileId, roomId,
                userId);
    }

    PublicShares ConnectedClient::publicShares() const
    {
        context();
        return PublicShares(mpCtx);
    }

    DisconnectedClient ConnectedClient::disconnect(bool revokeAccess,
            bool revokeRefresh) &&
    {
        TokenManager& tokenManager = tokens();
        if (revokeAccess || revokeRefresh)
        {
            tokenManager.revoke(revokeAccess, revokeRefresh);
        }
        else
        {
            tokenManager.clear();
        }
        keyPairs().clear();
        SDS_LOG_INFO << "Disconnected";

        mpKeyPairs.reset();
        mpTokens.reset();
        return DisconnectedClient(std::move(mpCtx));
    }

    SdsContext& ConnectedClient::context() const
    {
        if (!mpCtx)
        {
            throw SdsError("client was moved from");
        }
        return *mpCtx;
    }

    TokenManager& ConnectedClient::tokens() const
    {
        if (!mpTokens)
        {
            throw SdsError("client was moved from");
        }
        return *mpTokens;
    }

    KeyPairService& ConnectedClient::keyPairs() const
    {
        if (!mpKeyPairs)
        {
            throw SdsError("client was moved from");
        }
        return *mpKeyPairs;
    }

    /**************************
    * ProvisioningClient
    **************************/

    ProvisioningClient::ProvisioningClient(shared_ptr<SdsContext> ctx,
            const Secret& serviceToken)
    : mpCtx(ctx), mServiceToken(serviceToken)
    {
        // No body
    }

    ProvisioningClient::ProvisioningClient(ProvisioningClient&& orig)
    : mpCtx(std::move(orig.mpCtx)), mServiceToken(orig.mServiceToken)
    {
        orig.mServiceToken.clear();
    }

    ProvisioningClient::~ProvisioningClient()
    {
        // Empty
    }

    const Secret& ProvisioningClient::getServiceTokenHeader() const
    {
        return mServiceToken;
    }

    bool ProvisioningClient::useS3Storage()
    {
        if (!mpCtx)
        {
            throw SdsError("client was moved from");
        }
        return mpCtx->systemInfo().useS3Storage();
    }

    const Config& ProvisioningClient::getConfig() const
    {
        if (!mpCtx)
        {
            throw SdsError("client was moved from");
        }
        return mpCtx->config();
    }

}
