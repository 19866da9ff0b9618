/*
 * File:   Client.hpp
 * Author: me
 *
 * Created on March 20, 2024, 11:15 AM
 */

#ifndef CLIENT_HPP
#define	CLIENT_HPP

#include "Config.hpp"
#include "Connection.hpp"
#include "ChunkedUploader.hpp"
#include "PublicShares.hpp"
#include "Crypto.hpp"
#include "Secret.hpp"
#include "Node.hpp"

#include <stdint.h>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace sdsclient
{
    class SdsContext;
    class HttpTransport;
    class Clock;
    class Sleeper;
    class TokenManager;
    class KeyPairService;
    class OAuth2Flow;
    class UploadDescriptor;
    class DisconnectedClient;
    class ConnectedClient;
    class ProvisioningClient;

    /*
     * Collects the configuration and produces a client in its first state.
     * transport, clock and sleeper default to CurlTransport, Clock and
     * Sleeper. The builder takes ownership of anything passed in and hands
     * it on to the client it builds.
     */
    class ClientBuilder {
    public:
        ClientBuilder();

        virtual ~ClientBuilder();

        ClientBuilder& baseUrl(const std::string& baseUrl);

        ClientBuilder& clientId(const std::string& clientId);

        ClientBuilder& clientSecret(const Secret& clientSecret);

        ClientBuilder& redirectUri(const std::string& redirectUri);

        ClientBuilder& userAgent(const std::string& userAgent);

        ClientBuilder& maxRetries(int maxRetries);

        ClientBuilder& minRetryDelay(long milliseconds);

        ClientBuilder& maxRetryDelay(long milliseconds);

        ClientBuilder& tokenRotation(int tokenCount);

        ClientBuilder& chunkSize(uint64_t chunkSize);

        ClientBuilder& connectTimeout(long seconds);

        ClientBuilder& readTimeout(long seconds);

        ClientBuilder& provisioningToken(const Secret& serviceToken);

        ClientBuilder& transport(HttpTransport* transport);

        ClientBuilder& clock(Clock* clock);

        ClientBuilder& sleeper(Sleeper* sleeper);

        const Config& getConfig() const;

        // Throws ConfigurationError
        DisconnectedClient build();

        // Throws ConfigurationError, also if no provisioning token was set
        ProvisioningClient buildProvisioning();

    private:
        Config mConfig;
        Secret mProvisioningToken;
        std::unique_ptr<HttpTransport> mpTransport;
        std::unique_ptr<Clock> mpClock;
        std::unique_ptr<Sleeper> mpSleeper;

        std::shared_ptr<SdsContext> makeContext();

        ClientBuilder(const ClientBuilder& orig);
    };

    /*
     * A client without a user session. Can build the authorization URL,
     * query the public system info and use public shares. connect()
     * consumes it:
     *
     *      ConnectedClient client =
     *              std::move(disconnected).connect(flow);
     *
     * Clients can be moved but not copied. A moved-from client throws
     * SdsError from every operation.
     */
    class DisconnectedClient {
    public:
        explicit DisconnectedClient(std::shared_ptr<SdsContext> ctx);

        DisconnectedClient(DisconnectedClient&& orig);

        DisconnectedClient& operator=(DisconnectedClient&& orig);

        virtual ~DisconnectedClient();

        std::string authorizeUrl(const std::string& state="") const;

        /*
         * connect():   Runs the flow. On failure the exception propagates
         *              and this client stays usable.
         * Throws:
         *      AuthenticationError, ConnectionError, HttpError.
         */
        ConnectedClient connect(const OAuth2Flow& flow) &&;

        PublicShares publicShares() const;

        bool useS3Storage();

        const Config& getConfig() const;

    private:
        std::shared_ptr<SdsContext> mpCtx;

        SdsContext& context() const;
    };

    /*
     * A client with an OAuth session. Transfers, key handling and
     * authorization headers for other calls. disconnect() consumes it and
     * returns the client to the disconnected state.
     *
     * Thread safe as long as the client itself isn't moved concurrently.
     */
    class ConnectedClient {
    public:
        ConnectedClient(std::shared_ptr<SdsContext> ctx,
                std::unique_ptr<TokenManager> tokens);

        ConnectedClient(ConnectedClient&& orig);

        ConnectedClient& operator=(ConnectedClient&& orig);

        virtual ~ConnectedClient();

        // "Bearer {token}" for a request of the caller's own
        Secret getAuthHeader();

        Connection mainConnection() const;

        // GET nodes/{id}
        Node getNode(uint64_t nodeId);

        /*
         * upload():    Uploads source into the room or folder parent.
         *              Encrypts if the parent is encrypted. chunkSize 0
         *              selects the configured size.
         */
        Node upload(const Node& parent, const UploadDescriptor& descriptor,
                std::istream& source, ProgressCallback callback=NULL,
                void* userdata=NULL, uint64_t chunkSize=0);

        Node upload(uint64_t parentId, const UploadDescriptor& descriptor,
                std::istream& source, ProgressCallback callback=NULL,
                void* userdata=NULL, uint64_t chunkSize=0);

        /*
         * download(): Encrypted files need the key pair to be unlocked
         *             first, see getUnlockedKeyPair().
         */
        void download(const Node& node, std::ostream& writer,
                ProgressCallback callback=NULL, void* userdata=NULL,
                uint64_t chunkSize=0);

        void download(uint64_t nodeId, std::ostream& writer,
                ProgressCallback callback=NULL, void* userdata=NULL,
                uint64_t chunkSize=0);

        UserKeyPair getUserKeyPair();

        // Unlocks with secret on the first call; later calls may omit it
        PlainUserKeyPair getUnlockedKeyPair(const Secret& secret=Secret());

        // Needs an unlocked key pair. 0 leaves a filter out.
        uint64_t distributeMissingKeys(uint64_t fileId=0, uint64_t roomId=0,
                uint64_t userId=0);

        PublicShares publicShares() const;

        /*
         * disconnect():    Optionally revokes tokens on the server, then
         *                  forgets every connection and the unlocked key
         *                  pair. Revocation failures are logged only.
         */
        DisconnectedClient disconnect(bool revokeAccess=true,
                bool revokeRefresh=false) &&;

    private:
        std::shared_ptr<SdsContext> mpCtx;
        std::unique_ptr<TokenManager> mpTokens;
        std::unique_ptr<KeyPairService> mpKeyPairs;

        SdsContext& context() const;
        TokenManager& tokens() const;
        KeyPairService& keyPairs() const;
    };

    /*
     * A client for the provisioning API. Authorizes with a service token
     * instead of OAuth and can't transfer files.
     */
    class ProvisioningClient {
    public:
        static const std::string HEADER_SERVICE_TOKEN;

        ProvisioningClient(std::shared_ptr<SdsContext> ctx,
                const Secret& serviceToken);

        ProvisioningClient(ProvisioningClient&& orig);

        virtual ~ProvisioningClient();

        // Value for the X-Sds-Service-Token header
        const Secret& getServiceTokenHeader() const;

        bool useS3Storage();

        const Config& getConfig() const;

    private:
        std::shared_ptr<SdsContext> mpCtx;
        Secret mServiceToken;
    };

}

#endif	/* CLIENT_HPP */
