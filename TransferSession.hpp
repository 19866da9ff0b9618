/*
 * File:   TransferSession.hpp
 * Author: me
 *
 * Created on October 16, 2015, 11:49 PM
 */

#ifndef TRANSFERSESSION_HPP
#define	TRANSFERSESSION_HPP

#include "Options.hpp"
#include "sdsclient/Client.hpp"
#include "sdsclient/Secret.hpp"

#include <string>

namespace sdstransfer
{
    /*
     * Turns the command line and environment into a client, and keeps the
     * refresh token in the auth file between runs.
     */
    class TransferSession {
    public:
        static const char* const ENV_CLIENT_SECRET;
        static const char* const ENV_PASSWORD;
        static const char* const ENV_ENCRYPTION_SECRET;
        static const char* const ENV_SHARE_PASSWORD;

        explicit TransferSession(const Options& options);

        virtual ~TransferSession();

        // Throws sdsclient::ConfigurationError
        sdsclient::DisconnectedClient buildClient();

        /*
         * connect():   Tries, in order, an authorization code from the
         *              command line, the refresh token from the auth file,
         *              and a password login. Saves the new refresh token.
         */
        sdsclient::ConnectedClient connect(
                sdsclient::DisconnectedClient&& client);

        // Empty if there's no usable auth file
        sdsclient::Secret readAuthFile();

        bool writeAuthFile(const sdsclient::Connection& connection);

        bool removeAuthFile();

        // Empty if the variable isn't set
        static sdsclient::Secret secretFromEnv(const char* name);

    private:
        static const std::string FIELDNAME_REFRESHTOKEN;
        static const std::string FIELDNAME_BASEURL;

        const Options& mOptions;

        // The base URL as the client normalizes it
        static std::string buildBaseUrl(const std::string& baseUrl);

        TransferSession(const TransferSession& orig);
    };

}

#endif	/* TRANSFERSESSION_HPP */
