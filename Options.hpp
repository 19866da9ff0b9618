/*
 * File:   Options.hpp
 * Author: me
 *
 * Created on October 14, 2015, 8:39 AM
 */

#ifndef OPTIONS_HPP
#define	OPTIONS_HPP

#include <stdint.h>
#include <getopt.h>
#include <exception>
#include <string>
#include <vector>

#include "sdsclient/SdsEnums.hpp"


namespace sdstransfer
{
    enum Command
    {
        COMMAND_NONE,
        COMMAND_UPLOAD,
        COMMAND_DOWNLOAD,
        COMMAND_SHARE_UPLOAD,
        COMMAND_SHARE_DOWNLOAD,
        COMMAND_AUTHORIZE_URL,
        COMMAND_DISTRIBUTE_KEYS,
        COMMAND_LOGOUT
    };

    class Options {
    public:
        // The action to perform, taken from the first non-option argument
        Command command;

        // Remaining non-option arguments, in order
        std::vector<std::string> args;

        // Base URL of the server
        std::string base_url;

        std::string client_id;

        // For the password grant
        std::string username;

        // Authorization code from the browser redirect
        std::string auth_code;

        // Path to the auth file holding the refresh token
        std::string auth_file;

        std::string user_agent;

        // Size of transfer chunks, 0 for the library default
        uint64_t chunk_size;

        int max_retries;

        // Number of connections to rotate through
        int token_rotation;

        sdsclient::Resolution_Strategy resolution;

        sdsclient::Log_Level log_level;

        std::string log_file;

        // Print a progress line after every chunk
        bool progress;

        bool help;

        /**
         * Create an Options object and fill it with values based on
         * user-specified command line arguments. Any options not specified
         * by command line arguments will have default values.
         * @param argc The same argc that was passed in to main().
         * @param argv The same argv that was passed in to main().
         * Throws BadOptionException.
         */
        Options(int argc, char** argv);

        virtual ~Options();

        static void printUsage(const char* programName);

    private:
        static const char OPTION_BASEURL;
        static const char OPTION_CLIENTID;
        static const char OPTION_USERNAME;
        static const char OPTION_CONFIG;
        static const char OPTION_RESOLUTION;
        static const char OPTION_VERBOSE;
        static const char OPTION_PROGRESS;
        static const char OPTION_HELP;
        static const unsigned int OPTION_CODE;
        static const unsigned int OPTION_CHUNKSIZE;
        static const unsigned int OPTION_RETRIES;
        static const unsigned int OPTION_ROTATION;
        static const unsigned int OPTION_USERAGENT;
        static const unsigned int OPTION_LOGFILE;
        static const unsigned int OPTION_LOGLEVEL;
        static const char* const OPTION_STRING;

        static const char* const DEFAULT_AUTH_BASENAME;
        static const char* const DEFAULT_AUTH_RELPATH;
        static const sdsclient::Log_Level DEFAULT_LOG_LEVEL;

        void setDefaults();

        void setDefaultAuthFile();

        void setCommand(const std::string& arg);

        void setResolution(const char* arg);

        void setChunkSize(const char* arg);

        void setMaxRetries(const char* arg);

        void setTokenRotation(const char* arg);

        void setLogLevel(const char* arg);

        void increaseVerbosity();

        void setFailed(int argVal, const struct option* longopts,
                int longIndex);

        // Number of arguments the command takes
        static size_t expectedArgs(Command command);

        Options(const Options& orig);

    };

    class BadOptionException : public std::exception
    {
    public:
        explicit BadOptionException(const std::string& message);
        BadOptionException(const char* fmtStr, const char* arg);
        virtual const char* what() const noexcept;
        virtual ~BadOptionException() noexcept;

    private:
        std::string msg;

    };

}


#endif	/* OPTIONS_HPP */
