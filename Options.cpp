/*
 * File:   Options.cpp
 * Author: me
 *
 * Created on October 13, 2015, 11:26 PM
 */

#include <unistd.h>
#include <sys/types.h>
#include <pwd.h>
#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

#include "Options.hpp"

using namespace std;
using namespace sdsclient;

namespace sdstransfer
{
    /**************************
    * Private Constants
    **************************/
    const char Options::OPTION_BASEURL = 'b';
    const char Options::OPTION_CLIENTID = 'c';
    const char Options::OPTION_USERNAME = 'u';
    const char Options::OPTION_CONFIG = 'f';
    const char Options::OPTION_RESOLUTION = 'r';
    const char Options::OPTION_VERBOSE = 'v';
    const char Options::OPTION_PROGRESS = 'p';
    const char Options::OPTION_HELP = 'h';
    const unsigned int Options::OPTION_CODE = 500;
    const unsigned int Options::OPTION_CHUNKSIZE = 501;
    const unsigned int Options::OPTION_RETRIES = 502;
    const unsigned int Options::OPTION_ROTATION = 503;
    const unsigned int Options::OPTION_USERAGENT = 504;
    const unsigned int Options::OPTION_LOGFILE = 505;
    const unsigned int Options::OPTION_LOGLEVEL = 506;
    const char* const Options::OPTION_STRING = "b:c:u:f:r:vph";

    const char* const Options::DEFAULT_AUTH_BASENAME = "auth.json";
    const char* const Options::DEFAULT_AUTH_RELPATH = ".config/sds-transfer";
    const Log_Level Options::DEFAULT_LOG_LEVEL = LEVEL_WARNING;


    /**************************
    * Public Methods
    **************************/

    Options::Options(int argc, char** argv)
    {
        // Initialize all options to their default values
        setDefaults();

        // Set up the long options
        struct option longopts[] =
        {
            {"base-url", required_argument, NULL, OPTION_BASEURL},
            {"client-id", required_argument, NULL, OPTION_CLIENTID},
            {"username", required_argument, NULL, OPTION_USERNAME},
            {"config", required_argument, NULL, OPTION_CONFIG},
            {"resolution", required_argument, NULL, OPTION_RESOLUTION},
            {"verbose", no_argument, NULL, OPTION_VERBOSE},
            {"progress", no_argument, NULL, OPTION_PROGRESS},
            {"help", no_argument, NULL, OPTION_HELP},
            {"code", required_argument, NULL, (int) OPTION_CODE},
            {"chunk-size", required_argument, NULL, (int) OPTION_CHUNKSIZE},
            {"retries", required_argument, NULL, (int) OPTION_RETRIES},
            {"rotation", required_argument, NULL, (int) OPTION_ROTATION},
            {"user-agent", required_argument, NULL, (int) OPTION_USERAGENT},
            {"log-file", required_argument, NULL, (int) OPTION_LOGFILE},
            {"log-level", required_argument, NULL, (int) OPTION_LOGLEVEL},
            {
                // End the array with an
                // all-zero element
                0, 0, 0, 0
            }
        };

        opterr = 0;
        int currentArg;
        int longoptIndex = -1;
        while ((currentArg = getopt_long(argc, argv, OPTION_STRING,
                                         longopts, &longoptIndex)) != -1)
        {
            switch (currentArg)
            {
                case OPTION_BASEURL:
                    base_url.assign(optarg);
                    break;
                case OPTION_CLIENTID:
                    client_id.assign(optarg);
                    break;
                case OPTION_USERNAME:
                    username.assign(optarg);
                    break;
                case OPTION_CONFIG:
                    // Set the auth file
                    auth_file.assign(optarg);
                    break;
                case OPTION_RESOLUTION:
                    setResolution(optarg);
                    break;
                case OPTION_VERBOSE:
                    increaseVerbosity();
                    break;
                case OPTION_PROGRESS:
                    progress = true;
                    break;
                case OPTION_HELP:
                    help = true;
                    break;
                case OPTION_CODE:
                    auth_code.assign(optarg);
                    break;
                case OPTION_CHUNKSIZE:
                    setChunkSize(optarg);
                    break;
                case OPTION_RETRIES:
                    setMaxRetries(optarg);
                    break;
                case OPTION_ROTATION:
                    setTokenRotation(optarg);
                    break;
                case OPTION_USERAGENT:
                    user_agent.assign(optarg);
                    break;
                case OPTION_LOGFILE:
                    log_file.assign(optarg);
                    break;
                case OPTION_LOGLEVEL:
                    setLogLevel(optarg);
                    break;
                case '?':
                    // Fall through to default
                default:
                    setFailed(optopt, longopts, longoptIndex);
            }
        }

        if (help)
        {
            return;
        }

        if (optind >= argc)
        {
            throw BadOptionException("No command given\n");
        }
        setCommand(argv[optind++]);
        for (int i = optind; i < argc; i++)
        {
            args.push_back(argv[i]);
        }

        size_t expected = expectedArgs(command);
        bool optionalArg = (command == COMMAND_DISTRIBUTE_KEYS);
        if (args.size() > expected ||
                (!optionalArg && args.size() < expected))
        {
            throw BadOptionException("Wrong number of arguments for '%s'\n",
                    argv[optind - 1]);
        }
    }

    Options::~Options()
    {
        // Empty
    }

    void Options::printUsage(const char* programName)
    {
        fprintf(stderr,
            "Usage: %s [OPTIONS] COMMAND [ARGS]\n"
            "\n"
            "Commands:\n"
            "  upload LOCAL_FILE PARENT_ID        Upload into a room or folder\n"
            "  download NODE_ID LOCAL_FILE        Download a file\n"
            "  share-upload ACCESS_KEY LOCAL_FILE Upload into an upload share\n"
            "  share-download ACCESS_KEY LOCAL_FILE\n"
            "                                     Download from a share link\n"
            "  authorize-url                      Print the browser login URL\n"
            "  distribute-keys [FILE_ID]          Hand out missing file keys\n"
            "  logout                             Revoke and forget the "
                                                  "saved login\n"
            "\n"
            "Options:\n"
            "  -b, --base-url URL      Server address\n"
            "  -c, --client-id ID      OAuth client id\n"
            "  -u, --username NAME     Log in with a password\n"
            "      --code CODE         Log in with an authorization code\n"
            "  -f, --config FILE       Auth file (default "
                                       "~/.config/sds-transfer/auth.json)\n"
            "  -r, --resolution MODE   autorename, overwrite or fail\n"
            "      --chunk-size BYTES  Transfer chunk size\n"
            "      --retries N         Retries per request (0-5)\n"
            "      --rotation N        Connections to rotate through (1-5)\n"
            "      --user-agent TEXT   Prefix for the User-Agent header\n"
            "      --log-level LEVEL   trace, debug, info, warning, error\n"
            "      --log-file FILE     Also write the log to FILE\n"
            "  -v, --verbose           Lower the log level by one step\n"
            "  -p, --progress          Show transfer progress\n"
            "  -h, --help              Show this help\n"
            "\n"
            "Secrets are read from the environment: SDS_CLIENT_SECRET,\n"
            "SDS_PASSWORD, SDS_ENCRYPTION_SECRET, SDS_SHARE_PASSWORD.\n",
            programName);
    }


    /**************************
    * Private Instance Methods
    **************************/

    void Options::setDefaults()
    {
        command = COMMAND_NONE;
        setDefaultAuthFile();
        chunk_size = 0;
        max_retries = -1;
        token_rotation = 0;
        resolution = RESOLUTION_AUTORENAME;
        log_level = DEFAULT_LOG_LEVEL;
        progress = false;
        help = false;
    }

    /**
     * Sets the auth file to
     * "<HOME-DIRECTORY>/<DEFAULT_AUTH_RELPATH>/<DEFAULT_AUTH_BASENAME>".
     */
    void Options::setDefaultAuthFile()
    {
        // Get the user's home directory
        const char* homedir = getenv("HOME");
        if (!homedir)
        {
            struct passwd* pw = getpwuid(getuid());
            homedir = pw ? pw->pw_dir : ".";
        }

        auth_file.assign(homedir);
        auth_file.append("/");
        auth_file.append(DEFAULT_AUTH_RELPATH);
        auth_file.append("/");
        auth_file.append(DEFAULT_AUTH_BASENAME);
    }

    void Options::setCommand(const string& arg)
    {
        if (arg == "upload")
        {
            command = COMMAND_UPLOAD;
        }
        else if (arg == "download")
        {
            command = COMMAND_DOWNLOAD;
        }
        else if (arg == "share-upload")
        {
            command = COMMAND_SHARE_UPLOAD;
        }
        else if (arg == "share-download")
        {
            command = COMMAND_SHARE_DOWNLOAD;
        }
        else if (arg == "authorize-url")
        {
            command = COMMAND_AUTHORIZE_URL;
        }
        else if (arg == "distribute-keys")
        {
            command = COMMAND_DISTRIBUTE_KEYS;
        }
        else if (arg == "logout")
        {
            command = COMMAND_LOGOUT;
        }
        else
        {
            throw BadOptionException("Unrecognized command '%s'\n",
                    arg.c_str());
        }
    }

    void Options::setResolution(const char* arg)
    {
        if (!strcmp(arg, "autorename"))
        {
            resolution = RESOLUTION_AUTORENAME;
        }
        else if (!strcmp(arg, "overwrite"))
        {
            resolution = RESOLUTION_OVERWRITE;
        }
        else if (!strcmp(arg, "fail"))
        {
            resolution = RESOLUTION_FAIL;
        }
        else
        {
            const char* fmtStr = "Unrecognized resolution '%s'. Valid values "
                                 "are autorename, overwrite, or fail.\n";
            throw BadOptionException(fmtStr, arg);
        }
    }

    void Options::setChunkSize(const char* arg)
    {
        char* end = NULL;
        unsigned long long chunkSize = strtoull(arg, &end, 10);
        if (end == arg || *end != '\0' || chunkSize == 0)
        {
            const char* fmtStr = "Invalid chunk size '%s', not a positive "
                                 "integer\n";
            throw BadOptionException(fmtStr, arg);
        }
        chunk_size = chunkSize;
    }

    void Options::setMaxRetries(const char* arg)
    {
        char* end = NULL;
        long retries = strtol(arg, &end, 10);
        if (end == arg || *end != '\0' || retries < 0)
        {
            const char* fmtStr = "Invalid retries '%s', not a non-negative "
                                 "integer\n";
            throw BadOptionException(fmtStr, arg);
        }
        max_retries = (int) retries;
    }

    void Options::setTokenRotation(const char* arg)
    {
        char* end = NULL;
        long rotation = strtol(arg, &end, 10);
        if (end == arg || *end != '\0' || rotation < 1)
        {
            const char* fmtStr = "Invalid rotation '%s', not a positive "
                                 "integer\n";
            throw BadOptionException(fmtStr, arg);
        }
        token_rotation = (int) rotation;
    }

    void Options::setLogLevel(const char* arg)
    {
        if (!strcmp(arg, "trace"))
        {
            log_level = LEVEL_TRACE;
        }
        else if (!strcmp(arg, "debug"))
        {
            log_level = LEVEL_DEBUG;
        }
        else if (!strcmp(arg, "info"))
        {
            log_level = LEVEL_INFO;
        }
        else if (!strcmp(arg, "warning"))
        {
            log_level = LEVEL_WARNING;
        }
        else if (!strcmp(arg, "error"))
        {
            log_level = LEVEL_ERROR;
        }
        else
        {
            const char* fmtStr = "Unrecognized log level '%s'. Valid values "
                                 "are trace, debug, info, warning, or "
                                 "error.\n";
            throw BadOptionException(fmtStr, arg);
        }
    }

    void Options::increaseVerbosity()
    {
        if (log_level > LEVEL_TRACE)
        {
            log_level = (Log_Level) (log_level - 1);
        }
    }

    /**
     * Handles an unrecognized option or an option with a required value but
     * no value provided.
     * @param argVal:   The value of the actual argument found (as from optopt)
     * @param longopts
     * @param longIndex
     */
    void Options::setFailed(int argVal, const struct option* longopts,
                            int longIndex)
    {
        // Assume short option for initialization
        char shortArgStr[] = {(char) argVal, '\0'};
        const char* argStr;
        const char* fmtStr;
        if (argVal > 32 && argVal < 256)
        {
            // Short option
            argStr = shortArgStr;
            fmtStr = "Unrecognized option, or no value given "
                             "for option: '-%s'\n";
        }
        else if (longIndex >= 0)
        {
            // Long option
            argStr = longopts[longIndex].name;
            fmtStr = "Unrecognized option, or no value given "
                             "for option: '--%s'\n";
        }
        else
        {
            throw BadOptionException("Unrecognized option\n");
        }

        throw BadOptionException(fmtStr, argStr);
    }

    size_t Options::expectedArgs(Command command)
    {
        switch (command)
        {
            case COMMAND_UPLOAD:
            case COMMAND_DOWNLOAD:
            case COMMAND_SHARE_UPLOAD:
            case COMMAND_SHARE_DOWNLOAD:
                return 2;
            case COMMAND_DISTRIBUTE_KEYS:
                return 1;
            default:
                return 0;
        }
    }



    BadOptionException::BadOptionException(const string& message)
    : msg(message)
    {
        // No body
    }

    BadOptionException::BadOptionException(const char* fmtStr, const char* arg)
    {
        if (!(fmtStr && fmtStr[0] && arg))
        {
            return;
        }

        int length = snprintf(NULL, 0, fmtStr, arg);
        if (length > 0)
        {
            msg.resize(length + 1);
            snprintf(&msg[0], length + 1, fmtStr, arg);
            msg.resize(length);
        }
    }

    const char* BadOptionException::what() const noexcept
    {
        return msg.c_str();
    }

    BadOptionException::~BadOptionException() noexcept
    {
        // Empty
    }
}
