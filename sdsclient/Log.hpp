/* 
 * File:   Log.hpp
 * Author: me
 *
 * Created on March 4, 2024, 8:20 PM
 */

#ifndef LOG_HPP
#define	LOG_HPP

#include "SdsEnums.hpp"

#include <ostream>
#include <string>

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

namespace sdsclient
{
    typedef boost::log::sources::severity_logger_mt<Log_Level> sds_logger_type;
    
    BOOST_LOG_GLOBAL_LOGGER(sdsLogger, sds_logger_type)
    
    const char* toString(Log_Level level);
    
    std::ostream& operator<<(std::ostream& strm, Log_Level level);
    
    /*
     * Replaces any installed sinks with one writing to stderr and, if 
     * logFile isn't empty, appending to logFile. Records below minLevel are 
     * dropped.
     */
    void initLogging(Log_Level minLevel, const std::string& logFile="");
}

#define SDS_LOG_TRACE BOOST_LOG_SEV(sdsclient::sdsLogger::get(), sdsclient::LEVEL_TRACE)
#define SDS_LOG_DEBUG BOOST_LOG_SEV(sdsclient::sdsLogger::get(), sdsclient::LEVEL_DEBUG)
#define SDS_LOG_INFO BOOST_LOG_SEV(sdsclient::sdsLogger::get(), sdsclient::LEVEL_INFO)
#define SDS_LOG_WARN BOOST_LOG_SEV(sdsclient::sdsLogger::get(), sdsclient::LEVEL_WARNING)
#define SDS_LOG_ERROR BOOST_LOG_SEV(sdsclient::sdsLogger::get(), sdsclient::LEVEL_ERROR)
#define SDS_LOG_FATAL BOOST_LOG_SEV(sdsclient::sdsLogger::get(), sdsclient::LEVEL_FATAL)

#endif	/* LOG_HPP */
