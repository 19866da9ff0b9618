/* 
 * File:   Log.cpp
 * Author: me
 * 
 * Created on March 4, 2024, 8:20 PM
 */

#include "Log.hpp"

#include <fstream>
#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>

using namespace std;

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

namespace sdsclient
{
    BOOST_LOG_GLOBAL_LOGGER_INIT(sdsLogger, sds_logger_type)
    {
        logger_type logger;
        logger.add_attribute("TimeStamp", logging::attributes::local_clock());
        return logger;
    }
    
    const char* toString(Log_Level level)
    {
        switch (level)
        {
            case LEVEL_TRACE:   return "TRACE";
            case LEVEL_DEBUG:   return "DEBUG";
            case LEVEL_INFO:    return "INFO";
            case LEVEL_WARNING: return "WARNING";
            case LEVEL_ERROR:   return "ERROR";
            case LEVEL_FATAL:   return "FATAL";
            default:            return "UNKNOWN";
        }
    }
    
    ostream& operator<<(ostream& strm, Log_Level level)
    {
        strm << toString(level);
        return strm;
    }
    
    void initLogging(Log_Level minLevel, const string& logFile)
    {
        boost::shared_ptr<logging::core> core = logging::core::get();
        core->remove_all_sinks();
        
        typedef sinks::synchronous_sink<sinks::text_ostream_backend> text_sink;
        boost::shared_ptr<sinks::text_ostream_backend> backend = 
                boost::make_shared<sinks::text_ostream_backend>();
        backend->add_stream(
                boost::shared_ptr<ostream>(&clog, boost::null_deleter()));
        if (!logFile.empty())
        {
            boost::shared_ptr<ofstream> fileStream = 
                    boost::make_shared<ofstream>(logFile.c_str(), ios::app);
            if (fileStream->is_open())
            {
                backend->add_stream(fileStream);
            }
            else
            {
                clog << "Could not open log file " << logFile << endl;
            }
        }
        backend->auto_flush(true);
        
        boost::shared_ptr<text_sink> sink = boost::make_shared<text_sink>(backend);
        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>(
                        "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << expr::attr<Log_Level>("Severity") << "] "
                << expr::smessage
        );
        sink->set_filter(expr::attr<Log_Level>("Severity") >= minLevel);
        
        core->add_sink(sink);
    }
}
