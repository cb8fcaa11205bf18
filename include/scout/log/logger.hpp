#pragma once
#include <boost/log/trivial.hpp>
#include <string>

#include "scout/log/log_config.hpp"

namespace scout::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static void set_level(LogConfig::LogLevel level);

private:
    static LogConfig config_;
};

}  // namespace scout::log

#define SCOUT_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define SCOUT_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define SCOUT_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define SCOUT_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define SCOUT_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define SCOUT_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
