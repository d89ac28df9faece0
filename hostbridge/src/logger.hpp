#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& channel_logger();
log4cplus::Logger& action_logger();
log4cplus::Logger& platform_logger();
void init_logging(const std::string& config_path);
