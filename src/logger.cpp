#include "logger.hpp"

LogLevel Logger::level = LogLevel::WARN;
