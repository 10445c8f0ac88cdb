#include "logger.hpp"

// Library default stays quiet; the CLI raises it to INFO.
LogLevel Logger::level = LogLevel::ERROR;
