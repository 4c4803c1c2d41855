#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

// Process-wide logger. Usable before activate_logging() is called.
extern std::shared_ptr<spdlog::logger> logger;

void activate_logging(spdlog::level::level_enum level);

// Adds a file sink next to the stderr one. Empty path does nothing.
void activate_file_logging(const std::string& path, spdlog::level::level_enum level);

spdlog::level::level_enum parse_log_level(const std::string& name);

#endif
