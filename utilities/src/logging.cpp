#include "logging.hpp"
#include "errors.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

static std::shared_ptr<spdlog::logger> make_default_logger()
{
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto log = std::make_shared<spdlog::logger>("vnetcfg", sink);
    log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    log->set_level(spdlog::level::warn);
    return log;
}

std::shared_ptr<spdlog::logger> logger = make_default_logger();

void activate_logging(spdlog::level::level_enum level)
{
    logger->set_level(level);
    for (auto& sink : logger->sinks())
        sink->set_level(level);
    logger->debug("Logging activated at level [{}]", spdlog::level::to_string_view(level));
}

void activate_file_logging(const std::string& path, spdlog::level::level_enum level)
{
    if (path.empty())
        return;

    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        file_sink->set_level(level);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->sinks().push_back(file_sink);
        if (level < logger->level())
            logger->set_level(level);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        throw NetConfigError(ErrorKind::STORE_FAILURE, "cannot open log file '" + path + "': " + ex.what());
    }
}

spdlog::level::level_enum parse_log_level(const std::string& name)
{
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off")
        throw NetConfigError(ErrorKind::INVALID_ARGUMENT, "unknown log level '" + name + "'");
    return level;
}
