#include "log.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <shared_mutex>

#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace
{

std::string envOrEmpty(char const* name)
{
    if (auto value = std::getenv(name))
        return value;
    return {};
}

spdlog::level::level_enum parseLevel(std::string level)
{
    for (auto& ch : level)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "warning" || level == "warn")
        return spdlog::level::warn;
    if (level == "debug" || level == "dbg")
        return spdlog::level::debug;
    if (level == "trace")
        return spdlog::level::trace;
    return spdlog::level::info;
}

}

spdlog::logger& hubhttp::log()
{
    static std::shared_ptr<spdlog::logger> logger;
    static std::shared_mutex loggerAccess;

    {
        std::shared_lock<std::shared_mutex> readLock(loggerAccess);
        if (logger)
            return *logger;
    }

    std::lock_guard<std::shared_mutex> writeLock(loggerAccess);

    // Another thread may have won the race for the write lock.
    if (logger)
        return *logger;

    auto logFile = envOrEmpty("HUBLIMIT_LOG_FILE");
    auto logFileMaxSize = envOrEmpty("HUBLIMIT_LOG_FILE_MAXSIZE");
    uint64_t maxSizeBytes = 1024ull * 1024 * 1024;

    if (!logFile.empty()) {
        if (!logFileMaxSize.empty()) {
            try {
                maxSizeBytes = std::stoull(logFileMaxSize);
            }
            catch (std::exception const&) {
                std::cerr << "Could not parse value of HUBLIMIT_LOG_FILE_MAXSIZE." << std::endl;
            }
        }
        std::cerr << "Logging to '" << logFile << "' (max. " << maxSizeBytes << " bytes)." << std::endl;
        logger = spdlog::rotating_logger_mt("hublimit", logFile, maxSizeBytes, 2);
    }
    else
        logger = spdlog::stderr_color_mt("hublimit");

    logger->set_level(parseLevel(envOrEmpty("HUBLIMIT_LOG_LEVEL")));
    return *logger;
}
