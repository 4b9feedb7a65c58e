#pragma once

#include "spdlog/spdlog.h"

#include <string>

namespace hubhttp
{

/**
 * Obtain the process-wide logger, which is initialized from
 * the following environment variables:
 *  - HUBLIMIT_LOG_LEVEL
 *  - HUBLIMIT_LOG_FILE
 *  - HUBLIMIT_LOG_FILE_MAXSIZE
 */
spdlog::logger& log();

/**
 * Log a runtime error and return the throwable object.
 * @param what Runtime error message.
 * @return Exception of type error_t to throw.
 */
template<typename error_t = std::runtime_error>
error_t logRuntimeError(std::string const& what) {
    log().error(what);
    return error_t(what);
}

}
