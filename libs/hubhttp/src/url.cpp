#include "url.hpp"
#include "log.hpp"

#include <regex>

#include "spdlog/fmt/fmt.h"

namespace hubhttp
{

namespace
{

// scheme :// host-or-ip-literal [:port] path [?query] [#fragment]
const std::regex urlRegex(
    R"(^([A-Za-z][A-Za-z0-9+.\-]*)://(\[[0-9A-Fa-f:.]+\]|[^/?#:@\[\]]+)(?::([0-9]{1,5}))?([^?#]*)(?:\?([^#]*))?(?:#.*)?$)");

}

URLComponents URLComponents::parse(std::string const& url)
{
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex))
        throw logRuntimeError<URLError>(
            fmt::format("[URLComponents::parse] Malformed URL '{}'", url));

    URLComponents result;
    result.scheme = match[1].str();
    result.host = match[2].str();
    if (match[3].matched) {
        auto port = std::stoul(match[3].str());
        if (port == 0 || port > 65535)
            throw logRuntimeError<URLError>(
                fmt::format("[URLComponents::parse] Invalid port in URL '{}'", url));
        result.port = static_cast<std::uint16_t>(port);
    }
    result.path = match[4].str();
    result.query = match[5].str();
    return result;
}

std::string URLComponents::build() const
{
    return buildHost() + buildPath();
}

std::string URLComponents::buildHost() const
{
    if (scheme.empty())
        throw logRuntimeError<URLError>("[URLComponents::buildHost] Missing scheme");
    if (host.empty())
        throw logRuntimeError<URLError>("[URLComponents::buildHost] Missing host");

    return scheme + "://" + host +
        (port > 0 ? ":" + std::to_string(port) : std::string());
}

std::string URLComponents::buildPath() const
{
    auto result = path.empty() ? std::string("/") : path;
    if (!query.empty())
        result += "?" + query;
    return result;
}

}
