#include "dockerhub-client.hpp"
#include "errors.hpp"

#include <charconv>
#include <string_view>

#include "hubhttp/log.hpp"
#include "spdlog/fmt/fmt.h"

using hubhttp::log;

namespace hublimit
{

int parseNumericHeader(hubhttp::Headers const& headers, std::string const& key)
{
    auto it = hubhttp::findFirstHeader(headers, key);
    if (it == headers.end() || it->second.empty())
        throw MissingHeaderError(key);

    auto const& value = it->second;
    auto number = std::string_view(value).substr(0, value.find(';'));
    auto const* begin = number.data();
    auto const* end = number.data() + number.size();

    int result = 0;
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (number.empty() || ec != std::errc() || ptr != end)
        throw ParseError(value, fmt::format("Invalid numeric value '{}'", value));
    if (result < 0)
        throw ParseError(value, fmt::format("Negative value '{}'", value));

    return result;
}

namespace
{

int readHeader(hubhttp::Headers const& headers, char const* key)
{
    try {
        return parseNumericHeader(headers, key);
    }
    catch (Error const&) {
        std::throw_with_nested(
            UpstreamProtocolError(key, fmt::format("Failed fetching {} header", key)));
    }
}

}

RateLimitStatus fetchRateLimits(
    hubhttp::IHttpClient& client,
    std::string const& token,
    RegistryEndpoints const& endpoints,
    hubhttp::Config config)
{
    // The bearer token is the only credential for this call.
    config.auth.reset();
    config.headers.erase("Authorization");
    config.headers.insert({"Authorization", "Bearer " + token});

    log().debug("Requesting DockerHub rate limits ...");

    hubhttp::IHttpClient::Result res;
    try {
        res = client.head(endpoints.rateLimitUrl, config);
    }
    catch (hubhttp::URLError const&) {
        std::throw_with_nested(TransportError("Cannot send DockerHub rate limit request"));
    }

    if (res.status == 0)
        throw TransportError("No response from DockerHub registry");

    if (res.status != 200) {
        log().warn("DockerHub rate limit request failed with status {}", res.status);
        throw UnexpectedStatusError(res.status, "failed fetching dockerhub limits");
    }

    RateLimitStatus status;
    status.limit = readHeader(res.headers, RATE_LIMIT_LIMIT_HEADER);
    status.remaining = readHeader(res.headers, RATE_LIMIT_REMAINING_HEADER);

    log().debug("  ... limit={}, remaining={}", status.limit, status.remaining);
    return status;
}

}
