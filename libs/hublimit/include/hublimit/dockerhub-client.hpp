#pragma once

#include <string>

#include "hubhttp/http-client.hpp"
#include "hubhttp/http-settings.hpp"

namespace hublimit
{

/**
 * The two DockerHub URLs that are probed. Defaults point to the
 * public auth service and registry; tests redirect them to fixtures.
 */
struct RegistryEndpoints
{
    static constexpr char const* DEFAULT_TOKEN_URL =
        "https://auth.docker.io/token?service=registry.docker.io&scope=repository:ratelimitpreview/test:pull";
    static constexpr char const* DEFAULT_RATE_LIMIT_URL =
        "https://registry-1.docker.io/v2/ratelimitpreview/test/manifests/latest";

    std::string tokenUrl = DEFAULT_TOKEN_URL;
    std::string rateLimitUrl = DEFAULT_RATE_LIMIT_URL;
};

/**
 * Stored DockerHub account. Basic credentials are only sent
 * if `authentication` is set. If `keychain` is non-empty, the
 * password is read from the system keychain instead.
 */
struct DockerHubCredentials
{
    bool authentication = false;
    std::string username;
    std::string password;
    std::string keychain;
};

/**
 * Pull quota as reported by the registry: the maximum pulls per
 * window and the pulls left in the current window.
 */
struct RateLimitStatus
{
    int limit = 0;
    int remaining = 0;
};

static constexpr char const* RATE_LIMIT_LIMIT_HEADER = "RateLimit-Limit";
static constexpr char const* RATE_LIMIT_REMAINING_HEADER = "RateLimit-Remaining";

/**
 * Obtain a pull-scoped bearer token for the sentinel repository.
 *
 * Throws TransportError, UnexpectedStatusError (any status but 200)
 * or DecodeError (body is not {"token": "<non-empty string>"}).
 */
std::string acquireToken(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints,
    hubhttp::Config config = {});

/**
 * HEAD the sentinel manifest with the given token and read the
 * RateLimit-Limit and RateLimit-Remaining headers.
 *
 * Throws TransportError, UnexpectedStatusError, or UpstreamProtocolError
 * (nesting the MissingHeaderError/ParseError of the failed header).
 */
RateLimitStatus fetchRateLimits(
    hubhttp::IHttpClient& client,
    std::string const& token,
    RegistryEndpoints const& endpoints,
    hubhttp::Config config = {});

/**
 * Parse a header like "100;w=21600" into 100. Only the part before
 * the first ';' is considered.
 *
 * Throws MissingHeaderError or ParseError.
 */
int parseNumericHeader(hubhttp::Headers const& headers, std::string const& key);

/**
 * Acquire a token, then fetch the rate limits with it. Failures of the
 * first step are raised as UpstreamAuthError, failures of the second as
 * UpstreamRateLimitError (or UpstreamProtocolError for header problems),
 * each nesting its cause. Per-URL settings (e.g. a proxy) are taken from
 * `settings` if given.
 */
RateLimitStatus getDockerHubStatus(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints);

RateLimitStatus getDockerHubStatus(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints,
    hubhttp::Settings const& settings);

/**
 * Render as {"remaining": N, "limit": M}.
 */
std::string toJson(RateLimitStatus const& status);

}
