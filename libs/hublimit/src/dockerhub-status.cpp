#include "dockerhub-client.hpp"
#include "errors.hpp"

#include "hubhttp/log.hpp"
#include "yaml-cpp/yaml.h"

namespace hublimit
{

namespace
{

RateLimitStatus runPipeline(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints,
    hubhttp::Config const& tokenConfig,
    hubhttp::Config const& rateLimitConfig)
{
    // Step 1: the token must exist before the rate-limit call.
    std::string token;
    try {
        token = acquireToken(client, credentials, endpoints, tokenConfig);
    }
    catch (std::exception const&) {
        std::throw_with_nested(UpstreamAuthError("Unable to retrieve DockerHub token from DockerHub"));
    }

    // Step 2
    try {
        return fetchRateLimits(client, token, endpoints, rateLimitConfig);
    }
    catch (UpstreamProtocolError const&) {
        throw;
    }
    catch (std::exception const&) {
        std::throw_with_nested(UpstreamRateLimitError("Unable to retrieve DockerHub rate limits from DockerHub"));
    }
}

}

RateLimitStatus getDockerHubStatus(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints)
{
    return runPipeline(client, credentials, endpoints, {}, {});
}

RateLimitStatus getDockerHubStatus(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints,
    hubhttp::Settings const& settings)
{
    return runPipeline(
        client, credentials, endpoints,
        settings[endpoints.tokenUrl],
        settings[endpoints.rateLimitUrl]);
}

std::string toJson(RateLimitStatus const& status)
{
    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::Flow << YAML::BeginMap
        << YAML::Key << "remaining" << YAML::Value << status.remaining
        << YAML::Key << "limit" << YAML::Value << status.limit
        << YAML::EndMap;
    return out.c_str();
}

}
