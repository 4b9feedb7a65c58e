#include "status-handler.hpp"
#include "errors.hpp"

#include <charconv>

#include "hubhttp/log.hpp"
#include "spdlog/fmt/fmt.h"
#include "yaml-cpp/yaml.h"

using hubhttp::log;

namespace hublimit
{

namespace
{

bool startsWith(std::string const& value, char const* prefix)
{
    return value.rfind(prefix, 0) == 0;
}

/**
 * Description of whatever is nested inside e, or e itself if
 * nothing is nested.
 */
std::string details(std::exception const& e)
{
    try {
        std::rethrow_if_nested(e);
    }
    catch (std::exception const& cause) {
        return describe(cause);
    }
    return e.what();
}

EndpointStatusHandler::Response errorResponse(int status, std::string const& message, std::string const& detail)
{
    if (status >= 500)
        log().error("{}: {}", message, detail);
    else
        log().debug("{}: {}", message, detail);

    YAML::Emitter out;
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::Flow << YAML::BeginMap
        << YAML::Key << "message" << YAML::Value << message
        << YAML::Key << "details" << YAML::Value << detail
        << YAML::EndMap;
    return {status, out.c_str()};
}

}

bool supportsDockerHubStatus(Endpoint const& endpoint)
{
    return startsWith(endpoint.url, "unix://") ||
        startsWith(endpoint.url, "npipe://") ||
        endpoint.type == EndpointType::KubernetesLocalEnvironment;
}

EndpointStatusHandler::EndpointStatusHandler(
    IEndpointStore const& endpoints,
    IDockerHubStore const& dockerHub,
    hubhttp::IHttpClient& httpClient,
    std::optional<RegistryEndpoints> registry,
    hubhttp::Settings const* httpSettings)
    : endpoints_(endpoints)
    , dockerHub_(dockerHub)
    , httpClient_(httpClient)
    , registry_(std::move(registry))
    , httpSettings_(httpSettings)
{}

Endpoint EndpointStatusHandler::resolveEndpoint(std::string const& endpointIdRouteVariable) const
{
    EndpointID id = 0;
    auto const* begin = endpointIdRouteVariable.data();
    auto const* end = begin + endpointIdRouteVariable.size();
    auto [ptr, ec] = std::from_chars(begin, end, id);
    if (endpointIdRouteVariable.empty() || ec != std::errc() || ptr != end || id <= 0)
        throw InvalidInputError(
            fmt::format("Invalid endpoint identifier '{}'", endpointIdRouteVariable));

    auto lookup = endpoints_.endpoint(id);
    if (std::holds_alternative<EndpointNotFound>(lookup))
        throw NotFoundError(fmt::format("No endpoint with identifier {}", id));
    if (auto failure = std::get_if<StoreFailure>(&lookup))
        throw Error(failure->message);

    auto endpoint = std::get<Endpoint>(lookup);
    if (!supportsDockerHubStatus(endpoint))
        throw UnsupportedEndpointTypeError("Invalid environment type");
    return endpoint;
}

EndpointStatusHandler::Response EndpointStatusHandler::handle(std::string const& endpointIdRouteVariable) const
{
    Endpoint endpoint;
    try {
        endpoint = resolveEndpoint(endpointIdRouteVariable);
    }
    catch (InvalidInputError const& e) {
        return errorResponse(400, "Invalid endpoint identifier route variable", e.what());
    }
    catch (NotFoundError const& e) {
        return errorResponse(404, "Unable to find an endpoint with the specified identifier inside the database", e.what());
    }
    catch (UnsupportedEndpointTypeError const& e) {
        return errorResponse(400, "Invalid environment type", e.what());
    }
    catch (Error const& e) {
        return errorResponse(500, "Unable to find an endpoint with the specified identifier inside the database", e.what());
    }

    DockerHubCredentials credentials;
    RegistryEndpoints registry;
    try {
        credentials = dockerHub_.dockerHub();
        registry = registry_ ? *registry_ : dockerHub_.registry();
    }
    catch (std::exception const& e) {
        return errorResponse(500, "Unable to retrieve DockerHub details from the database", describe(e));
    }

    log().debug("Fetching DockerHub status for endpoint {} ({})", endpoint.id, endpoint.name);

    try {
        auto status = httpSettings_
            ? getDockerHubStatus(httpClient_, credentials, registry, *httpSettings_)
            : getDockerHubStatus(httpClient_, credentials, registry);
        return {200, toJson(status)};
    }
    catch (UpstreamAuthError const& e) {
        auto detail = details(e);
        auto status = findCause<UnexpectedStatusError>(e);
        if (status && status->rejectedCredentials())
            detail = fmt::format("DockerHub rejected the credentials (status {})", status->status);
        return errorResponse(500, e.what(), detail);
    }
    catch (UpstreamRateLimitError const& e) {
        return errorResponse(500, "Unable to retrieve DockerHub rate limits from DockerHub", details(e));
    }
}

}
