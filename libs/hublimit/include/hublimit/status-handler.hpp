#pragma once

#include <string>

#include "data-store.hpp"
#include "dockerhub-client.hpp"
#include "hubhttp/http-client.hpp"
#include "hubhttp/http-settings.hpp"

namespace hublimit
{

/**
 * True if the server can assume working DockerHub egress for the
 * endpoint: a local socket (unix://, npipe://) or local Kubernetes.
 */
bool supportsDockerHubStatus(Endpoint const& endpoint);

/**
 * Handles GET /api/endpoints/{id}/dockerhub/status.
 *
 * Stateless apart from its collaborators, so one instance may serve
 * concurrent requests if the stores and the transport allow it.
 */
class EndpointStatusHandler
{
public:
    struct Response
    {
        int status = 200;
        std::string body;
        std::string contentType = "application/json";
    };

    EndpointStatusHandler(
        IEndpointStore const& endpoints,
        IDockerHubStore const& dockerHub,
        hubhttp::IHttpClient& httpClient,
        std::optional<RegistryEndpoints> registry = std::nullopt,
        hubhttp::Settings const* httpSettings = nullptr);

    Response handle(std::string const& endpointIdRouteVariable) const;

private:
    Endpoint resolveEndpoint(std::string const& endpointIdRouteVariable) const;

    IEndpointStore const& endpoints_;
    IDockerHubStore const& dockerHub_;
    hubhttp::IHttpClient& httpClient_;
    std::optional<RegistryEndpoints> registry_;
    hubhttp::Settings const* httpSettings_;
};

}
