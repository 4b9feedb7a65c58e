#include "dockerhub-client.hpp"
#include "errors.hpp"

#include "hubhttp/log.hpp"
#include "yaml-cpp/yaml.h"

using hubhttp::log;

namespace hublimit
{

namespace
{

std::string decodeToken(std::string const& body)
{
    YAML::Node document;
    try {
        document = YAML::Load(body);
    }
    catch (YAML::Exception const& e) {
        throw DecodeError(std::string("DockerHub token response is not valid JSON: ") + e.what());
    }

    if (!document.IsMap())
        throw DecodeError("DockerHub token response is not a JSON object");

    // yaml-cpp tags quoted scalars "!" and plain ones "?"; only a
    // quoted scalar is a JSON string.
    auto tokenNode = document["token"];
    if (!tokenNode || !tokenNode.IsScalar() || tokenNode.Tag() != "!")
        throw DecodeError("DockerHub token response has no string 'token' field");

    auto token = tokenNode.as<std::string>();
    if (token.empty())
        throw DecodeError("DockerHub token response has an empty 'token' field");
    return token;
}

}

std::string acquireToken(
    hubhttp::IHttpClient& client,
    DockerHubCredentials const& credentials,
    RegistryEndpoints const& endpoints,
    hubhttp::Config config)
{
    if (credentials.authentication) {
        config.auth = hubhttp::Config::BasicAuthentication{
            credentials.username, credentials.password, credentials.keychain};
    }

    log().debug("Requesting DockerHub token (authenticated={}) ...", credentials.authentication);

    hubhttp::IHttpClient::Result res;
    try {
        res = client.get(endpoints.tokenUrl, config);
    }
    catch (hubhttp::URLError const&) {
        std::throw_with_nested(TransportError("Cannot send DockerHub token request"));
    }

    if (res.status == 0)
        throw TransportError("No response from DockerHub auth service");

    if (res.status != 200) {
        log().warn("DockerHub token request failed with status {}", res.status);
        throw UnexpectedStatusError(res.status, "failed fetching dockerhub token");
    }

    auto token = decodeToken(res.content);
    log().debug("  ... received DockerHub token.");
    return token;
}

}
