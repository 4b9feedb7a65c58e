#include <catch2/catch_all.hpp>

#include "hublimit/data-store.hpp"
#include "hublimit/errors.hpp"
#include "hublimit/status-handler.hpp"
#include "mock-dockerhub.hpp"
#include "yaml-cpp/yaml.h"

using namespace hublimit;
using Catch::Matchers::ContainsSubstring;

namespace
{

char const* const STORE = R"(
endpoints:
  - {id: 1, name: local, url: "unix:///var/run/docker.sock", type: 1}
  - {id: 2, name: windows, url: "npipe:////./pipe/docker_engine", type: 1}
  - {id: 3, name: remote, url: "tcp://10.0.0.5:2375", type: 1}
  - {id: 4, name: kube, url: "https://kubernetes.default.svc", type: 5}
  - {id: 5, name: kube-agent, url: "tcp://10.0.0.6:9001", type: 6}
dockerhub: {authentication: true, username: alice, password: hunter2}
)";

class BrokenStore : public IEndpointStore, public IDockerHubStore
{
public:
    EndpointLookup endpoint(EndpointID) const override
    {
        return StoreFailure{"database is locked"};
    }

    DockerHubCredentials dockerHub() const override
    {
        throw Error("database is locked");
    }
};

class SwitchingRegistryStore : public IDockerHubStore
{
public:
    DockerHubCredentials dockerHub() const override
    {
        return {};
    }

    RegistryEndpoints registry() const override
    {
        return current;
    }

    RegistryEndpoints current;
};

YAML::Node parseBody(EndpointStatusHandler::Response const& response)
{
    return YAML::Load(response.body);
}

}

TEST_CASE("Status is returned for local endpoints", "[status-handler]") {
    MockDockerHub hub;
    auto store = YamlDataStore::fromString(STORE);
    EndpointStatusHandler handler(store, store, hub.client, MockDockerHub::endpoints());

    for (auto const* id : {"1", "2", "4"}) {
        INFO(id);
        auto response = handler.handle(id);
        REQUIRE(response.status == 200);
        REQUIRE(response.contentType == "application/json");

        auto body = parseBody(response);
        REQUIRE(body["remaining"].as<int>() == 17);
        REQUIRE(body["limit"].as<int>() == 100);
    }

    REQUIRE(hub.tokenRequestCount == 3);
    REQUIRE(hub.rateLimitRequestCount == 3);
    REQUIRE(hub.lastTokenConfig.auth);
    REQUIRE(hub.lastTokenConfig.auth->user == "alice");
}

TEST_CASE("Remote endpoints are rejected before any outbound call", "[status-handler]") {
    MockDockerHub hub;
    auto store = YamlDataStore::fromString(STORE);
    EndpointStatusHandler handler(store, store, hub.client, MockDockerHub::endpoints());

    for (auto const* id : {"3", "5"}) {
        INFO(id);
        auto response = handler.handle(id);
        REQUIRE(response.status == 400);
        REQUIRE(parseBody(response)["message"].as<std::string>() == "Invalid environment type");
    }

    REQUIRE(hub.tokenRequestCount == 0);
    REQUIRE(hub.rateLimitRequestCount == 0);
}

TEST_CASE("Endpoint type gate", "[status-handler][gate]") {
    REQUIRE(supportsDockerHubStatus({1, "", "unix:///var/run/docker.sock", EndpointType::DockerEnvironment}));
    REQUIRE(supportsDockerHubStatus({1, "", "npipe:////./pipe/docker_engine", EndpointType::DockerEnvironment}));
    REQUIRE(supportsDockerHubStatus({1, "", "https://10.0.0.1:6443", EndpointType::KubernetesLocalEnvironment}));
    REQUIRE_FALSE(supportsDockerHubStatus({1, "", "tcp://10.0.0.1:2375", EndpointType::DockerEnvironment}));
    REQUIRE_FALSE(supportsDockerHubStatus({1, "", "tcp://10.0.0.1:9001", EndpointType::AgentOnKubernetesEnvironment}));
    REQUIRE_FALSE(supportsDockerHubStatus({1, "", "tcp://unix://", EndpointType::AgentOnDockerEnvironment}));
}

TEST_CASE("Invalid identifiers and unknown endpoints", "[status-handler]") {
    MockDockerHub hub;
    auto store = YamlDataStore::fromString(STORE);
    EndpointStatusHandler handler(store, store, hub.client, MockDockerHub::endpoints());

    for (auto const* id : {"", "abc", "1a", "-1", "0", "99999999999"}) {
        INFO(id);
        auto response = handler.handle(id);
        REQUIRE(response.status == 400);
        REQUIRE(parseBody(response)["message"].as<std::string>() == "Invalid endpoint identifier route variable");
    }

    auto notFound = handler.handle("42");
    REQUIRE(notFound.status == 404);

    REQUIRE(hub.tokenRequestCount == 0);
}

TEST_CASE("Store failures are server errors", "[status-handler]") {
    MockDockerHub hub;

    SECTION("Endpoint lookup") {
        BrokenStore broken;
        EndpointStatusHandler handler(broken, broken, hub.client, MockDockerHub::endpoints());

        auto response = handler.handle("1");
        REQUIRE(response.status == 500);
        REQUIRE(parseBody(response)["details"].as<std::string>() == "database is locked");
    }

    SECTION("Credentials") {
        auto store = YamlDataStore::fromString(STORE);
        BrokenStore broken;
        EndpointStatusHandler handler(store, broken, hub.client, MockDockerHub::endpoints());

        auto response = handler.handle("1");
        REQUIRE(response.status == 500);
        REQUIRE(parseBody(response)["message"].as<std::string>() ==
            "Unable to retrieve DockerHub details from the database");
    }

    REQUIRE(hub.tokenRequestCount == 0);
}

TEST_CASE("Upstream failures are server errors without partial payload", "[status-handler]") {
    MockDockerHub hub;
    auto store = YamlDataStore::fromString(STORE);
    EndpointStatusHandler handler(store, store, hub.client, MockDockerHub::endpoints());

    SECTION("Rejected credentials") {
        hub.tokenStatus = 401;
        auto response = handler.handle("1");
        REQUIRE(response.status == 500);

        auto body = parseBody(response);
        REQUIRE(body["message"].as<std::string>() == "Unable to retrieve DockerHub token from DockerHub");
        REQUIRE_THAT(body["details"].as<std::string>(), ContainsSubstring("rejected the credentials"));
        REQUIRE_FALSE(body["remaining"]);
        REQUIRE(hub.rateLimitRequestCount == 0);
    }

    SECTION("Auth service outage") {
        hub.tokenStatus = 502;
        auto response = handler.handle("1");
        REQUIRE(response.status == 500);
        REQUIRE(parseBody(response)["details"].as<std::string>() == "failed fetching dockerhub token");
    }

    SECTION("Missing header") {
        hub.rateLimitHeaders.erase("RateLimit-Remaining");
        auto response = handler.handle("1");
        REQUIRE(response.status == 500);

        auto body = parseBody(response);
        REQUIRE(body["message"].as<std::string>() == "Unable to retrieve DockerHub rate limits from DockerHub");
        REQUIRE_THAT(body["details"].as<std::string>(), ContainsSubstring("RateLimit-Remaining"));
        REQUIRE_FALSE(body["limit"]);
    }

    SECTION("Registry status") {
        hub.rateLimitStatus = 503;
        auto response = handler.handle("1");
        REQUIRE(response.status == 500);
        REQUIRE(hub.tokenRequestCount == 1);

        auto body = parseBody(response);
        REQUIRE(body["message"].as<std::string>() == "Unable to retrieve DockerHub rate limits from DockerHub");
        REQUIRE(body["details"].as<std::string>() == "failed fetching dockerhub limits");
    }
}

TEST_CASE("Registry URLs are resolved from the store on every request", "[status-handler][registry]") {
    MockDockerHub hub;
    auto store = YamlDataStore::fromString(STORE);
    SwitchingRegistryStore registryStore;
    registryStore.current = MockDockerHub::endpoints();
    EndpointStatusHandler handler(store, registryStore, hub.client);

    REQUIRE(handler.handle("1").status == 200);
    REQUIRE(hub.lastTokenUrl == MockDockerHub::TOKEN_URL);
    REQUIRE(hub.lastRateLimitUrl == MockDockerHub::RATE_LIMIT_URL);

    registryStore.current.tokenUrl = "http://auth2.test/token";
    registryStore.current.rateLimitUrl = "http://registry2.test/v2/x/manifests/latest";

    REQUIRE(handler.handle("1").status == 200);
    REQUIRE(hub.lastTokenUrl == "http://auth2.test/token");
    REQUIRE(hub.lastRateLimitUrl == "http://registry2.test/v2/x/manifests/latest");
}

TEST_CASE("A fixed registry overrides the store", "[status-handler][registry]") {
    MockDockerHub hub;
    auto store = YamlDataStore::fromString(STORE);
    SwitchingRegistryStore registryStore;
    registryStore.current.tokenUrl = "http://unused.test/token";
    EndpointStatusHandler handler(store, registryStore, hub.client, MockDockerHub::endpoints());

    REQUIRE(handler.handle("1").status == 200);
    REQUIRE(hub.lastTokenUrl == MockDockerHub::TOKEN_URL);
}
