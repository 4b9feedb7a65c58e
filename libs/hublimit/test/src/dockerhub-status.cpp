#include <catch2/catch_all.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

#include "hublimit/dockerhub-client.hpp"
#include "hublimit/errors.hpp"
#include "mock-dockerhub.hpp"

using namespace hublimit;

TEST_CASE("DockerHub status is fetched end-to-end", "[dockerhub-status]") {
    MockDockerHub hub;

    auto status = getDockerHubStatus(hub.client, {}, MockDockerHub::endpoints());

    REQUIRE(status.remaining == 17);
    REQUIRE(status.limit == 100);
    REQUIRE(hub.tokenRequestCount == 1);
    REQUIRE(hub.rateLimitRequestCount == 1);
    REQUIRE(hub.lastBearer() == "Bearer abc123");
    REQUIRE(toJson(status) == R"({"remaining": 17, "limit": 100})");
}

TEST_CASE("A rejected token request never reaches the registry", "[dockerhub-status]") {
    MockDockerHub hub;
    hub.tokenStatus = 401;

    try {
        getDockerHubStatus(hub.client, {true, "alice", "wrong", ""}, MockDockerHub::endpoints());
        FAIL("expected UpstreamAuthError");
    }
    catch (UpstreamAuthError const& e) {
        REQUIRE(std::string(e.what()) == "Unable to retrieve DockerHub token from DockerHub");
        auto cause = findCause<UnexpectedStatusError>(e);
        REQUIRE(cause);
        REQUIRE(cause->status == 401);
    }

    REQUIRE(hub.tokenRequestCount == 1);
    REQUIRE(hub.rateLimitRequestCount == 0);
}

TEST_CASE("Undecodable token is an auth failure", "[dockerhub-status]") {
    MockDockerHub hub;
    hub.tokenBody = "<html>";

    REQUIRE_THROWS_AS(
        getDockerHubStatus(hub.client, {}, MockDockerHub::endpoints()), UpstreamAuthError);
    REQUIRE(hub.rateLimitRequestCount == 0);
}

TEST_CASE("No partial status is returned", "[dockerhub-status]") {
    MockDockerHub hub;
    hub.rateLimitHeaders.erase("RateLimit-Remaining");

    std::optional<RateLimitStatus> status;
    REQUIRE_THROWS_AS(
        status = getDockerHubStatus(hub.client, {}, MockDockerHub::endpoints()),
        UpstreamProtocolError);
    REQUIRE_FALSE(status);
}

TEST_CASE("Registry failures are rate-limit errors", "[dockerhub-status]") {
    MockDockerHub hub;
    hub.rateLimitStatus = 500;

    try {
        getDockerHubStatus(hub.client, {}, MockDockerHub::endpoints());
        FAIL("expected UpstreamRateLimitError");
    }
    catch (UpstreamProtocolError const&) {
        FAIL("status errors are not protocol errors");
    }
    catch (UpstreamRateLimitError const& e) {
        REQUIRE(describe(e) ==
            "Unable to retrieve DockerHub rate limits from DockerHub: failed fetching dockerhub limits");
    }
}

TEST_CASE("Per-URL HTTP settings are applied to both calls", "[dockerhub-status][settings]") {
    namespace fs = std::filesystem;
    auto file = fs::temp_directory_path() / ("hublimit_settings_" + std::to_string(std::rand()) + ".yml");
    {
        std::ofstream os(file);
        os << "http-settings:\n"
              "  - scope: http://auth.test\n"
              "    proxy: {host: proxy.local, port: 3128}\n"
              "  - scope: http://*.test\n"
              "    headers: {User-Agent: hublimit}\n";
    }
    setenv("HUBLIMIT_HTTP_SETTINGS_FILE", file.string().c_str(), 1);
    hubhttp::Settings settings;
    unsetenv("HUBLIMIT_HTTP_SETTINGS_FILE");
    fs::remove(file);

    MockDockerHub hub;
    auto status = getDockerHubStatus(hub.client, {}, MockDockerHub::endpoints(), settings);

    REQUIRE(status.limit == 100);
    REQUIRE(hub.lastTokenConfig.proxy);
    REQUIRE(hub.lastTokenConfig.headers.count("User-Agent") == 1);
    REQUIRE_FALSE(hub.lastRateLimitConfig.proxy);
    REQUIRE(hub.lastRateLimitConfig.headers.count("User-Agent") == 1);
}
