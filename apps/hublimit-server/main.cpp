#include <httplib.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "hubhttp/http-client.hpp"
#include "hubhttp/http-settings.hpp"
#include "hubhttp/log.hpp"
#include "hublimit/data-store.hpp"
#include "hublimit/errors.hpp"
#include "hublimit/status-handler.hpp"

using hubhttp::log;

namespace
{

std::string envOr(char const* name, std::string fallback)
{
    if (auto value = std::getenv(name); value && *value)
        return value;
    return fallback;
}

}

int main(int argc, char const* argv[])
{
    if (argc > 1) {
        std::cerr << "Usage: " << argv[0] << std::endl
                  << "Configured through HUBLIMIT_DATA_FILE, HUBLIMIT_LISTEN_HOST, HUBLIMIT_LISTEN_PORT," << std::endl
                  << "HUBLIMIT_HTTP_SETTINGS_FILE, HUBLIMIT_HTTP_TIMEOUT and HUBLIMIT_LOG_LEVEL." << std::endl;
        return 1;
    }

    auto host = envOr("HUBLIMIT_LISTEN_HOST", "0.0.0.0");
    int port = 0;
    try {
        port = std::stoi(envOr("HUBLIMIT_LISTEN_PORT", "9000"));
    }
    catch (std::exception const&) {
        log().error("Could not parse value of HUBLIMIT_LISTEN_PORT.");
        return 1;
    }

    std::optional<hublimit::YamlDataStore> store;
    try {
        store.emplace(hublimit::YamlDataStore::fromEnvironment());
        // Fail early on an unreadable store instead of on the first request.
        store->dockerHub();
    }
    catch (hublimit::Error const& e) {
        log().error("Cannot open data store: {}", e.what());
        return 1;
    }

    hubhttp::HttpLibHttpClient httpClient;
    hubhttp::Settings httpSettings;
    hublimit::EndpointStatusHandler handler(
        *store, *store, httpClient, std::nullopt, &httpSettings);

    httplib::Server server;
    auto const route = R"(/api/endpoints/([^/]+)/dockerhub/status)";
    server.Get(route,
        [&handler](httplib::Request const& req, httplib::Response& res) {
            auto response = handler.handle(req.matches[1].str());
            res.status = response.status;
            res.set_content(response.body, response.contentType);
        });

    auto methodNotAllowed = [](httplib::Request const&, httplib::Response& res) {
        res.status = 405;
        res.set_header("Allow", "GET");
    };
    server.Post(route, methodNotAllowed);
    server.Put(route, methodNotAllowed);
    server.Patch(route, methodNotAllowed);
    server.Delete(route, methodNotAllowed);

    log().info("Listening on {}:{} (HTTP timeout {}s)", host, port, httpClient.timeoutSecs());
    if (!server.listen(host, port)) {
        log().error("Could not listen on {}:{}", host, port);
        return 1;
    }
    return 0;
}
