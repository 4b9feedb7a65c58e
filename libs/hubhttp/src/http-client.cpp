#include "http-client.hpp"

#include <httplib.h>

#include <cstdlib>
#include <iostream>
#include <memory>

namespace
{

hubhttp::IHttpClient::Result makeResult(httplib::Result&& result)
{
    hubhttp::IHttpClient::Result out;
    if (!result) {
        hubhttp::log().debug("  ... no response: {}", httplib::to_string(result.error()));
        return out;
    }

    out.status = result->status;
    out.content = std::move(result->body);
    out.headers.insert(result->headers.begin(), result->headers.end());
    hubhttp::log().debug("  ... status {}", out.status);
    return out;
}

auto makeClient(
    hubhttp::URLComponents const& url,
    hubhttp::Config const& config,
    time_t timeoutSecs,
    bool sslCertStrict)
{
    auto client = std::make_unique<httplib::Client>(url.buildHost());
    client->enable_server_certificate_verification(sslCertStrict);
    client->set_connection_timeout(timeoutSecs);
    client->set_read_timeout(timeoutSecs);
    client->set_follow_location(true);
    config.apply(*client);
    return client;
}

}

namespace hubhttp
{

using Result = IHttpClient::Result;

std::string IHttpClient::Result::header(std::string const& name) const
{
    auto it = findFirstHeader(headers, name);
    return it != headers.end() ? it->second : std::string();
}

HttpLibHttpClient::HttpLibHttpClient()
{
    if (auto timeoutStr = std::getenv("HUBLIMIT_HTTP_TIMEOUT")) {
        try {
            timeoutSecs_ = std::stoll(timeoutStr);
        }
        catch (std::exception const&) {
            std::cerr << "Could not parse value of HUBLIMIT_HTTP_TIMEOUT." << std::endl;
        }
    }
    // Certificates are verified unless explicitly switched off.
    if (auto sslStrictStr = std::getenv("HUBLIMIT_HTTP_SSL_STRICT")) {
        std::string value(sslStrictStr);
        sslCertStrict_ = !(value == "0" || value == "false" || value == "off" || value == "no");
    }
}

Result HttpLibHttpClient::get(std::string const& urlStr,
                              Config const& config)
{
    auto url = URLComponents::parse(urlStr);
    log().debug("GET {}", urlStr);
    return makeResult(
        makeClient(url, config, timeoutSecs_, sslCertStrict_)->Get(url.buildPath()));
}

Result HttpLibHttpClient::head(std::string const& urlStr,
                               Config const& config)
{
    auto url = URLComponents::parse(urlStr);
    log().debug("HEAD {}", urlStr);
    return makeResult(
        makeClient(url, config, timeoutSecs_, sslCertStrict_)->Head(url.buildPath()));
}

Result MockHttpClient::get(std::string const& url,
                           Config const& config)
{
    if (getFun)
        return getFun(url, config);
    return {};
}

Result MockHttpClient::head(std::string const& url,
                            Config const& config)
{
    if (headFun)
        return headFun(url, config);
    return {};
}

}
