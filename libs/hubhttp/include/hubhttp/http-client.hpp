#pragma once

#include <ctime>
#include <functional>
#include <string>
#include <string_view>

#include "http-settings.hpp"
#include "url.hpp"
#include "log.hpp"

namespace hubhttp
{

/**
 * Shared outbound HTTP transport. Implementations must be safe
 * to call from several threads at once.
 */
class IHttpClient
{
public:

    /**
     * Response of one request. A status of 0 means that no
     * response was received at all (DNS, connect, TLS or timeout).
     */
    struct Result {
        int status = 0;
        std::string content;
        Headers headers;

        /**
         * Value of the first header with the given name,
         * or an empty string. Lookup is case-insensitive.
         */
        std::string header(std::string const& name) const;
    };

    virtual ~IHttpClient() = default;

    virtual Result get(std::string const& url,
                       Config const& config) = 0;
    virtual Result head(std::string const& url,
                        Config const& config) = 0;
};

class HttpLibHttpClient : public IHttpClient
{
public:
    HttpLibHttpClient();

    Result get(std::string const& url,
               Config const& config) override;
    Result head(std::string const& url,
                Config const& config) override;

    time_t timeoutSecs() const { return timeoutSecs_; }
    bool sslCertStrict() const { return sslCertStrict_; }

private:
    time_t timeoutSecs_ = 30;
    bool sslCertStrict_ = true;
};

class MockHttpClient : public IHttpClient
{
public:
    std::function<
        IHttpClient::Result(std::string_view /* url */, Config const& /* config */)
    > getFun;
    std::function<
        IHttpClient::Result(std::string_view /* url */, Config const& /* config */)
    > headFun;

    Result get(std::string const& url,
               Config const& config) override;
    Result head(std::string const& url,
                Config const& config) override;
};

}
