#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace hubhttp
{

struct URLError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Absolute http(s) URL, split into the parts an HTTP client
 * needs to open a connection and issue a request.
 * The query string is kept verbatim (no decoding/re-encoding).
 */
struct URLComponents
{
    std::string scheme;
    std::string host;
    std::uint16_t port = 0u;
    std::string path;
    std::string query;

    /**
     * Split an absolute URL of the form scheme://host[:port][/path][?query][#fragment].
     *
     * Throws URLError.
     */
    static URLComponents parse(std::string const& url);

    std::string build() const;     /* Full URL */
    std::string buildPath() const; /* Path + query, "/" if the path is empty */
    std::string buildHost() const; /* Scheme + host + optional port */
};

}
