#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace hublimit
{

/**
 * Base of every error raised by hublimit.
 */
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/*
 * Errors raised by the outbound calls and the header parser.
 */

/** The request could not be sent or no response was received. */
struct TransportError : Error {
    using Error::Error;
};

/** The upstream answered with a status other than 200. */
struct UnexpectedStatusError : Error {
    UnexpectedStatusError(int status, std::string const& message);

    int status;

    /** True for 401/403, i.e. the upstream refused the credentials. */
    bool rejectedCredentials() const;
};

/** The token response body is not the expected JSON object. */
struct DecodeError : Error {
    using Error::Error;
};

/** A required response header is absent or empty. */
struct MissingHeaderError : Error {
    explicit MissingHeaderError(std::string header);

    std::string header;
};

/** A header value does not start with a non-negative base-10 integer. */
struct ParseError : Error {
    ParseError(std::string value, std::string const& message);

    std::string value;
};

/*
 * Step-level errors. The pipeline and the request handler raise these
 * with std::throw_with_nested, so the low-level cause stays attached.
 */

struct UpstreamAuthError : Error {
    using Error::Error;
};

struct UpstreamRateLimitError : Error {
    using Error::Error;
};

/** A rate-limit header was missing or malformed. */
struct UpstreamProtocolError : UpstreamRateLimitError {
    UpstreamProtocolError(std::string header, std::string const& message);

    std::string header;
};

struct InvalidInputError : Error {
    using Error::Error;
};

struct NotFoundError : Error {
    using Error::Error;
};

struct UnsupportedEndpointTypeError : Error {
    using Error::Error;
};

/**
 * Flatten an exception and its nested causes into
 * "outer: inner: innermost".
 */
std::string describe(std::exception const& e);

/**
 * Copy of the first exception of type T in the nested chain of e
 * (e itself included), or nullopt if there is none.
 */
template <typename T>
std::optional<T> findCause(std::exception const& e)
{
    if (auto match = dynamic_cast<T const*>(&e))
        return *match;
    try {
        std::rethrow_if_nested(e);
    }
    catch (std::exception const& inner) {
        return findCause<T>(inner);
    }
    return std::nullopt;
}

}
