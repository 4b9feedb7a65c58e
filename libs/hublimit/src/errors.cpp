#include "errors.hpp"

namespace hublimit
{

UnexpectedStatusError::UnexpectedStatusError(int status, std::string const& message)
    : Error(message)
    , status(status)
{}

bool UnexpectedStatusError::rejectedCredentials() const
{
    return status == 401 || status == 403;
}

MissingHeaderError::MissingHeaderError(std::string header)
    : Error("Missing " + header + " header")
    , header(std::move(header))
{}

ParseError::ParseError(std::string value, std::string const& message)
    : Error(message)
    , value(std::move(value))
{}

UpstreamProtocolError::UpstreamProtocolError(std::string header, std::string const& message)
    : UpstreamRateLimitError(message)
    , header(std::move(header))
{}

std::string describe(std::exception const& e)
{
    std::string result = e.what();
    try {
        std::rethrow_if_nested(e);
    }
    catch (std::exception const& inner) {
        result += ": " + describe(inner);
    }
    return result;
}

}
