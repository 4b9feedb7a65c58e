#include "http-settings.hpp"
#include "log.hpp"

#ifdef HUBLIMIT_KEYCHAIN_SUPPORT
#include <keychain/keychain.h>
#endif

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>


using namespace hubhttp;
using namespace std::string_literals;

#ifdef HUBLIMIT_KEYCHAIN_SUPPORT
static const std::chrono::minutes KEYCHAIN_TIMEOUT{1};
static const char* KEYCHAIN_PACKAGE = "lib.hublimit.dockerhub";
#endif

namespace YAML
{

template <>
struct convert<Config::BasicAuthentication>
{
    static Node encode(const Config::BasicAuthentication& a)
    {
        Node node;
        node["user"] = a.user;
        if (!a.password.empty())
            node["password"] = a.password;
        else if (!a.keychain.empty())
            node["keychain"] = a.keychain;
        return node;
    }

    static bool decode(const Node& node, Config::BasicAuthentication& a)
    {
        if (!node.IsMap() || !node["user"])
            return false;

        a.user = node["user"].as<std::string>();
        if (auto password = node["password"])
            a.password = password.as<std::string>();
        else if (auto keychain = node["keychain"])
            a.keychain = keychain.as<std::string>();
        else
            return false;
        return true;
    }
};

template <>
struct convert<Config::Proxy>
{
    static Node encode(const Config::Proxy& p)
    {
        Node node;
        node["host"] = p.host;
        node["port"] = p.port;
        if (!p.user.empty()) {
            node["user"] = p.user;
            if (!p.password.empty())
                node["password"] = p.password;
            else if (!p.keychain.empty())
                node["keychain"] = p.keychain;
        }
        return node;
    }

    static bool decode(const Node& node, Config::Proxy& p)
    {
        if (!node.IsMap() || !node["host"] || !node["port"])
            return false;

        p.host = node["host"].as<std::string>();
        p.port = node["port"].as<int>();

        if (auto user = node["user"]) {
            p.user = user.as<std::string>();
            if (auto password = node["password"])
                p.password = password.as<std::string>();
            else if (auto keychain = node["keychain"])
                p.keychain = keychain.as<std::string>();
            else
                return false;
        }
        return true;
    }
};

}

namespace
{

/**
 * Turn a scope glob like `https://*.docker.io` into an anchored
 * regex. `*` matches anything, everything else is literal.
 */
std::string globToRegex(std::string const& scope)
{
    static const std::string special = "\\^$|()[]{}?+-!.";

    std::string pattern = "^";
    for (char c : scope) {
        if (c == '*')
            pattern += ".*";
        else {
            if (special.find(c) != std::string::npos)
                pattern += '\\';
            pattern += c;
        }
    }
    return pattern + ".*$";
}

YAML::Node configToNode(Config const& config)
{
    YAML::Node result;
    if (config.scope)
        result["scope"] = *config.scope;
    else
        result["url"] = config.urlPatternString;

    if (!config.headers.empty())
        result["headers"] =
            std::map<std::string, std::string>{config.headers.begin(), config.headers.end()};

    if (config.auth)
        result["basic-auth"] = *config.auth;

    if (config.proxy)
        result["proxy"] = *config.proxy;

    return result;
}

Config configFromNode(YAML::Node const& node)
{
    Config conf;

    if (auto url = node["url"]) {
        conf.urlPatternString = url.as<std::string>();
    }
    else {
        conf.scope = node["scope"] ? node["scope"].as<std::string>() : "*"s;
        conf.urlPatternString = globToRegex(*conf.scope);
    }
    conf.urlPattern = conf.urlPatternString;

    if (auto headers = node["headers"]) {
        auto headerMap = headers.as<std::map<std::string, std::string>>();
        conf.headers.insert(headerMap.begin(), headerMap.end());
    }

    if (auto basicAuth = node["basic-auth"])
        conf.auth = basicAuth.as<Config::BasicAuthentication>();

    if (auto proxy = node["proxy"])
        conf.proxy = proxy.as<Config::Proxy>();

    return conf;
}

bool isSensitiveHeader(std::string const& name)
{
    HeaderNameLess less;
    for (auto const* sensitive : {"Authorization", "Proxy-Authorization", "Cookie"}) {
        if (!less(name, sensitive) && !less(sensitive, name))
            return true;
    }
    return false;
}

std::string resolvePassword(std::string const& password,
                            std::string const& keychain,
                            std::string const& user)
{
    if (!keychain.empty())
        return secret::load(keychain, user);
    return password;
}

}

bool HeaderNameLess::operator()(std::string const& a, std::string const& b) const
{
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char l, unsigned char r) { return std::tolower(l) < std::tolower(r); });
}

Headers::const_iterator findFirstHeader(Headers const& headers, std::string const& name)
{
    auto it = headers.lower_bound(name);
    if (it == headers.end() || headers.key_comp()(name, it->first))
        return headers.end();
    return it;
}

std::string secret::load(
    std::string const& service,
    std::string const& user)
{
#ifdef HUBLIMIT_KEYCHAIN_SUPPORT
    log().debug("Loading secret (service={}, user={}) ...", service, user);
    // The lookup thread is detached so that a hung keychain does not
    // block the caller past the timeout; it owns the shared promise.
    auto promise = std::make_shared<std::promise<std::string>>();
    auto result = promise->get_future();
    std::thread([promise, service, user]() {
        try {
            keychain::Error error;
            auto password = keychain::getPassword(KEYCHAIN_PACKAGE, service, user, error);
            if (error)
                throw std::runtime_error(error.message);
            promise->set_value(std::move(password));
        }
        catch (std::exception const&) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(KEYCHAIN_TIMEOUT) == std::future_status::timeout) {
        log().warn("  ... Keychain timed out.");
        return {};
    }

    log().debug("  ...OK.");
    return result.get();
#else
    throw std::runtime_error("[secret::load] hublimit was compiled with HUBLIMIT_KEYCHAIN_SUPPORT OFF.");
#endif
}

Settings::Settings()
{
    load();
}

void Settings::load()
{
    std::unique_lock lock(mutex);
    settings.clear();

    auto settingsFile = std::getenv("HUBLIMIT_HTTP_SETTINGS_FILE");
    if (!settingsFile || std::string(settingsFile).empty()) {
        log().debug("HUBLIMIT_HTTP_SETTINGS_FILE environment variable is empty.");
        return;
    }

    if (!std::filesystem::is_regular_file(settingsFile)) {
        log().debug("The HUBLIMIT_HTTP_SETTINGS_FILE path '{}' is not a file.", settingsFile);
        return;
    }

    try {
        log().debug("Loading HTTP settings from '{}'...", settingsFile);
        auto document = YAML::LoadFile(settingsFile);
        auto entries = document["http-settings"];
        if (!entries.IsDefined()) {
            log().debug("No 'http-settings' section found in '{}'.", settingsFile);
            return;
        }

        for (auto const& entry : entries.as<std::vector<YAML::Node>>())
            settings.emplace_back(configFromNode(entry));

        log().debug("  ...Done ({} entries).", settings.size());
    }
    catch (std::exception const& e) {
        log().error("Failed to read http-settings from '{}': {}", settingsFile, e.what());
    }
}

Config Settings::operator[] (std::string const& url) const
{
    std::shared_lock lock(mutex);

    Config result;
    for (auto const& config : settings) {
        if (std::regex_match(url, config.urlPattern))
            result |= config;
    }
    return result;
}

Config::Config(std::string const& yamlConf)
{
    *this = configFromNode(YAML::Load(yamlConf));
}

Config& Config::operator |= (Config const& other)
{
    // Later entries override headers of the same name.
    for (auto const& header : other.headers)
        headers.erase(header.first);
    headers.insert(other.headers.begin(), other.headers.end());
    if (other.auth)
        auth = other.auth;
    if (other.proxy)
        proxy = other.proxy;
    return *this;
}

void Config::apply(httplib::Client& cl) const
{
    httplib::Headers httpLibHeaders{headers.begin(), headers.end()};

    if (auth) {
        httpLibHeaders.insert(httplib::make_basic_authentication_header(
            auth->user, resolvePassword(auth->password, auth->keychain, auth->user)));
    }

    if (proxy) {
        cl.set_proxy(proxy->host, proxy->port);
        if (!proxy->user.empty())
            cl.set_proxy_basic_auth(
                proxy->user, resolvePassword(proxy->password, proxy->keychain, proxy->user));
    }

    cl.set_default_headers(httpLibHeaders);
}

std::string Config::toYaml() const
{
    return YAML::Dump(configToNode(*this));
}

std::string Config::toSafeString() const
{
    static const std::string masked = "***";

    std::ostringstream out;
    out << (scope ? "scope=" + *scope : "url=" + urlPatternString);

    for (auto const& [name, value] : headers) {
        out << ", header " << name << "=" << (isSensitiveHeader(name) ? masked : value);
    }

    if (auth) {
        out << ", basic-auth user=" << auth->user
            << (auth->keychain.empty() ? " password=" + masked : " keychain=" + auth->keychain);
    }

    if (proxy) {
        out << ", proxy " << proxy->host << ":" << proxy->port;
        if (!proxy->user.empty())
            out << " user=" << proxy->user << " password=" << masked;
    }

    return out.str();
}
