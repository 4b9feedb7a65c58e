#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "yaml-cpp/yaml.h"

namespace hubhttp
{

/**
 * Orders header names case-insensitively, as HTTP requires.
 */
struct HeaderNameLess
{
    bool operator()(std::string const& a, std::string const& b) const;
};

using Headers = std::multimap<std::string, std::string, HeaderNameLess>;

/**
 * First value received under the given header name, or end().
 */
Headers::const_iterator findFirstHeader(Headers const& headers, std::string const& name);

/**
 * Set of configs for an outbound HTTP request, including:
 *   - Extra Headers
 *   - Optional Basic-Auth
 *   - Optional Proxy-Config
 */
struct Config
{
    Config() = default;
    explicit Config(std::string const& yamlConf);

    struct BasicAuthentication {
        std::string user;
        std::string password;
        std::string keychain;
    };

    struct Proxy {
        std::string host;
        int port = 0;
        std::string user;
        std::string password;
        std::string keychain;
    };

    std::optional<std::string> scope;
    std::regex urlPattern;
    std::string urlPatternString;

    Headers headers;
    std::optional<BasicAuthentication> auth;
    std::optional<Proxy> proxy;

    /**
     * Merge this configuration with another. Values from `other` win.
     */
    Config& operator |= (Config const& other);

    /**
     * Apply this configuration to an httplib client.
     * May read keychain passwords which can block.
     */
    void apply(httplib::Client& cl) const;

    /**
     * Convert this configuration to a YAML string, which may
     * be passed to the respective `Config(yamlConf)` constructor.
     */
    std::string toYaml() const;

    /**
     * Human-readable summary for logging. Passwords and
     * Authorization header values are masked.
     */
    std::string toSafeString() const;
};

/**
 * Loads settings from HUBLIMIT_HTTP_SETTINGS_FILE.
 * Allows returning the merged config for a specific URL.
 */
struct Settings
{
    Settings();

    void load();

    /**
     * Get aggregated configuration for the given URL.
     */
    Config operator[](std::string const& url) const;

    std::deque<Config> settings;
    mutable std::shared_mutex mutex;
};

struct secret
{
    /**
     * Read password from system keychain. Returns an empty
     * string if the keychain does not answer within one minute;
     * the abandoned lookup keeps running on a detached thread.
     */
    static std::string load(
        std::string const& service,
        std::string const& user);
};

}
