#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <variant>

#include "dockerhub-client.hpp"
#include "yaml-cpp/yaml.h"

namespace hublimit
{

using EndpointID = int;

/**
 * Kind of container environment an endpoint manages.
 */
enum class EndpointType : int
{
    DockerEnvironment = 1,
    AgentOnDockerEnvironment = 2,
    AzureEnvironment = 3,
    EdgeAgentOnDockerEnvironment = 4,
    KubernetesLocalEnvironment = 5,
    AgentOnKubernetesEnvironment = 6,
    EdgeAgentOnKubernetesEnvironment = 7
};

struct Endpoint
{
    EndpointID id = 0;
    std::string name;
    std::string url;
    EndpointType type = EndpointType::DockerEnvironment;
};

struct EndpointNotFound {};

struct StoreFailure
{
    std::string message;
};

/**
 * Result of an endpoint lookup. Callers dispatch on the
 * alternative instead of comparing error identities.
 */
using EndpointLookup = std::variant<Endpoint, EndpointNotFound, StoreFailure>;

class IEndpointStore
{
public:
    virtual ~IEndpointStore() = default;
    virtual EndpointLookup endpoint(EndpointID id) const = 0;
};

class IDockerHubStore
{
public:
    virtual ~IDockerHubStore() = default;

    /**
     * Stored DockerHub account. Throws hublimit::Error on failure.
     */
    virtual DockerHubCredentials dockerHub() const = 0;

    /**
     * Registry URLs to query, read again for every request.
     * Throws hublimit::Error on failure.
     */
    virtual RegistryEndpoints registry() const { return {}; }
};

/**
 * Endpoint and DockerHub store backed by a YAML document:
 *
 *   endpoints:
 *     - {id: 1, name: local, url: "unix:///var/run/docker.sock", type: 1}
 *   dockerhub:
 *     authentication: true
 *     username: someone
 *     password: secret        # or `keychain: <service>`
 *   registry:                 # optional
 *     token-url: ...
 *     rate-limit-url: ...
 *
 * A file-backed store re-reads the file whenever its modification
 * time changes, so edits are picked up without a restart.
 */
class YamlDataStore : public IEndpointStore, public IDockerHubStore
{
public:
    /**
     * File-backed store. The file is read on first access.
     */
    explicit YamlDataStore(std::filesystem::path path);

    /**
     * Store holding a fixed YAML document.
     * Throws hublimit::Error if the document is malformed.
     */
    static YamlDataStore fromString(std::string const& yaml);

    /**
     * File-backed store for the path in HUBLIMIT_DATA_FILE.
     * Throws hublimit::Error if the variable is not set.
     */
    static YamlDataStore fromEnvironment();

    YamlDataStore(YamlDataStore&& other);

    EndpointLookup endpoint(EndpointID id) const override;
    DockerHubCredentials dockerHub() const override;

    /**
     * Registry URLs, defaulting to the public DockerHub ones.
     */
    RegistryEndpoints registry() const override;

private:
    struct Snapshot
    {
        std::map<EndpointID, Endpoint> endpoints;
        DockerHubCredentials dockerHub;
        RegistryEndpoints registry;
    };

    explicit YamlDataStore(Snapshot snapshot);

    static Snapshot parse(YAML::Node const& document);

    /**
     * Re-read the backing file if it changed and return a copy
     * of the current contents. Throws hublimit::Error.
     */
    Snapshot current() const;

    std::optional<std::filesystem::path> path_;
    mutable std::optional<std::filesystem::file_time_type> lastWrite_;
    mutable Snapshot snapshot_;
    mutable std::shared_mutex mutex_;
};

}
