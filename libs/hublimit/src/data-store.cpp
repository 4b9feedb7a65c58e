#include "data-store.hpp"
#include "errors.hpp"

#include <cstdlib>
#include <mutex>

#include "hubhttp/log.hpp"
#include "spdlog/fmt/fmt.h"

using hubhttp::log;
using namespace hublimit;

namespace YAML
{

template <>
struct convert<Endpoint>
{
    static bool decode(const Node& node, Endpoint& e)
    {
        if (!node.IsMap() || !node["id"] || !node["url"])
            return false;

        e.id = node["id"].as<EndpointID>();
        e.url = node["url"].as<std::string>();
        if (auto name = node["name"])
            e.name = name.as<std::string>();

        auto type = node["type"] ? node["type"].as<int>() : 1;
        if (type < static_cast<int>(EndpointType::DockerEnvironment) ||
            type > static_cast<int>(EndpointType::EdgeAgentOnKubernetesEnvironment))
            return false;
        e.type = static_cast<EndpointType>(type);
        return true;
    }
};

template <>
struct convert<DockerHubCredentials>
{
    static bool decode(const Node& node, DockerHubCredentials& c)
    {
        if (!node.IsMap())
            return false;

        if (auto authentication = node["authentication"])
            c.authentication = authentication.as<bool>();
        if (auto username = node["username"])
            c.username = username.as<std::string>();
        if (auto password = node["password"])
            c.password = password.as<std::string>();
        else if (auto keychain = node["keychain"])
            c.keychain = keychain.as<std::string>();

        // Authentication without a user makes no sense.
        return !c.authentication || !c.username.empty();
    }
};

}

YamlDataStore::YamlDataStore(std::filesystem::path path)
    : path_(std::move(path))
{}

YamlDataStore::YamlDataStore(Snapshot snapshot)
    : snapshot_(std::move(snapshot))
{}

YamlDataStore::YamlDataStore(YamlDataStore&& other)
{
    std::unique_lock lock(other.mutex_);
    path_ = std::move(other.path_);
    lastWrite_ = std::move(other.lastWrite_);
    snapshot_ = std::move(other.snapshot_);
}

YamlDataStore YamlDataStore::fromString(std::string const& yaml)
{
    try {
        return YamlDataStore(parse(YAML::Load(yaml)));
    }
    catch (YAML::Exception const& e) {
        throw hubhttp::logRuntimeError<Error>(
            fmt::format("Failed to parse data store: {}", e.what()));
    }
}

YamlDataStore YamlDataStore::fromEnvironment()
{
    auto dataFile = std::getenv("HUBLIMIT_DATA_FILE");
    if (!dataFile || std::string(dataFile).empty())
        throw hubhttp::logRuntimeError<Error>("HUBLIMIT_DATA_FILE environment variable is empty.");
    return YamlDataStore(std::filesystem::path(dataFile));
}

YamlDataStore::Snapshot YamlDataStore::parse(YAML::Node const& document)
{
    Snapshot result;
    if (!document.IsDefined() || document.IsNull())
        return result;
    if (!document.IsMap())
        throw Error("Data store document must be a map");

    if (auto endpoints = document["endpoints"]) {
        for (auto const& node : endpoints) {
            auto endpoint = node.as<Endpoint>();
            result.endpoints[endpoint.id] = endpoint;
        }
    }

    if (auto dockerHub = document["dockerhub"])
        result.dockerHub = dockerHub.as<DockerHubCredentials>();

    if (auto registry = document["registry"]) {
        if (auto tokenUrl = registry["token-url"])
            result.registry.tokenUrl = tokenUrl.as<std::string>();
        if (auto rateLimitUrl = registry["rate-limit-url"])
            result.registry.rateLimitUrl = rateLimitUrl.as<std::string>();
    }

    return result;
}

YamlDataStore::Snapshot YamlDataStore::current() const
{
    if (!path_) {
        std::shared_lock lock(mutex_);
        return snapshot_;
    }

    std::error_code ec;
    auto lastWrite = std::filesystem::last_write_time(*path_, ec);
    if (ec)
        throw hubhttp::logRuntimeError<Error>(
            fmt::format("Cannot access data store '{}': {}", path_->string(), ec.message()));

    {
        std::shared_lock lock(mutex_);
        if (lastWrite_ && *lastWrite_ == lastWrite)
            return snapshot_;
    }

    std::unique_lock lock(mutex_);
    if (lastWrite_ && *lastWrite_ == lastWrite)
        return snapshot_;

    log().debug("Loading data store from '{}'...", path_->string());
    try {
        snapshot_ = parse(YAML::LoadFile(path_->string()));
    }
    catch (YAML::Exception const& e) {
        throw hubhttp::logRuntimeError<Error>(
            fmt::format("Failed to read data store '{}': {}", path_->string(), e.what()));
    }
    lastWrite_ = lastWrite;
    log().debug("  ...Done ({} endpoints).", snapshot_.endpoints.size());
    return snapshot_;
}

EndpointLookup YamlDataStore::endpoint(EndpointID id) const
{
    Snapshot snapshot;
    try {
        snapshot = current();
    }
    catch (Error const& e) {
        return StoreFailure{e.what()};
    }

    auto it = snapshot.endpoints.find(id);
    if (it == snapshot.endpoints.end())
        return EndpointNotFound{};
    return it->second;
}

DockerHubCredentials YamlDataStore::dockerHub() const
{
    return current().dockerHub;
}

RegistryEndpoints YamlDataStore::registry() const
{
    return current().registry;
}
