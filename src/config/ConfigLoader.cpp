#include "config/ConfigLoader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <initializer_list>
#include <set>
#include <string>

namespace chunkstash {
namespace config {

namespace {

void RejectUnknownKeys(const YAML::Node& node, const std::string& section,
                       std::initializer_list<const char*> allowed) {
    if (!node.IsMap()) {
        throw ConfigError((section.empty() ? std::string("configuration") : "'" + section + "'") +
                          " must be a mapping");
    }
    std::set<std::string> known(allowed.begin(), allowed.end());
    for (const auto& it : node) {
        const std::string key = it.first.Scalar();
        if (known.count(key) == 0) {
            const std::string qualified = section.empty() ? key : section + "." + key;
            throw ConfigError("unknown configuration key: " + qualified);
        }
    }
}

template <typename T>
void ReadScalar(const YAML::Node& parent, const char* key, const std::string& section, T& out) {
    const YAML::Node node = parent[key];
    if (!node) return;
    if (!node.IsScalar()) {
        throw ConfigError("'" + section + "." + key + "' must be a scalar");
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception&) {
        throw ConfigError("invalid value for '" + section + "." + key + "': " + node.Scalar());
    }
}

Config FromNode(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }

    RejectUnknownKeys(root, "", {"server", "storage", "rebuild"});

    if (const YAML::Node server = root["server"]) {
        RejectUnknownKeys(server, "server", {"bind_address"});
        ReadScalar(server, "bind_address", "server", config.server.bindAddress);
        // Validates host:port
        parseBindAddress(config.server.bindAddress);
    }

    if (const YAML::Node storage = root["storage"]) {
        RejectUnknownKeys(storage, "storage", {"chunk_root", "max_chunk_size"});
        ReadScalar(storage, "chunk_root", "storage", config.upload.chunkRoot);
        if (config.upload.chunkRoot.empty()) {
            throw ConfigError("'storage.chunk_root' must not be empty");
        }

        int64_t maxChunkSize = static_cast<int64_t>(config.upload.maxChunkSize);
        ReadScalar(storage, "max_chunk_size", "storage", maxChunkSize);
        if (maxChunkSize <= 0) {
            throw ConfigError("'storage.max_chunk_size' must be positive");
        }
        config.upload.maxChunkSize = static_cast<uint64_t>(maxChunkSize);
    }

    if (const YAML::Node rebuild = root["rebuild"]) {
        RejectUnknownKeys(rebuild, "rebuild", {"write_destination_first", "verify_complete"});
        ReadScalar(rebuild, "write_destination_first", "rebuild", config.upload.writeDestinationFirst);
        ReadScalar(rebuild, "verify_complete", "rebuild", config.upload.verifyComplete);
    }

    return config;
}

} // namespace

Config ConfigLoader::loadFromYaml(const std::string& path) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const std::exception& e) {
        throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
    }
    return FromNode(yaml);
}

Config ConfigLoader::loadFromString(const std::string& text) {
    YAML::Node yaml;
    try {
        yaml = YAML::Load(text);
    } catch (const std::exception& e) {
        throw ConfigError("Failed to parse YAML config: " + std::string(e.what()));
    }
    return FromNode(yaml);
}

} // namespace config
} // namespace chunkstash
