#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chunkstash {
namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ServerConfig {
    std::string bindAddress = "0.0.0.0:8080";
};

struct UploadConfig {
    std::string chunkRoot = "./data/chunks";
    std::uint64_t maxChunkSize = 5ULL << 20;    // 5 MiB

    // Write the destination before removing the staging directory
    bool writeDestinationFirst = false;

    // Refuse to rebuild when the completion request names a chunk count
    // and some index in that range was never stored
    bool verifyComplete = false;
};

struct Config {
    ServerConfig server;
    UploadConfig upload;
};

struct BindAddress {
    std::string host;
    uint16_t port = 0;
};

// Splits "host:port". An empty host (":8080") means all interfaces, port 0
// an ephemeral port.
BindAddress parseBindAddress(const std::string& address);

} // namespace config
} // namespace chunkstash
