#include "config/Config.hpp"

#include <cctype>

namespace chunkstash {
namespace config {

BindAddress parseBindAddress(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        throw ConfigError("bind address must be host:port, got '" + address + "'");
    }

    BindAddress result;
    result.host = address.substr(0, colon);
    // [::1]:8080
    if (result.host.size() >= 2 && result.host.front() == '[' && result.host.back() == ']') {
        result.host = result.host.substr(1, result.host.size() - 2);
    }

    const std::string port = address.substr(colon + 1);
    if (port.empty() || port.size() > 5) {
        throw ConfigError("invalid port in bind address '" + address + "'");
    }
    unsigned long value = 0;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError("invalid port in bind address '" + address + "'");
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    // Port 0 asks the OS for an ephemeral port
    if (value > 65535) {
        throw ConfigError("port out of range in bind address '" + address + "'");
    }
    result.port = static_cast<uint16_t>(value);
    return result;
}

} // namespace config
} // namespace chunkstash
