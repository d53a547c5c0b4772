#pragma once

#include <string>
#include "config/Config.hpp"

namespace chunkstash {
namespace config {

/*
  Loads Config from a YAML file.

  Every key is optional and falls back to the defaults in Config.hpp.
  Unknown keys and values of the wrong type are rejected with ConfigError.
*/
class ConfigLoader {
public:
    static Config loadFromYaml(const std::string& path);
    static Config loadFromString(const std::string& yaml);
};

} // namespace config
} // namespace chunkstash
