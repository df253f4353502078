#pragma once

#include <string>

#include "../supervisor/supervisor_config.hpp"

namespace minder {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct MinderConfig {
    supervisor::SupervisorConfig worker;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, MinderConfig &config, std::string &error);

// Loads configuration from YAML text
bool load_config_from_string(const std::string &yaml_text, MinderConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const MinderConfig &config, std::string &error);

}  // namespace runtime
}  // namespace minder
