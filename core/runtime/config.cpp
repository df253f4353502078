#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <vector>

#include "../logging/logger.hpp"

namespace minder {
namespace runtime {

namespace {

bool parse_config(const YAML::Node &yaml, MinderConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    const std::vector<std::string> valid_keys = {"worker", "logging"};
    for (const auto &key_node : yaml) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
        }
    }

    if (!yaml["worker"]) {
        error = "Config must specify a 'worker' section";
        return false;
    }

    const auto &worker_node = yaml["worker"];
    auto &worker = config.worker;

    if (worker_node["id"]) {
        worker.id = worker_node["id"].as<std::string>();
    }
    if (worker_node["command"]) {
        worker.command = worker_node["command"].as<std::string>();
    }
    if (worker_node["args"]) {
        worker.args.clear();  // Ensure idempotent parsing
        for (const auto &arg : worker_node["args"]) {
            worker.args.push_back(arg.as<std::string>());
        }
    }
    if (worker_node["handler"]) {
        worker.handler_name = worker_node["handler"].as<std::string>();
    }
    if (worker_node["handler_args"]) {
        worker.handler_args.clear();
        for (const auto &arg : worker_node["handler_args"]) {
            worker.handler_args.push_back(arg.as<std::string>());
        }
    }
    if (worker_node["startup"]) {
        const auto &startup = worker_node["startup"];
        if (!startup.IsMap()) {
            error = "worker.startup must be a mapping of strings";
            return false;
        }
        worker.startup_config.clear();
        for (const auto &entry : startup) {
            worker.startup_config[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    if (worker_node["shutdown_timeout_ms"]) {
        worker.shutdown_timeout_ms = worker_node["shutdown_timeout_ms"].as<int>();
    }

    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] Worker '" << worker.id << "': " << worker.command << " (handler: " << worker.handler_name
                                 << ")");
    LOG_INFO("[Config] Shutdown timeout: " << worker.shutdown_timeout_ms << "ms");
    LOG_INFO("[Config] Log level: " << config.logging.level);
    return true;
}

}  // namespace

bool validate_config(const MinderConfig &config, std::string &error) {
    const auto &worker = config.worker;

    if (worker.id.empty()) {
        error = "worker.id must not be empty";
        return false;
    }
    if (worker.command.empty()) {
        error = "Worker '" + worker.id + "' missing 'command' field";
        return false;
    }
    if (worker.handler_name.empty()) {
        error = "Worker '" + worker.id + "' missing 'handler' field";
        return false;
    }
    if (worker.shutdown_timeout_ms < 100 || worker.shutdown_timeout_ms > 30000) {
        error = "Worker '" + worker.id + "' shutdown_timeout_ms must be between 100 and 30000";
        return false;
    }

    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, MinderConfig &config, std::string &error) {
    try {
        return parse_config(YAML::LoadFile(config_path), config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, MinderConfig &config, std::string &error) {
    try {
        return parse_config(YAML::Load(yaml_text), config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace minder
