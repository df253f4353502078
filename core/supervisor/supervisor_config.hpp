#pragma once

#include <map>
#include <string>
#include <vector>

namespace minder {
namespace supervisor {

struct SupervisorConfig {
    std::string id = "worker";                         // Log prefix, e.g. "echo0"
    std::string command;                               // Path to worker executable
    std::vector<std::string> args;                     // Command-line arguments
    std::string handler_name;                          // Handler the worker should build (HandlerInfo)
    std::vector<std::string> handler_args;             // Handler constructor arguments (HandlerInfo)
    std::map<std::string, std::string> startup_config; // Sent as StartupInfo before anything else
    int shutdown_timeout_ms = 1000;                    // Grace period before the worker is killed
};

}  // namespace supervisor
}  // namespace minder
