#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "worker_handler.hpp"

namespace minder {
namespace worker {

// HandlerRegistry maps handler names (as sent in HandlerInfo) to factories.
// Both the supervising application and the worker executable know the names
// at build time; only the name and string arguments cross the process boundary.
class HandlerRegistry {
public:
    using Factory = std::function<std::unique_ptr<WorkerHandler>(const HandlerContext &)>;

    // Register a factory under name. Returns false if the name is taken.
    bool register_handler(const std::string &name, Factory factory);

    bool contains(const std::string &name) const { return factories_.count(name) != 0; }

    std::vector<std::string> names() const;

    // Build the handler registered under name.
    // Returns nullptr and sets error if the name is unknown, the factory
    // throws, or the factory returns nullptr.
    std::unique_ptr<WorkerHandler> create(const std::string &name, const HandlerContext &context,
                                          std::string &error) const;

private:
    std::unordered_map<std::string, Factory> factories_;
};

}  // namespace worker
}  // namespace minder
