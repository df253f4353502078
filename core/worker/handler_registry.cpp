#include "handler_registry.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace minder {
namespace worker {

bool HandlerRegistry::register_handler(const std::string &name, Factory factory) {
    if (name.empty() || !factory) {
        LOG_WARN("[HandlerRegistry] Ignoring invalid registration '" << name << "'");
        return false;
    }
    if (contains(name)) {
        LOG_WARN("[HandlerRegistry] Handler '" << name << "' already registered");
        return false;
    }
    factories_.emplace(name, std::move(factory));
    LOG_DEBUG("[HandlerRegistry] Registered handler '" << name << "'");
    return true;
}

std::vector<std::string> HandlerRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto &[name, _] : factories_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::unique_ptr<WorkerHandler> HandlerRegistry::create(const std::string &name, const HandlerContext &context,
                                                       std::string &error) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        error = "Unknown handler '" + name + "'";
        return nullptr;
    }

    std::unique_ptr<WorkerHandler> handler;
    try {
        handler = it->second(context);
    } catch (const std::exception &e) {
        error = "Handler '" + name + "' construction failed: " + e.what();
        return nullptr;
    }

    if (!handler) {
        error = "Handler '" + name + "' factory returned no handler";
        return nullptr;
    }
    return handler;
}

}  // namespace worker
}  // namespace minder
