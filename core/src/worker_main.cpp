// minder-worker
// Worker process spawned by minder. Speaks the framed protocol on
// stdin/stdout; logs go to stderr.

#include <iostream>
#include <string>

#include "handlers/echo_handler.hpp"
#include "logging/logger.hpp"
#include "worker/handler_registry.hpp"
#include "worker/worker_runtime.hpp"

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: minder-worker\n\n";
            std::cerr << "Not meant to be run by hand: minder spawns it and talks to it over stdin/stdout.\n";
            return 0;
        }
    }

    minder::logging::Logger::init(minder::logging::Level::LVL_INFO, "worker");

    minder::worker::HandlerRegistry registry;
    if (!minder::handlers::register_builtin_handlers(registry))
    {
        LOG_ERROR("Failed to register built-in handlers");
        return 1;
    }

    return minder::worker::run_worker(registry);
}
