// minder
// Runs one supervised worker described by a YAML config. Every line read from
// stdin is sent to the worker as an EchoRequest; replies are logged.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "echo.pb.h"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "supervisor/event_loop.hpp"
#include "supervisor/responder.hpp"
#include "supervisor/supervisor.hpp"

namespace {

class EchoResponder : public minder::supervisor::Responder {
public:
    EchoResponder() {
        table().on<minder::echo::v1::EchoReply>([this](const minder::echo::v1::EchoReply &reply) {
            ++replies_;
            LOG_INFO("[Echo] #" << reply.sequence() << " from PID " << reply.worker_pid() << ": " << reply.text());
        });
    }

    void on_start() override { LOG_INFO("[Echo] Worker started"); }
    void on_stop() override { LOG_INFO("[Echo] Worker stopping (" << replies_ << " replies)"); }
    void on_restart() override { LOG_WARN("[Echo] Worker restarted after a crash"); }
    void on_worker_failure(const std::string &report) override {
        std::cerr << "Worker failed:\n" << report << "\n";
    }

private:
    uint64_t replies_ = 0;
};

}  // namespace

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "minder.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: minder [OPTIONS]\n\n";
            std::cerr << "Reads lines from stdin and echoes them through a supervised worker.\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: minder.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    minder::logging::Logger::init(minder::logging::Level::LVL_INFO, "minder");
    LOG_INFO("Loading config: " + config_path);

    minder::runtime::MinderConfig config;
    std::string error;

    if (!minder::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    minder::logging::Logger::set_level(minder::logging::string_to_level(config.logging.level));

    // Shared with the stdin thread, which may outlive main's locals
    auto loop = std::make_shared<minder::supervisor::EventLoop>();
    auto stdin_closed = std::make_shared<std::atomic<bool>>(false);

    EchoResponder responder;
    minder::supervisor::Supervisor supervisor(config.worker, responder, *loop);

    if (!minder::runtime::SignalHandler::install())
    {
        LOG_WARN("Failed to install signal handlers; use EOF on stdin to stop");
    }

    if (!supervisor.start())
    {
        LOG_ERROR("Failed to start worker: " << supervisor.last_error());
        return 1;
    }

    // stdin is read on its own thread; each line becomes a command posted to the loop
    std::thread input_thread([loop, stdin_closed, &supervisor]() {
        std::string line;
        uint64_t sequence = 0;
        while (std::getline(std::cin, line))
        {
            minder::echo::v1::EchoRequest request;
            request.set_sequence(++sequence);
            request.set_text(line);
            loop->post([&supervisor, request]() {
                if (!supervisor.send(request))
                {
                    LOG_WARN("Dropped line #" << request.sequence() << ": " << supervisor.last_error());
                }
            });
        }
        stdin_closed->store(true);
    });
    // Blocked in getline until input arrives; cannot be interrupted portably
    input_thread.detach();

    while (!minder::runtime::SignalHandler::is_shutdown_requested() && !stdin_closed->load() &&
           supervisor.is_running())
    {
        loop->run_for(std::chrono::milliseconds(100));
    }

    if (minder::runtime::SignalHandler::is_shutdown_requested())
    {
        LOG_INFO("Received signal " << minder::runtime::SignalHandler::last_signal() << ", shutting down");
    }

    // Deliver commands posted before EOF, then stop the worker
    loop->run_pending();
    supervisor.shutdown();
    loop->run_pending();

    LOG_INFO("Shutdown complete (restarts: " << supervisor.restart_count() << ")");
    return 0;
}
