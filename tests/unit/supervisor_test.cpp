/**
 * supervisor_test.cpp - Supervisor against real worker processes
 *
 * Spawns minder-test-worker (probe handler) and minder-worker (echo handler).
 * The test thread acts as the control loop and pumps it while waiting.
 *
 * Tests:
 * - Start, handshake, in-order responses, startup config and handler args
 * - start() idempotence, send() while stopped, missing executable
 * - Crash -> exactly one restart with on_start + on_restart, new worker
 * - Handler errors are reported without restarting
 * - Rejected handshake -> fatal report, clean stop, no restart
 * - Shutdown acknowledgement, hung worker killed on timeout, idempotence
 * - Stray stdout output from handler code does not corrupt the channel
 * - Writing to a dead worker is not an error; the reader drives the restart
 * - Oversized commands and startup config are rejected up front
 * - Terminal interrupts do not reach the worker
 */

#include "supervisor/supervisor.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <cerrno>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "echo.pb.h"
#include "probe_handler.hpp"
#include "test_messages.pb.h"
#include "test_utils.hpp"

using namespace minder;
using namespace minder::supervisor;
using minder::tests::pump_until;
namespace probe = minder::test::v1;

namespace {

// Records everything the supervisor hands to the application
class RecordingResponder : public Responder {
public:
    RecordingResponder() {
        table().on<probe::Started>([this](const probe::Started &msg) { started.push_back(msg); });
        table().on<probe::Pong>([this](const probe::Pong &msg) { pongs.push_back(msg); });
        table().on<probe::Stopped>([this](const probe::Stopped &msg) { stopped.push_back(msg); });
        table().on<probe::ConfigValue>([this](const probe::ConfigValue &msg) { values.push_back(msg); });
        table().on<minder::echo::v1::EchoReply>(
            [this](const minder::echo::v1::EchoReply &msg) { echoes.push_back(msg); });
    }

    void on_start() override { ++start_calls; }
    void on_stop() override { ++stop_calls; }
    void on_restart() override { ++restart_calls; }

    void handle_worker_error(const minder::protocol::v1::WorkerError &error) override {
        errors.push_back(error);
        Responder::handle_worker_error(error);
    }

    void on_worker_failure(const std::string &report) override { failures.push_back(report); }

    std::vector<probe::Started> started;
    std::vector<probe::Pong> pongs;
    std::vector<probe::Stopped> stopped;
    std::vector<probe::ConfigValue> values;
    std::vector<minder::echo::v1::EchoReply> echoes;
    std::vector<minder::protocol::v1::WorkerError> errors;
    std::vector<std::string> failures;
    int start_calls = 0;
    int stop_calls = 0;
    int restart_calls = 0;
};

SupervisorConfig probe_config(const std::string &handler = minder::test::kProbeHandlerName) {
    SupervisorConfig config;
    config.id = "probe0";
    config.command = MINDER_TEST_WORKER_PATH;
    config.handler_name = handler;
    config.handler_args = {"first", "second"};
    config.startup_config = {{"greeting", "hello"}};
    config.shutdown_timeout_ms = 2000;
    return config;
}

probe::Ping ping(uint64_t sequence) {
    probe::Ping msg;
    msg.set_sequence(sequence);
    return msg;
}

bool process_gone(pid_t pid) { return kill(pid, 0) != 0 && errno == ESRCH; }

}  // namespace

class SupervisorTest : public ::testing::Test {
protected:
    void SetUp() override { supervisor_ = std::make_unique<Supervisor>(probe_config(), responder_, loop_); }

    void TearDown() override {
        supervisor_.reset();
        loop_.run_pending();
    }

    bool pump(const std::function<bool()> &pred) { return pump_until(loop_, pred); }

    void start_and_wait_started() {
        ASSERT_TRUE(supervisor_->start()) << supervisor_->last_error();
        ASSERT_TRUE(pump([this] { return !responder_.started.empty(); }));
    }

    EventLoop loop_;
    RecordingResponder responder_;
    std::unique_ptr<Supervisor> supervisor_;
};

/******************************************************************************
 * Startup and messaging
 ******************************************************************************/

TEST_F(SupervisorTest, StartRunsHandshakeAndNotifiesResponder) {
    EXPECT_EQ(supervisor_->state(), SupervisorState::STOPPED);
    EXPECT_EQ(supervisor_->worker_pid(), -1);

    start_and_wait_started();

    EXPECT_EQ(supervisor_->state(), SupervisorState::RUNNING);
    EXPECT_EQ(responder_.start_calls, 1);
    ASSERT_EQ(responder_.started.size(), 1u);
    EXPECT_EQ(responder_.started[0].worker_pid(), supervisor_->worker_pid());
    ASSERT_EQ(responder_.started[0].args_size(), 2);
    EXPECT_EQ(responder_.started[0].args(0), "first");
    EXPECT_EQ(responder_.started[0].args(1), "second");
}

TEST_F(SupervisorTest, ResponsesArriveInSendOrder) {
    start_and_wait_started();

    constexpr uint64_t kCount = 100;
    for (uint64_t i = 1; i <= kCount; ++i) {
        ASSERT_TRUE(supervisor_->send(ping(i)));
    }
    ASSERT_TRUE(pump([this] { return responder_.pongs.size() == kCount; }));

    for (uint64_t i = 0; i < kCount; ++i) {
        EXPECT_EQ(responder_.pongs[i].sequence(), i + 1);
        EXPECT_EQ(responder_.pongs[i].worker_pid(), supervisor_->worker_pid());
    }
}

TEST_F(SupervisorTest, WorkerSeesStartupConfig) {
    start_and_wait_started();

    probe::GetConfig request;
    request.set_key("greeting");
    ASSERT_TRUE(supervisor_->send(request));
    request.set_key("process_name");
    ASSERT_TRUE(supervisor_->send(request));
    request.set_key("log_level");
    ASSERT_TRUE(supervisor_->send(request));
    ASSERT_TRUE(pump([this] { return responder_.values.size() == 3; }));

    EXPECT_EQ(responder_.values[0].value(), "hello");
    EXPECT_EQ(responder_.values[1].value(), "probe0");
    EXPECT_TRUE(responder_.values[2].found());
}

TEST_F(SupervisorTest, StartIsIdempotent) {
    start_and_wait_started();
    pid_t pid = supervisor_->worker_pid();

    EXPECT_TRUE(supervisor_->start());
    EXPECT_EQ(supervisor_->worker_pid(), pid);
    EXPECT_EQ(responder_.start_calls, 1);
}

TEST_F(SupervisorTest, SendWhileStoppedFails) {
    EXPECT_FALSE(supervisor_->send(ping(1)));
    EXPECT_EQ(supervisor_->last_error(), "Worker not running");
}

TEST(SupervisorStartTest, MissingExecutableFailsToStart) {
    EventLoop loop;
    RecordingResponder responder;
    auto config = probe_config();
    config.command = "/nonexistent/minder-worker";
    Supervisor supervisor(config, responder, loop);

    EXPECT_FALSE(supervisor.start());
    EXPECT_FALSE(supervisor.last_error().empty());
    EXPECT_EQ(supervisor.state(), SupervisorState::STOPPED);
    EXPECT_EQ(responder.start_calls, 0);
}

TEST_F(SupervisorTest, StdoutNoiseDoesNotCorruptChannel) {
    start_and_wait_started();

    probe::Print print;
    print.set_text("this line must not reach the protocol pipe");
    ASSERT_TRUE(supervisor_->send(print));
    ASSERT_TRUE(supervisor_->send(ping(1)));

    ASSERT_TRUE(pump([this] { return !responder_.pongs.empty(); }));
    EXPECT_EQ(supervisor_->restart_count(), 0);
    EXPECT_TRUE(responder_.errors.empty());
}

/******************************************************************************
 * Failures
 ******************************************************************************/

TEST_F(SupervisorTest, HandlerErrorIsReportedWithoutRestart) {
    start_and_wait_started();
    pid_t pid = supervisor_->worker_pid();

    probe::Fail fail;
    fail.set_reason("cannot do X");
    ASSERT_TRUE(supervisor_->send(fail));
    ASSERT_TRUE(supervisor_->send(ping(2)));
    ASSERT_TRUE(pump([this] { return !responder_.pongs.empty(); }));

    ASSERT_EQ(responder_.errors.size(), 1u);
    EXPECT_TRUE(responder_.errors[0].recoverable());
    EXPECT_NE(responder_.errors[0].report().find("cannot do X"), std::string::npos);
    EXPECT_TRUE(responder_.failures.empty());
    EXPECT_EQ(supervisor_->restart_count(), 0);
    EXPECT_EQ(supervisor_->worker_pid(), pid);
}

TEST_F(SupervisorTest, CrashTriggersSingleRestart) {
    start_and_wait_started();
    pid_t first_pid = supervisor_->worker_pid();

    probe::Crash crash;
    crash.set_exit_code(3);
    ASSERT_TRUE(supervisor_->send(crash));

    ASSERT_TRUE(pump([this] { return responder_.started.size() == 2; }));
    EXPECT_EQ(supervisor_->restart_count(), 1);
    EXPECT_EQ(responder_.start_calls, 2);
    EXPECT_EQ(responder_.restart_calls, 1);
    EXPECT_EQ(supervisor_->state(), SupervisorState::RUNNING);
    EXPECT_NE(supervisor_->worker_pid(), first_pid);
    EXPECT_EQ(responder_.started[1].worker_pid(), supervisor_->worker_pid());
    EXPECT_TRUE(process_gone(first_pid));

    // The replacement worker is fully usable
    ASSERT_TRUE(supervisor_->send(ping(9)));
    ASSERT_TRUE(pump([this] { return !responder_.pongs.empty(); }));
    EXPECT_EQ(responder_.pongs[0].sequence(), 9u);

    // No further restarts happen on their own
    loop_.run_for(std::chrono::milliseconds(100));
    EXPECT_EQ(supervisor_->restart_count(), 1);
}

TEST_F(SupervisorTest, ExternalKillTriggersRestart) {
    start_and_wait_started();
    pid_t first_pid = supervisor_->worker_pid();

    ASSERT_EQ(kill(first_pid, SIGKILL), 0);

    ASSERT_TRUE(pump([this] { return responder_.started.size() == 2; }));
    EXPECT_EQ(supervisor_->restart_count(), 1);
    EXPECT_NE(supervisor_->worker_pid(), first_pid);
}

TEST(SupervisorHandshakeTest, UnknownHandlerStopsWithoutRestart) {
    EventLoop loop;
    RecordingResponder responder;
    Supervisor supervisor(probe_config("no-such-handler"), responder, loop);

    ASSERT_TRUE(supervisor.start());
    ASSERT_TRUE(pump_until(loop, [&] { return !supervisor.is_running(); }));

    ASSERT_EQ(responder.failures.size(), 1u);
    EXPECT_NE(responder.failures[0].find("no-such-handler"), std::string::npos);
    EXPECT_EQ(supervisor.restart_count(), 0);
    EXPECT_EQ(supervisor.state(), SupervisorState::STOPPED);
    EXPECT_EQ(supervisor.worker_pid(), -1);
    EXPECT_TRUE(responder.started.empty());
}

TEST(SupervisorHandshakeTest, BrokenHandlerStopsWithoutRestart) {
    EventLoop loop;
    RecordingResponder responder;
    Supervisor supervisor(probe_config(minder::test::kBrokenHandlerName), responder, loop);

    ASSERT_TRUE(supervisor.start());
    ASSERT_TRUE(pump_until(loop, [&] { return !supervisor.is_running(); }));

    ASSERT_EQ(responder.errors.size(), 1u);
    EXPECT_FALSE(responder.errors[0].recoverable());
    ASSERT_EQ(responder.failures.size(), 1u);
    EXPECT_NE(responder.failures[0].find("refuses to start"), std::string::npos);
    EXPECT_EQ(supervisor.restart_count(), 0);
}

TEST_F(SupervisorTest, SendToDeadWorkerSucceedsAndReaderRestarts) {
    start_and_wait_started();
    pid_t first_pid = supervisor_->worker_pid();

    ASSERT_EQ(kill(first_pid, SIGKILL), 0);
    // Wait for the death without reaping; the supervisor does that
    siginfo_t info{};
    ASSERT_EQ(waitid(P_PID, static_cast<id_t>(first_pid), &info, WEXITED | WNOWAIT), 0);

    // The loop has not run yet: the supervisor still believes the worker is up
    EXPECT_TRUE(supervisor_->send(ping(1)));
    EXPECT_EQ(supervisor_->state(), SupervisorState::RUNNING);
    EXPECT_EQ(supervisor_->restart_count(), 0);
    EXPECT_EQ(responder_.restart_calls, 0);

    ASSERT_TRUE(pump([this] { return responder_.started.size() == 2; }));
    EXPECT_EQ(supervisor_->restart_count(), 1);
    EXPECT_EQ(responder_.restart_calls, 1);
    EXPECT_NE(supervisor_->worker_pid(), first_pid);

    loop_.run_for(std::chrono::milliseconds(100));
    EXPECT_EQ(supervisor_->restart_count(), 1);
}

TEST_F(SupervisorTest, OversizedCommandIsRejected) {
    start_and_wait_started();

    probe::Print print;
    print.set_text(std::string(channel::kMaxFrameSize + 1, 'x'));
    EXPECT_FALSE(supervisor_->send(print));
    EXPECT_NE(supervisor_->last_error().find("too large"), std::string::npos);

    // Nothing reached the pipe; the channel is intact
    ASSERT_TRUE(supervisor_->send(ping(4)));
    ASSERT_TRUE(pump([this] { return !responder_.pongs.empty(); }));
    EXPECT_EQ(responder_.pongs[0].sequence(), 4u);
    EXPECT_EQ(supervisor_->restart_count(), 0);
    EXPECT_TRUE(responder_.errors.empty());
}

TEST(SupervisorStartTest, OversizedStartupConfigFailsToStart) {
    EventLoop loop;
    RecordingResponder responder;
    auto config = probe_config();
    config.startup_config["blob"] = std::string(channel::kMaxFrameSize + 1, 'x');
    Supervisor supervisor(config, responder, loop);

    EXPECT_FALSE(supervisor.start());
    EXPECT_NE(supervisor.last_error().find("StartupInfo"), std::string::npos);
    EXPECT_EQ(supervisor.state(), SupervisorState::STOPPED);
    EXPECT_EQ(supervisor.worker_pid(), -1);
    EXPECT_EQ(responder.start_calls, 0);

    loop.run_for(std::chrono::milliseconds(100));
    EXPECT_EQ(supervisor.restart_count(), 0);
}

TEST_F(SupervisorTest, InterruptToWorkerGroupDoesNotRestart) {
    start_and_wait_started();
    pid_t pid = supervisor_->worker_pid();

    // The worker leads its own group, away from the terminal's foreground group
    EXPECT_EQ(getpgid(pid), pid);
    EXPECT_NE(getpgid(pid), getpgrp());

    ASSERT_EQ(kill(-pid, SIGINT), 0);
    loop_.run_for(std::chrono::milliseconds(200));

    EXPECT_EQ(supervisor_->restart_count(), 0);
    EXPECT_EQ(responder_.restart_calls, 0);
    EXPECT_EQ(supervisor_->worker_pid(), pid);

    ASSERT_TRUE(supervisor_->send(ping(5)));
    ASSERT_TRUE(pump([this] { return !responder_.pongs.empty(); }));

    supervisor_->shutdown();
    loop_.run_pending();
    EXPECT_EQ(responder_.stopped.size(), 1u);
}

/******************************************************************************
 * Shutdown
 ******************************************************************************/

TEST_F(SupervisorTest, ShutdownStopsWorkerCleanly) {
    start_and_wait_started();
    ASSERT_TRUE(supervisor_->send(ping(1)));
    pid_t pid = supervisor_->worker_pid();

    supervisor_->shutdown();
    EXPECT_EQ(supervisor_->state(), SupervisorState::STOPPED);
    EXPECT_EQ(supervisor_->worker_pid(), -1);
    EXPECT_EQ(responder_.stop_calls, 1);
    EXPECT_TRUE(process_gone(pid));

    // Messages sent before the stop sentinel are still delivered
    loop_.run_pending();
    ASSERT_EQ(responder_.pongs.size(), 1u);
    ASSERT_EQ(responder_.stopped.size(), 1u);
    EXPECT_EQ(responder_.stopped[0].handled(), 1u);

    // Stale finished notification must not restart anything
    loop_.run_for(std::chrono::milliseconds(100));
    EXPECT_EQ(supervisor_->restart_count(), 0);
    EXPECT_EQ(responder_.restart_calls, 0);
}

TEST_F(SupervisorTest, ShutdownIsIdempotent) {
    start_and_wait_started();

    supervisor_->shutdown();
    supervisor_->shutdown();
    EXPECT_EQ(responder_.stop_calls, 1);
    EXPECT_FALSE(supervisor_->send(ping(1)));
}

TEST_F(SupervisorTest, ShutdownKillsHungWorker) {
    start_and_wait_started();
    pid_t pid = supervisor_->worker_pid();

    probe::Sleep sleep;
    sleep.set_duration_ms(30000);
    ASSERT_TRUE(supervisor_->send(sleep));

    auto begin = std::chrono::steady_clock::now();
    supervisor_->shutdown(std::chrono::milliseconds(300));
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));
    EXPECT_EQ(supervisor_->state(), SupervisorState::STOPPED);
    EXPECT_TRUE(process_gone(pid));
    EXPECT_EQ(supervisor_->restart_count(), 0);
}

TEST_F(SupervisorTest, RestartAfterShutdown) {
    start_and_wait_started();
    supervisor_->shutdown();

    ASSERT_TRUE(supervisor_->start());
    ASSERT_TRUE(pump([this] { return responder_.started.size() == 2; }));
    EXPECT_EQ(responder_.start_calls, 2);
    EXPECT_EQ(responder_.restart_calls, 0);
    EXPECT_EQ(supervisor_->restart_count(), 0);
}

TEST(SupervisorLifetimeTest, DestructorShutsDownWorker) {
    EventLoop loop;
    RecordingResponder responder;
    pid_t pid = -1;
    {
        Supervisor supervisor(probe_config(), responder, loop);
        ASSERT_TRUE(supervisor.start());
        pid = supervisor.worker_pid();
    }
    EXPECT_TRUE(process_gone(pid));
    EXPECT_EQ(responder.stop_calls, 1);

    // Callbacks queued by the destroyed supervisor are no-ops
    loop.run_pending();
}

/******************************************************************************
 * Bundled worker executable
 ******************************************************************************/

TEST(EchoWorkerTest, EchoHandlerRepliesThroughSupervisor) {
    EventLoop loop;
    RecordingResponder responder;

    SupervisorConfig config;
    config.id = "echo0";
    config.command = MINDER_WORKER_PATH;
    config.handler_name = "echo";
    config.handler_args = {"> "};
    config.startup_config = {{"greeting", "hi"}};
    Supervisor supervisor(config, responder, loop);

    ASSERT_TRUE(supervisor.start()) << supervisor.last_error();

    minder::echo::v1::EchoRequest request;
    request.set_sequence(1);
    request.set_text("abc");
    ASSERT_TRUE(supervisor.send(request));
    request.set_sequence(2);
    request.set_text("def");
    ASSERT_TRUE(supervisor.send(request));

    ASSERT_TRUE(pump_until(loop, [&] { return responder.echoes.size() == 2; }));
    EXPECT_EQ(responder.echoes[0].sequence(), 1u);
    EXPECT_EQ(responder.echoes[0].text(), "> abc");
    EXPECT_EQ(responder.echoes[0].greeting(), "hi");
    EXPECT_EQ(responder.echoes[0].worker_pid(), supervisor.worker_pid());
    EXPECT_EQ(responder.echoes[1].text(), "> def");

    supervisor.shutdown();
    EXPECT_EQ(supervisor.state(), SupervisorState::STOPPED);
    EXPECT_TRUE(responder.errors.empty());
}
