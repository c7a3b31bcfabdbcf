#include <gtest/gtest.h>
#include "daemon/monitor_loop.hpp"
#include "fake_service.hpp"

#include <atomic>
#include <chrono>
#include <signal.h>
#include <thread>

namespace {

LaunchSpec sleep_spec() {
    LaunchSpec spec;
    spec.executable = "/bin/sleep";
    spec.args = {"60"};
    return spec;
}

SupervisorOptions fast_options() {
    SupervisorOptions opts;
    opts.restart_grace = std::chrono::milliseconds(50);
    opts.stop_timeout = std::chrono::milliseconds(1000);
    return opts;
}

MonitorOptions monitor_options(RespawnPolicy policy) {
    MonitorOptions opts;
    opts.interval = std::chrono::milliseconds(50);
    opts.initial_delay = std::chrono::milliseconds(0);
    opts.failure_threshold = 3;
    opts.policy = policy;
    return opts;
}

} // namespace

class MonitorLoopTest : public ::testing::Test {
protected:
    FakeService service_;
    HealthProbe probe_{service_.endpoint()};
    ServiceSupervisor supervisor_{fast_options()};
    ServiceController controller_{supervisor_, probe_, sleep_spec(),
                                  std::chrono::milliseconds(3000)};
    std::atomic<int> error_events_{0};

    void SetUp() override {
        supervisor_.notifier().subscribe([this](const ServiceEvent& e) {
            if (e.type == ServiceEvent::Type::Error) ++error_events_;
        });
        auto result = controller_.start_and_wait();
        ASSERT_TRUE(result.success) << result.message;
    }

    /// SIGKILL the child behind the supervisor's back and let the kernel finish it
    pid_t kill_child() {
        pid_t pid = supervisor_.child_pid();
        kill(pid, SIGKILL);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return pid;
    }
};

TEST_F(MonitorLoopTest, HealthyTickKeepsRunning) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    monitor.tick();
    monitor.tick();
    EXPECT_EQ(monitor.consecutive_failures(), 0);
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Running);
}

TEST_F(MonitorLoopTest, ConsecutiveFailureThreshold) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    service_.script({false, false, true, false, false, false});

    monitor.tick();
    monitor.tick();
    EXPECT_EQ(monitor.consecutive_failures(), 2);
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Running);

    // A success resets the count
    monitor.tick();
    EXPECT_EQ(monitor.consecutive_failures(), 0);

    monitor.tick();
    monitor.tick();
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Running);

    monitor.tick();
    EXPECT_EQ(monitor.consecutive_failures(), 3);
    auto status = supervisor_.get_status();
    EXPECT_EQ(status.kind, ServiceStatus::Kind::Error);
    EXPECT_EQ(status.error, ServiceError::Unresponsive);
    EXPECT_EQ(status.reason, "Service unresponsive");
    EXPECT_EQ(error_events_.load(), 1);
}

TEST_F(MonitorLoopTest, UnresponsiveReportedOnce) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    service_.set_healthy(false);

    for (int i = 0; i < 6; ++i) monitor.tick();
    EXPECT_EQ(supervisor_.get_status().error, ServiceError::Unresponsive);
    EXPECT_EQ(error_events_.load(), 1);
    // An unresponsive process is not killed
    EXPECT_TRUE(supervisor_.is_running());
}

TEST_F(MonitorLoopTest, StartingWindowIsLeftToStartupGate) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    ASSERT_TRUE(supervisor_.start(sleep_spec()).success);
    ASSERT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Starting);
    service_.set_healthy(false);

    for (int i = 0; i < 5; ++i) monitor.tick();
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Starting);
    EXPECT_EQ(monitor.consecutive_failures(), 0);
    EXPECT_EQ(error_events_.load(), 0);

    // Counting resumes once the gate has settled the status
    supervisor_.mark_running();
    for (int i = 0; i < 3; ++i) monitor.tick();
    EXPECT_EQ(supervisor_.get_status().error, ServiceError::Unresponsive);
    EXPECT_EQ(error_events_.load(), 1);
}

TEST_F(MonitorLoopTest, ExitDuringStartingIsStillReported) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    ASSERT_TRUE(supervisor_.start(sleep_spec()).success);
    kill_child();

    monitor.tick();
    EXPECT_EQ(supervisor_.get_status().error, ServiceError::ProcessExited);
}

TEST_F(MonitorLoopTest, SkipsWhenIntentionallyStopped) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::AutoRespawn));
    controller_.stop();
    int hits = service_.health_hits();

    monitor.tick();
    monitor.tick();
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Stopped);
    EXPECT_FALSE(supervisor_.is_running());
    EXPECT_EQ(service_.health_hits(), hits);
    EXPECT_EQ(error_events_.load(), 0);
}

TEST_F(MonitorLoopTest, ReportOnlySurfacesExit) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    kill_child();

    monitor.tick();
    auto status = supervisor_.get_status();
    EXPECT_EQ(status.kind, ServiceStatus::Kind::Error);
    EXPECT_EQ(status.error, ServiceError::ProcessExited);
    EXPECT_EQ(status.reason, "Service stopped");
    EXPECT_EQ(error_events_.load(), 1);

    monitor.tick();
    EXPECT_EQ(error_events_.load(), 1);
    EXPECT_FALSE(supervisor_.is_running());
    EXPECT_EQ(supervisor_.child_pid(), -1);
}

TEST_F(MonitorLoopTest, AutoRespawnRecovers) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::AutoRespawn));
    pid_t old_pid = kill_child();

    monitor.tick();
    EXPECT_EQ(error_events_.load(), 1);
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Running);
    EXPECT_TRUE(supervisor_.is_running());
    EXPECT_GT(supervisor_.child_pid(), 0);
    EXPECT_NE(supervisor_.child_pid(), old_pid);
    EXPECT_FALSE(supervisor_.restart_in_progress());
}

TEST_F(MonitorLoopTest, AutoRespawnDefersToRestartInProgress) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::AutoRespawn));
    kill_child();

    RestartGuard held = supervisor_.try_acquire_restart();
    ASSERT_TRUE(held);
    monitor.tick();
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Error);
    EXPECT_FALSE(supervisor_.is_running());
}

TEST_F(MonitorLoopTest, SpawnErrorNotRetried) {
    LaunchSpec bad;
    bad.executable = "/nonexistent/binary";
    controller_.set_launch_spec(bad);
    ASSERT_FALSE(controller_.start_and_wait().success);
    ASSERT_EQ(supervisor_.get_status().error, ServiceError::SpawnError);
    int hits = service_.health_hits();

    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::AutoRespawn));
    monitor.tick();
    monitor.tick();
    EXPECT_EQ(supervisor_.get_status().error, ServiceError::SpawnError);
    EXPECT_EQ(service_.health_hits(), hits);
    EXPECT_EQ(error_events_.load(), 1);
}

TEST_F(MonitorLoopTest, BackgroundThreadDetectsExit) {
    MonitorLoop monitor(controller_, monitor_options(RespawnPolicy::ReportOnly));
    monitor.start();
    EXPECT_TRUE(monitor.is_active());

    kill_child();
    bool detected = false;
    for (int i = 0; i < 100 && !detected; ++i) {
        detected = supervisor_.get_status().kind == ServiceStatus::Kind::Error;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    EXPECT_TRUE(detected);

    monitor.stop();
    EXPECT_FALSE(monitor.is_active());
}

TEST_F(MonitorLoopTest, StopBeforeInitialDelay) {
    MonitorOptions opts = monitor_options(RespawnPolicy::ReportOnly);
    opts.initial_delay = std::chrono::milliseconds(10000);
    MonitorLoop monitor(controller_, opts);
    monitor.start();

    auto begin = std::chrono::steady_clock::now();
    monitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1000));
}

TEST(RespawnPolicyTest, Parse) {
    RespawnPolicy policy = RespawnPolicy::ReportOnly;
    EXPECT_TRUE(parse_respawn_policy("auto-respawn", policy));
    EXPECT_EQ(policy, RespawnPolicy::AutoRespawn);
    EXPECT_TRUE(parse_respawn_policy("report-only", policy));
    EXPECT_EQ(policy, RespawnPolicy::ReportOnly);
    EXPECT_FALSE(parse_respawn_policy("always", policy));
    EXPECT_EQ(policy, RespawnPolicy::ReportOnly);

    EXPECT_STREQ(respawn_policy_name(RespawnPolicy::AutoRespawn), "auto-respawn");
    EXPECT_STREQ(respawn_policy_name(RespawnPolicy::ReportOnly), "report-only");
}
