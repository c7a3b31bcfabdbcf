#include <gtest/gtest.h>
#include "ui/status_publisher.hpp"
#include "fake_service.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

LaunchSpec sleep_spec() {
    LaunchSpec spec;
    spec.executable = "/bin/sleep";
    spec.args = {"60"};
    return spec;
}

} // namespace

class StatusPublisherTest : public ::testing::Test {
protected:
    FakeService service_;
    HealthProbe probe_{service_.endpoint()};
    ServiceSupervisor supervisor_;
    StatusPublisher publisher_{supervisor_, probe_};

    std::vector<ServiceStatus::Kind> statuses_;
    std::vector<std::optional<std::uint64_t>> counts_;

    void SetUp() override {
        service_.set_stats_body(R"({"items":{"total":42}})");
        publisher_.on_status_changed = [this](const ServiceStatus& s) {
            statuses_.push_back(s.kind);
        };
        publisher_.on_item_count_changed = [this](std::optional<std::uint64_t> count) {
            counts_.push_back(count);
        };
    }
};

TEST_F(StatusPublisherTest, InitialLabels) {
    TrayLabels labels = publisher_.labels();
    EXPECT_EQ(labels.status, "Status: Stopped");
    EXPECT_EQ(labels.action, "Start Service");
    EXPECT_EQ(labels.items, "Items: -");
}

TEST_F(StatusPublisherTest, StatusChangeIsEdgeTriggered) {
    EXPECT_TRUE(publisher_.poll_status());
    EXPECT_FALSE(publisher_.poll_status());
    EXPECT_FALSE(publisher_.poll_status());
    ASSERT_EQ(statuses_.size(), 1u);
    EXPECT_EQ(statuses_[0], ServiceStatus::Kind::Stopped);

    supervisor_.mark_running();
    EXPECT_TRUE(publisher_.poll_status());
    EXPECT_FALSE(publisher_.poll_status());
    ASSERT_EQ(statuses_.size(), 2u);
    EXPECT_EQ(statuses_[1], ServiceStatus::Kind::Running);

    TrayLabels labels = publisher_.labels();
    EXPECT_EQ(labels.status, "Status: Running");
    EXPECT_EQ(labels.action, "Restart Service");
}

TEST_F(StatusPublisherTest, ErrorReasonChangeIsObserved) {
    supervisor_.mark_error(ServiceError::Unresponsive, "Service unresponsive");
    EXPECT_TRUE(publisher_.poll_status());
    supervisor_.mark_error(ServiceError::ProcessExited, "Service stopped");
    EXPECT_TRUE(publisher_.poll_status());
    EXPECT_EQ(publisher_.labels().action, "Start Service");
}

TEST_F(StatusPublisherTest, StatsOnlyWhileRunning) {
    // Not running: no request, count stays unknown
    EXPECT_FALSE(publisher_.poll_stats());
    EXPECT_TRUE(counts_.empty());
    EXPECT_EQ(publisher_.labels().items, "Items: -");

    supervisor_.mark_running();
    EXPECT_TRUE(publisher_.poll_stats());
    ASSERT_EQ(counts_.size(), 1u);
    EXPECT_EQ(counts_[0], std::optional<std::uint64_t>(42));
    EXPECT_EQ(publisher_.labels().items, "Items: 42");

    // Unchanged count is not reported again
    EXPECT_FALSE(publisher_.poll_stats());
    EXPECT_EQ(counts_.size(), 1u);

    service_.set_stats_body(R"({"items":{"total":43}})");
    EXPECT_TRUE(publisher_.poll_stats());
    EXPECT_EQ(publisher_.labels().items, "Items: 43");
}

TEST_F(StatusPublisherTest, CountDroppedWhenLeavingRunning) {
    supervisor_.mark_running();
    publisher_.poll_status();
    ASSERT_TRUE(publisher_.poll_stats());
    EXPECT_EQ(publisher_.labels().items, "Items: 42");

    supervisor_.mark_error(ServiceError::ProcessExited, "Service stopped");
    EXPECT_TRUE(publisher_.poll_status());

    // The stale count is cleared together with the status change
    EXPECT_EQ(publisher_.labels().items, "Items: -");
    ASSERT_EQ(counts_.size(), 2u);
    EXPECT_FALSE(counts_[1].has_value());
}

TEST_F(StatusPublisherTest, CountFetchedAcrossStatusChangeIsDiscarded) {
    supervisor_.mark_running();
    publisher_.poll_status();
    ASSERT_TRUE(publisher_.poll_stats());
    EXPECT_EQ(publisher_.labels().items, "Items: 42");

    // The service fails while the stats request is being answered
    service_.set_stats_body(R"({"items":{"total":43}})");
    service_.set_stats_hook([this] {
        supervisor_.mark_error(ServiceError::ProcessExited, "Service stopped");
    });
    EXPECT_TRUE(publisher_.poll_stats());
    EXPECT_EQ(publisher_.labels().items, "Items: -");
    ASSERT_EQ(counts_.size(), 2u);
    EXPECT_FALSE(counts_[1].has_value());

    // The status poll that follows has nothing left to drop
    EXPECT_TRUE(publisher_.poll_status());
    EXPECT_EQ(publisher_.labels().items, "Items: -");
    EXPECT_EQ(counts_.size(), 2u);
}

TEST_F(StatusPublisherTest, ErrorCategoryChangeIsObserved) {
    supervisor_.mark_error(ServiceError::HealthTimeout, "Service stopped");
    EXPECT_TRUE(publisher_.poll_status());
    supervisor_.mark_error(ServiceError::ProcessExited, "Service stopped");
    EXPECT_TRUE(publisher_.poll_status());
    EXPECT_FALSE(publisher_.poll_status());
    EXPECT_EQ(statuses_.size(), 2u);
}

TEST_F(StatusPublisherTest, StatsUnavailableWhileRunning) {
    supervisor_.mark_running();
    service_.set_stats_body("");
    EXPECT_FALSE(publisher_.poll_stats());
    EXPECT_EQ(publisher_.labels().items, "Items: -");
}

TEST_F(StatusPublisherTest, NeverControlsTheService) {
    supervisor_.mark_error(ServiceError::ProcessExited, "Service stopped");
    publisher_.poll_status();
    publisher_.poll_stats();
    EXPECT_FALSE(supervisor_.is_running());
    EXPECT_EQ(supervisor_.get_status().kind, ServiceStatus::Kind::Error);
}

TEST_F(StatusPublisherTest, BackgroundLoopPublishes) {
    PublisherOptions opts;
    opts.status_interval = std::chrono::milliseconds(50);
    opts.stats_interval = std::chrono::milliseconds(50);
    StatusPublisher publisher(supervisor_, probe_, opts);
    std::atomic<int> changes{0};
    publisher.on_status_changed = [&](const ServiceStatus&) { ++changes; };

    ASSERT_TRUE(supervisor_.start(sleep_spec()).success);
    supervisor_.mark_running();
    publisher.start();

    bool published = false;
    for (int i = 0; i < 100 && !published; ++i) {
        published = publisher.labels().items == "Items: 42";
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    publisher.stop();

    EXPECT_TRUE(published);
    EXPECT_EQ(publisher.labels().status, "Status: Running");
    EXPECT_EQ(changes.load(), 1);
}

TEST(StatusLabelsTest, Texts) {
    EXPECT_EQ(StatusPublisher::status_label(ServiceStatus::starting()), "Status: Starting");
    EXPECT_EQ(StatusPublisher::status_label(ServiceStatus::restarting()), "Status: Restarting");
    EXPECT_EQ(StatusPublisher::status_label(
                  ServiceStatus::failed(ServiceError::Unresponsive, "Service unresponsive")),
              "Status: Error");

    EXPECT_EQ(StatusPublisher::action_label(ServiceStatus::running()), "Restart Service");
    EXPECT_EQ(StatusPublisher::action_label(ServiceStatus::starting()), "Restart Service");
    EXPECT_EQ(StatusPublisher::action_label(ServiceStatus::restarting()), "Restart Service");
    EXPECT_EQ(StatusPublisher::action_label(ServiceStatus::stopped()), "Start Service");
    EXPECT_EQ(StatusPublisher::action_label(
                  ServiceStatus::failed(ServiceError::SpawnError, "x")),
              "Start Service");

    EXPECT_EQ(StatusPublisher::item_count_label(std::nullopt), "Items: -");
    EXPECT_EQ(StatusPublisher::item_count_label(0), "Items: 0");
    EXPECT_EQ(StatusPublisher::item_count_label(1234), "Items: 1234");
}
