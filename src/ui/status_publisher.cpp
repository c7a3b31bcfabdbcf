#include "ui/status_publisher.hpp"

#include <spdlog/spdlog.h>

StatusPublisher::StatusPublisher(const ServiceSupervisor& supervisor, const HealthProbe& probe,
                                 PublisherOptions options)
    : supervisor_(supervisor), probe_(probe), options_(options) {}

StatusPublisher::~StatusPublisher() {
    stop();
}

std::string StatusPublisher::status_label(const ServiceStatus& status) {
    return std::string("Status: ") + status.name();
}

std::string StatusPublisher::action_label(const ServiceStatus& status) {
    switch (status.kind) {
        case ServiceStatus::Kind::Running:
        case ServiceStatus::Kind::Starting:
        case ServiceStatus::Kind::Restarting:
            return "Restart Service";
        case ServiceStatus::Kind::Stopped:
        case ServiceStatus::Kind::Error:
            return "Start Service";
    }
    return "Start Service";
}

std::string StatusPublisher::item_count_label(std::optional<std::uint64_t> count) {
    if (!count) return "Items: -";
    return "Items: " + std::to_string(*count);
}

bool StatusPublisher::poll_status() {
    ServiceStatus status = supervisor_.get_status();
    bool count_dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_status_ && *last_status_ == status) {
            return false;
        }
        last_status_ = status;
        labels_.status = status_label(status);
        labels_.action = action_label(status);

        // A count from the previous running period is no longer valid
        if (status.kind != ServiceStatus::Kind::Running && item_count_) {
            item_count_.reset();
            labels_.items = item_count_label(item_count_);
            count_dropped = true;
        }
    }

    spdlog::debug("[Publisher] Observed status {}", status.name());
    if (on_status_changed) {
        on_status_changed(status);
    }
    if (count_dropped && on_item_count_changed) {
        on_item_count_changed(std::nullopt);
    }
    return true;
}

bool StatusPublisher::poll_stats() {
    std::optional<std::uint64_t> count;
    if (supervisor_.get_status().kind == ServiceStatus::Kind::Running) {
        count = probe_.fetch_item_count();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // The status may have left Running while the request was in flight
        if (count && supervisor_.get_status().kind != ServiceStatus::Kind::Running) {
            count.reset();
        }
        if (count == item_count_) {
            return false;
        }
        item_count_ = count;
        labels_.items = item_count_label(count);
    }

    if (on_item_count_changed) {
        on_item_count_changed(count);
    }
    return true;
}

TrayLabels StatusPublisher::labels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return labels_;
}

void StatusPublisher::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&StatusPublisher::run, this);
}

void StatusPublisher::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StatusPublisher::run() {
    using clock = std::chrono::steady_clock;
    auto next_status = clock::now();
    auto next_stats = clock::now();

    while (running_.load()) {
        auto now = clock::now();
        if (now >= next_status) {
            poll_status();
            next_status = now + options_.status_interval;
        }
        if (now >= next_stats) {
            poll_stats();
            next_stats = now + options_.stats_interval;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}
