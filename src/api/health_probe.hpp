#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

struct HealthResponse {
    std::string status;
    std::string version;
};

struct HealthWaitResult {
    bool success = false;
    HealthResponse health;
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};
    std::string error;
};

struct HealthEndpoint {
    std::string host = "127.0.0.1";
    int port = 8000;
    bool tls = false;
    std::string health_path = "/health";
    std::string stats_path = "/v2/stats";
    std::chrono::milliseconds timeout{2000};
    std::chrono::milliseconds poll_interval{250};
};

/// HTTP client for the supervised service's health and stats endpoints.
/// Every call is bounded by the endpoint timeout and never throws.
class HealthProbe {
public:
    explicit HealthProbe(const HealthEndpoint& endpoint);
    ~HealthProbe();

    HealthProbe(HealthProbe&&) noexcept;
    HealthProbe& operator=(HealthProbe&&) noexcept;

    /// One GET on the health path. Empty on connection failure, timeout,
    /// non-2xx status or a body that is not {status, version}.
    std::optional<HealthResponse> check_once() const;

    /// Poll check_once() until it succeeds or the deadline elapses.
    /// `cancelled` is checked between probes and ends the wait early.
    HealthWaitResult wait_until_healthy(std::chrono::milliseconds deadline,
                                        const std::function<bool()>& cancelled = nullptr) const;

    /// items.total from the stats endpoint; empty when unavailable
    std::optional<std::uint64_t> fetch_item_count() const;

    const HealthEndpoint& endpoint() const;

    /// "http://127.0.0.1:8000"
    std::string base_url() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
