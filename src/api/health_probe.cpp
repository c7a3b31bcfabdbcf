#include "api/health_probe.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <thread>

using json = nlohmann::json;

struct HealthProbe::Impl {
    HealthEndpoint endpoint;

    std::string base_url() const {
        return std::string(endpoint.tls ? "https://" : "http://") + endpoint.host + ":" +
               std::to_string(endpoint.port);
    }

    std::unique_ptr<httplib::Client> make_client() const {
        auto cli = std::make_unique<httplib::Client>(base_url());
        cli->set_connection_timeout(endpoint.timeout);
        cli->set_read_timeout(endpoint.timeout);
        cli->set_write_timeout(endpoint.timeout);
        return cli;
    }

    /// GET path; empty unless the response is 2xx
    std::optional<std::string> get(const std::string& path) const {
        auto cli = make_client();
        auto res = cli->Get(path);
        if (!res) {
            spdlog::debug("[Health] GET {} failed: {}", path, httplib::to_string(res.error()));
            return std::nullopt;
        }
        if (res->status < 200 || res->status >= 300) {
            spdlog::debug("[Health] GET {} returned status {}", path, res->status);
            return std::nullopt;
        }
        return res->body;
    }
};

HealthProbe::HealthProbe(const HealthEndpoint& endpoint)
    : impl_(std::make_unique<Impl>()) {
    impl_->endpoint = endpoint;
}

HealthProbe::~HealthProbe() = default;
HealthProbe::HealthProbe(HealthProbe&&) noexcept = default;
HealthProbe& HealthProbe::operator=(HealthProbe&&) noexcept = default;

const HealthEndpoint& HealthProbe::endpoint() const {
    return impl_->endpoint;
}

std::string HealthProbe::base_url() const {
    return impl_->base_url();
}

// ── Health ──────────────────────────────────────────────────

std::optional<HealthResponse> HealthProbe::check_once() const {
    auto body = impl_->get(impl_->endpoint.health_path);
    if (!body) return std::nullopt;

    try {
        auto j = json::parse(*body);
        if (!j.is_object() || !j.contains("status") || !j.contains("version") ||
            !j["status"].is_string() || !j["version"].is_string()) {
            spdlog::debug("[Health] Malformed health body: {}", *body);
            return std::nullopt;
        }
        HealthResponse health;
        health.status = j["status"].get<std::string>();
        health.version = j["version"].get<std::string>();
        return health;
    } catch (const json::exception& e) {
        spdlog::debug("[Health] Unparseable health body: {}", e.what());
        return std::nullopt;
    }
}

HealthWaitResult HealthProbe::wait_until_healthy(std::chrono::milliseconds deadline,
                                                 const std::function<bool()>& cancelled) const {
    using clock = std::chrono::steady_clock;
    HealthWaitResult result;
    const auto start = clock::now();
    const auto until = start + deadline;

    spdlog::info("[Health] Waiting for service health at {}{}...", base_url(),
                 impl_->endpoint.health_path);

    while (clock::now() < until) {
        if (cancelled && cancelled()) {
            result.cancelled = true;
            result.elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
            result.error = "Health wait cancelled";
            spdlog::info("[Health] Wait cancelled after {}ms", result.elapsed.count());
            return result;
        }

        if (auto health = check_once()) {
            result.success = true;
            result.health = *health;
            result.elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
            spdlog::info("[Health] Service is healthy (status: {}, version: {}) after {}ms",
                         health->status, health->version, result.elapsed.count());
            return result;
        }

        auto remaining = until - clock::now();
        if (remaining <= clock::duration::zero()) break;
        std::this_thread::sleep_for(
            std::min<clock::duration>(impl_->endpoint.poll_interval, remaining));
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
    result.error = "Health check timed out after " + std::to_string(result.elapsed.count()) + "ms";
    spdlog::warn("[Health] {}", result.error);
    return result;
}

// ── Stats ───────────────────────────────────────────────────

std::optional<std::uint64_t> HealthProbe::fetch_item_count() const {
    auto body = impl_->get(impl_->endpoint.stats_path);
    if (!body) return std::nullopt;

    try {
        auto j = json::parse(*body);
        const auto& total = j.at("items").at("total");
        if (!total.is_number_integer()) return std::nullopt;
        if (total.is_number_unsigned()) return total.get<std::uint64_t>();
        auto value = total.get<std::int64_t>();
        if (value < 0) return std::nullopt;
        return static_cast<std::uint64_t>(value);
    } catch (const json::exception& e) {
        spdlog::debug("[Health] Unusable stats body: {}", e.what());
        return std::nullopt;
    }
}
