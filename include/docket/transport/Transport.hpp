#pragma once

#include <docket/core/Error.hpp>
#include <docket/transport/HttpTypes.hpp>
#include <docket/transport/Session.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace DK::Net {

struct TransportOptions {
    std::string               base_url{"https://e-jagriti.gov.in"};
    std::chrono::milliseconds request_timeout{std::chrono::seconds{30}};
    int                       max_retries{3};
    std::chrono::milliseconds backoff_base{std::chrono::seconds{1}};
    std::chrono::milliseconds min_request_interval{std::chrono::seconds{1}};
    std::chrono::milliseconds rate_limit_cooldown{std::chrono::seconds{60}};
    std::string               bootstrap_path{"/"};
    std::string               user_agent{
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36"};
};

/**
 * Resilient HTTP client shared by every tier that talks to the portal.
 *
 * All exchanges pass one serialized rate gate, so no two requests start within
 * min_request_interval of each other regardless of how many callers are waiting.
 * The Session lives for the lifetime of the Transport and is only touched under
 * session_mutex_; concurrent first calls collapse into a single bootstrap.
 *
 * Recovery policy per logical request, the bootstrap GET included:
 *   - timeout: up to max_retries retries, sleeping backoff_base * 2^attempt;
 *   - 429: one cooldown sleep and retry, then RateLimited;
 *   - 401/403: session reset, re-bootstrap and one retry, then UpstreamBlocked
 *     (the bootstrap itself answers UpstreamBlocked at once);
 *   - other 4xx/5xx: UpstreamError without retry.
 */
class Transport {
public:
    using Clock   = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Transport(TransportOptions options, std::unique_ptr<HttpBackend> backend, Sleeper sleeper = {});

    Transport(Transport const&)            = delete;
    Transport& operator=(Transport const&) = delete;

    auto initializeSession() -> Expected<void>;
    void adoptSession(Session session);
    void resetSession();
    auto session() const -> std::optional<Session>;

    auto request(HttpRequest const& request) -> Expected<RawResponse>;

    auto get(std::string path, ParamList query = {}, HeaderList headers = {}) -> Expected<RawResponse>;
    auto postForm(std::string path, ParamList fields, HeaderList headers = {}) -> Expected<RawResponse>;
    auto postJson(std::string path, nlohmann::json const& payload, HeaderList headers = {}) -> Expected<RawResponse>;

    // Blocks until the rate gate admits one more upstream hit.
    void throttle();

    // Absolute URL of a portal path, under the base URL's own path like every request target.
    auto pageUrl(std::string_view path) const -> std::string;
    auto origin() const -> std::string;

    auto options() const -> TransportOptions const& { return options_; }

private:
    auto exchange(HttpRequest const& request) -> Expected<RawResponse>;
    // Timeout backoff and 429 cooldown; 401/403 re-bootstraps only when reauthenticate is set.
    auto exchange_with_recovery(HttpRequest const& request, bool reauthenticate) -> Expected<RawResponse>;
    void merge_cookies(RawResponse const& response);
    void sleep_for(std::chrono::milliseconds delay);

    TransportOptions             options_;
    std::unique_ptr<HttpBackend> backend_;
    Sleeper                      sleeper_;

    std::optional<Session> session_;
    mutable std::mutex     session_mutex_;
    std::mutex             bootstrap_mutex_;

    std::optional<Clock::time_point> last_request_;
    std::mutex                       gate_mutex_;
};

} // namespace DK::Net
