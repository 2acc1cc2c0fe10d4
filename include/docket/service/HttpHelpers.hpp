#pragma once

#include <docket/core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace DK::Service {

class TokenBucketRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucketRateLimiter(std::int64_t per_minute, std::int64_t burst);

    auto allow(std::string_view key, Clock::time_point now = Clock::now()) -> bool;

private:
    struct Bucket {
        double            tokens{0.0};
        Clock::time_point last_refill{};
        Clock::time_point last_used{};
    };

    auto enabled() const -> bool;
    void prune_locked(Clock::time_point now);

    double                                  capacity_{0.0};
    double                                  refill_per_second_{0.0};
    std::unordered_map<std::string, Bucket> buckets_;
    std::size_t                             operations_since_prune_{0};
    std::mutex                              mutex_;
};

auto get_client_address(httplib::Request const& req) -> std::string;

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status, bool no_store = false);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_not_found(httplib::Response& res, std::string_view message);
void respond_rate_limited(httplib::Response& res);

// HTTP status an engine failure is reported with.
auto status_for_error(Error const& error) -> int;

// {"error": code, "message": ...} plus "available" for unknown names and "attempts" for exhaustion.
auto error_to_json(Error const& error) -> nlohmann::json;

void respond_error(httplib::Response& res, Error const& error);

} // namespace DK::Service
