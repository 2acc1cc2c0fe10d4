#include <docket/service/HttpHelpers.hpp>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

#include <algorithm>

namespace DK::Service {

TokenBucketRateLimiter::TokenBucketRateLimiter(std::int64_t per_minute, std::int64_t burst)
    : capacity_{static_cast<double>(std::max<std::int64_t>(burst, 0))}
    , refill_per_second_{per_minute <= 0 ? 0.0 : static_cast<double>(per_minute) / 60.0} {}

auto TokenBucketRateLimiter::allow(std::string_view key, Clock::time_point now) -> bool {
    if (!enabled()) {
        return true;
    }

    std::string normalized_key = key.empty() ? std::string{"<unknown>"} : std::string{key};

    std::lock_guard const lock{mutex_};
    auto&                 bucket = buckets_[normalized_key];

    if (bucket.last_refill.time_since_epoch().count() == 0) {
        bucket.tokens      = capacity_;
        bucket.last_refill = now;
    } else if (now > bucket.last_refill) {
        auto const delta   = std::chrono::duration<double>(now - bucket.last_refill).count();
        bucket.tokens      = std::min(capacity_, bucket.tokens + delta * refill_per_second_);
        bucket.last_refill = now;
    }

    bucket.last_used = now;
    if (bucket.tokens < 1.0) {
        prune_locked(now);
        return false;
    }

    bucket.tokens -= 1.0;
    prune_locked(now);
    return true;
}

auto TokenBucketRateLimiter::enabled() const -> bool {
    return capacity_ > 0.0 && refill_per_second_ > 0.0;
}

void TokenBucketRateLimiter::prune_locked(Clock::time_point now) {
    if (++operations_since_prune_ < 512) {
        return;
    }
    operations_since_prune_ = 0;
    auto const max_idle     = std::chrono::minutes{10};
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if ((now - it->second.last_used) > max_idle) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

auto get_client_address(httplib::Request const& req) -> std::string {
    if (!req.remote_addr.empty()) {
        return req.remote_addr;
    }
    auto forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        return forwarded.substr(0, forwarded.find(','));
    }
    return "<unknown>";
}

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status, bool no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "bad_request"}, {"message", message}}, 400, true);
}

void respond_not_found(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "not_found"}, {"message", message}}, 404, true);
}

void respond_rate_limited(httplib::Response& res) {
    write_json_response(res,
                        nlohmann::json{{"error", "rate_limited"}, {"message", "Too many requests"}},
                        429,
                        true);
}

auto status_for_error(Error const& error) -> int {
    switch (error.code) {
    case Error::Code::StateNotFound:
    case Error::Code::CommissionNotFound:
        return 404;
    case Error::Code::MalformedInput:
        return 422;
    case Error::Code::RateLimited:
        return 429;
    case Error::Code::Timeout:
        return 504;
    case Error::Code::AllStrategiesExhausted:
    case Error::Code::UpstreamBlocked:
        return 503;
    case Error::Code::UpstreamError:
    case Error::Code::ParseFailure:
    case Error::Code::Unreachable:
    case Error::Code::NotSupported:
    case Error::Code::Empty:
        return 502;
    case Error::Code::InvalidConfiguration:
    case Error::Code::UnknownError:
        return 500;
    }
    return 500;
}

auto error_to_json(Error const& error) -> nlohmann::json {
    nlohmann::json body{{"error", std::string{errorCodeToString(error.code)}},
                        {"message", error.message.value_or(std::string{errorCodeToString(error.code)})}};
    if (error.code == Error::Code::StateNotFound || error.code == Error::Code::CommissionNotFound) {
        body["available"] = error.alternatives;
    }
    if (!error.attempts.empty()) {
        auto attempts = nlohmann::json::array();
        for (auto const& attempt : error.attempts) {
            attempts.push_back({{"tier", attempt.tier},
                                {"error", std::string{errorCodeToString(attempt.code)}},
                                {"message", attempt.message}});
        }
        body["attempts"] = std::move(attempts);
    }
    if (error.http_status) {
        body["upstream_status"] = *error.http_status;
    }
    return body;
}

void respond_error(httplib::Response& res, Error const& error) {
    write_json_response(res, error_to_json(error), status_for_error(error), true);
}

} // namespace DK::Service
