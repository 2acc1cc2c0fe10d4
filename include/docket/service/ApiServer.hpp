#pragma once

#include <docket/core/DocketEngine.hpp>
#include <docket/core/Error.hpp>
#include <docket/service/HttpHelpers.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

namespace DK::Service {

inline constexpr std::string_view kApiVersion{"1.0.0"};

struct ApiServerOptions {
    std::string  host{"127.0.0.1"};
    int          port{8000}; // 0 binds an ephemeral port
    std::int64_t rate_limit_per_minute{120};
    std::int64_t rate_limit_burst{30};
};

auto apiServerOptionsFrom(DocketOptions const& options) -> ApiServerOptions;

// Reads {state, commission, search_value, case_type?, from_date?, to_date?}.
auto caseSearchRequestFromJson(nlohmann::json const& body, SearchType type) -> Expected<CaseSearchRequest>;

/**
 * JSON API in front of a DocketEngine:
 *   GET  /health
 *   GET  /api/v1/states
 *   GET  /api/v1/commissions/{state_id}
 *   POST /api/v1/cases/by-{search type, dashed}
 * Every /api route passes the per-client token bucket first.
 */
class ApiServer {
public:
    ApiServer(DocketEngine& engine, ApiServerOptions options);
    ~ApiServer();

    ApiServer(ApiServer const&)                    = delete;
    auto operator=(ApiServer const&) -> ApiServer& = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto               stop() -> void;
    auto               join() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;

private:
    auto configure_routes(httplib::Server& server) -> void;
    auto admit(httplib::Request const& req, httplib::Response& res) -> bool;
    auto handle_search(SearchType type, httplib::Request const& req, httplib::Response& res) -> void;

    DocketEngine&                    engine_;
    ApiServerOptions                 options_;
    TokenBucketRateLimiter           rate_limiter_;
    std::unique_ptr<httplib::Server> server_;
    std::thread                      server_thread_;
    std::atomic<bool>                running_{false};
    std::uint16_t                    bound_port_ = 0;
    mutable std::mutex               mutex_;
};

void RequestDocketServerStop();
void ResetDocketServerStopFlag();

// Serves until `should_stop` flips; on_listen reports the bind outcome once.
int RunDocketServerWithStopFlag(DocketEngine&                        engine,
                                DocketOptions const&                 options,
                                std::atomic<bool>&                   should_stop,
                                std::function<void(Expected<void>)> on_listen = {});

int RunDocketServer(DocketEngine& engine, DocketOptions const& options);

} // namespace DK::Service
