#include <docket/service/ApiServer.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/Text.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <utility>

namespace DK::Service {

static std::atomic<bool> g_should_stop{false};

namespace {

constexpr std::array<SearchType, 7> kSearchRoutes{SearchType::CaseNumber,
                                                  SearchType::Complainant,
                                                  SearchType::Respondent,
                                                  SearchType::ComplainantAdvocate,
                                                  SearchType::RespondentAdvocate,
                                                  SearchType::IndustryType,
                                                  SearchType::Judge};

auto route_suffix(SearchType type) -> std::string {
    std::string suffix{searchTypeToString(type)};
    for (auto& ch : suffix) {
        if (ch == '_') {
            ch = '-';
        }
    }
    return suffix;
}

auto optional_string(nlohmann::json const& body, char const* key) -> Expected<std::optional<std::string>> {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return makeError(Error::Code::MalformedInput, std::string{key} + " must be a string");
    }
    auto value = Text::trim(it->get<std::string>());
    if (value.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::move(value)};
}

auto required_string(nlohmann::json const& body, char const* key) -> Expected<std::string> {
    auto value = optional_string(body, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!value->has_value()) {
        return makeError(Error::Code::MalformedInput, std::string{key} + " is required and must not be empty");
    }
    return std::move(**value);
}

} // namespace

auto apiServerOptionsFrom(DocketOptions const& options) -> ApiServerOptions {
    ApiServerOptions server{};
    server.host                  = options.host;
    server.port                  = options.port;
    server.rate_limit_per_minute = options.rate_limit_per_minute;
    server.rate_limit_burst      = options.rate_limit_burst;
    return server;
}

auto caseSearchRequestFromJson(nlohmann::json const& body, SearchType type) -> Expected<CaseSearchRequest> {
    if (!body.is_object()) {
        return makeError(Error::Code::MalformedInput, "request body must be a JSON object");
    }
    CaseSearchRequest request{};
    request.search_type = type;

    auto state = required_string(body, "state");
    if (!state) {
        return std::unexpected(state.error());
    }
    auto commission = required_string(body, "commission");
    if (!commission) {
        return std::unexpected(commission.error());
    }
    auto value = required_string(body, "search_value");
    if (!value) {
        return std::unexpected(value.error());
    }
    request.state        = std::move(*state);
    request.commission   = std::move(*commission);
    request.search_value = std::move(*value);

    auto case_type = optional_string(body, "case_type");
    if (!case_type) {
        return std::unexpected(case_type.error());
    }
    if (*case_type) {
        auto parsed = parseCaseType(**case_type);
        if (!parsed) {
            return makeError(Error::Code::MalformedInput, "unknown case_type '" + **case_type + "'");
        }
        request.case_type = *parsed;
    }

    auto from = optional_string(body, "from_date");
    if (!from) {
        return std::unexpected(from.error());
    }
    auto to = optional_string(body, "to_date");
    if (!to) {
        return std::unexpected(to.error());
    }
    request.from_date = std::move(*from);
    request.to_date   = std::move(*to);
    return request;
}

ApiServer::ApiServer(DocketEngine& engine, ApiServerOptions options)
    : engine_{engine}
    , options_{std::move(options)}
    , rate_limiter_{options_.rate_limit_per_minute, options_.rate_limit_burst} {}

ApiServer::~ApiServer() {
    this->stop();
    this->join();
}

auto ApiServer::start() -> Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return makeError(Error::Code::InvalidConfiguration, "API server already running");
    }

    server_ = std::make_unique<httplib::Server>();
    this->configure_routes(*server_);

    auto requested_port = options_.port < 0 ? 0 : options_.port;
    int  bound_port     = requested_port;
    if (requested_port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return makeError(Error::Code::Unreachable, "failed to bind " + options_.host);
        }
    } else if (!server_->bind_to_port(options_.host, requested_port)) {
        server_.reset();
        return makeError(Error::Code::Unreachable,
                         "failed to bind " + options_.host + ":" + std::to_string(requested_port));
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    running_.store(true);

    server_thread_ = std::thread([this]() {
        set_thread_name("ApiServer");
        if (server_) {
            server_->listen_after_bind();
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();
    if (!server_ || !server_->is_running()) {
        if (server_) {
            server_->stop();
        }
        lock.unlock();
        this->join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return makeError(Error::Code::Unreachable, "API server failed to start listening");
    }

    dk_log("Listening on http://" + options_.host + ":" + std::to_string(bound_port_), "Service", "INFO");
    return {};
}

auto ApiServer::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    this->join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto ApiServer::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto ApiServer::is_running() const -> bool {
    return running_.load();
}

auto ApiServer::port() const -> std::uint16_t {
    return bound_port_;
}

auto ApiServer::admit(httplib::Request const& req, httplib::Response& res) -> bool {
    auto client = get_client_address(req);
    if (rate_limiter_.allow(client)) {
        return true;
    }
    dk_log("Rate limited " + client + " on " + req.path, "Service", "WARN");
    respond_rate_limited(res);
    return false;
}

auto ApiServer::configure_routes(httplib::Server& server) -> void {
    server.Get("/health", [](httplib::Request const&, httplib::Response& res) {
        write_json_response(res, nlohmann::json{{"status", "healthy"}, {"version", std::string{kApiVersion}}}, 200);
    });

    server.Get("/api/v1/states", [this](httplib::Request const& req, httplib::Response& res) {
        if (!admit(req, res)) {
            return;
        }
        auto states = engine_.listStates();
        if (!states) {
            respond_error(res, states.error());
            return;
        }
        write_json_response(res, nlohmann::json{{"states", *states}, {"total", states->size()}}, 200);
    });

    server.Get(R"(/api/v1/commissions/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        if (!admit(req, res)) {
            return;
        }
        std::string state_id = req.matches[1];
        auto        commissions = engine_.listCommissions(state_id);
        if (!commissions) {
            respond_error(res, commissions.error());
            return;
        }
        write_json_response(
                res,
                nlohmann::json{{"commissions", *commissions}, {"total", commissions->size()}, {"state_id", state_id}},
                200);
    });

    for (auto type : kSearchRoutes) {
        server.Post("/api/v1/cases/by-" + route_suffix(type),
                    [this, type](httplib::Request const& req, httplib::Response& res) {
                        this->handle_search(type, req, res);
                    });
    }

    server.set_error_handler([](httplib::Request const& req, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) {
            respond_not_found(res, "no route for " + req.path);
        }
    });
}

auto ApiServer::handle_search(SearchType type, httplib::Request const& req, httplib::Response& res) -> void {
    if (!admit(req, res)) {
        return;
    }
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
        respond_bad_request(res, "request body is not valid JSON");
        return;
    }
    auto request = caseSearchRequestFromJson(body, type);
    if (!request) {
        respond_error(res, request.error());
        return;
    }
    auto records = engine_.searchCasesByName(*request);
    if (!records) {
        dk_log("Search by " + std::string{searchTypeToString(type)} + " failed: " + describeError(records.error()),
               "Service",
               "WARN");
        respond_error(res, records.error());
        return;
    }
    write_json_response(res, nlohmann::json(*records), 200);
}

void RequestDocketServerStop() {
    g_should_stop.store(true);
}

void ResetDocketServerStopFlag() {
    g_should_stop.store(false);
}

int RunDocketServerWithStopFlag(DocketEngine&                        engine,
                                DocketOptions const&                 options,
                                std::atomic<bool>&                   should_stop,
                                std::function<void(Expected<void>)> on_listen) {
    ApiServer server{engine, apiServerOptionsFrom(options)};
    auto      started = server.start();
    if (on_listen) {
        on_listen(started);
    }
    if (!started) {
        std::cerr << "[docket_server] " << describeError(started.error()) << '\n';
        return EXIT_FAILURE;
    }

    std::cout << "[docket_server] Listening on http://" << options.host << ":" << server.port() << '\n';

    while (!should_stop.load(std::memory_order_acquire) && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    bool const crashed = !should_stop.load(std::memory_order_acquire);
    server.stop();
    if (crashed) {
        std::cerr << "[docket_server] listener stopped unexpectedly\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int RunDocketServer(DocketEngine& engine, DocketOptions const& options) {
    return RunDocketServerWithStopFlag(engine, options, g_should_stop, {});
}

} // namespace DK::Service
