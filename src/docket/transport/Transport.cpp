#include <docket/transport/Transport.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/Text.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace DK::Net {

namespace {

auto is_auth_rejection(int status) -> bool {
    return status == 401 || status == 403;
}

auto build_target(HttpRequest const& request) -> std::string {
    std::string target = request.path.empty() ? std::string{"/"} : request.path;
    if (target.front() != '/') {
        target.insert(target.begin(), '/');
    }
    if (!request.query.empty()) {
        target.push_back(target.find('?') == std::string::npos ? '?' : '&');
        target.append(encode_params(request.query));
    }
    return target;
}

auto has_header(HeaderList const& headers, std::string_view name) -> bool {
    return std::any_of(headers.begin(), headers.end(), [&](auto const& header) {
        return Text::iequals(header.first, name);
    });
}

} // namespace

Transport::Transport(TransportOptions options, std::unique_ptr<HttpBackend> backend, Sleeper sleeper)
    : options_{std::move(options)}
    , backend_{std::move(backend)}
    , sleeper_{std::move(sleeper)} {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
    if (options_.max_retries < 0) {
        options_.max_retries = 0;
    }
}

auto Transport::initializeSession() -> Expected<void> {
    {
        std::lock_guard const lock{session_mutex_};
        if (session_) {
            return {};
        }
    }

    std::lock_guard const bootstrap{bootstrap_mutex_};
    {
        std::lock_guard const lock{session_mutex_};
        if (session_) {
            return {};
        }
    }

    dk_log("Bootstrapping portal session via " + options_.bootstrap_path, "Transport", "INFO");
    HttpRequest landing{};
    landing.method = HttpMethod::Get;
    landing.path   = options_.bootstrap_path;

    auto response = exchange_with_recovery(landing, false);
    if (!response) {
        dk_log("Session bootstrap failed: " + describeError(response.error()), "Transport", "WARN");
        return std::unexpected(response.error());
    }

    Session fresh{};
    for (auto const& header : response->headers_named("Set-Cookie")) {
        if (auto cookie = parse_set_cookie(header)) {
            fresh.cookies.insert_or_assign(cookie->first, cookie->second);
        }
    }
    fresh.csrf_token = extract_csrf_token(response->body);

    std::lock_guard const lock{session_mutex_};
    if (last_request_) {
        fresh.last_request = *last_request_;
    }
    session_ = std::move(fresh);
    dk_log("Session ready with " + std::to_string(session_->cookies.size()) + " cookie(s)"
                   + (session_->csrf_token ? " and a CSRF token" : ""),
           "Transport",
           "INFO");
    return {};
}

void Transport::adoptSession(Session session) {
    std::lock_guard const lock{session_mutex_};
    session_ = std::move(session);
}

void Transport::resetSession() {
    std::lock_guard const lock{session_mutex_};
    session_.reset();
}

auto Transport::session() const -> std::optional<Session> {
    std::lock_guard const lock{session_mutex_};
    return session_;
}

auto Transport::request(HttpRequest const& request) -> Expected<RawResponse> {
    if (auto ready = initializeSession(); !ready) {
        return std::unexpected(ready.error());
    }
    auto response = exchange_with_recovery(request, true);
    if (response) {
        merge_cookies(*response);
    }
    return response;
}

auto Transport::exchange_with_recovery(HttpRequest const& request, bool reauthenticate) -> Expected<RawResponse> {
    int  timeouts        = 0;
    bool cooled_down     = false;
    bool reauthenticated = false;

    while (true) {
        auto response = exchange(request);
        if (!response) {
            if (response.error().code != Error::Code::Timeout) {
                return std::unexpected(response.error());
            }
            if (timeouts >= options_.max_retries) {
                dk_log(std::string{method_name(request.method)} + " " + request.path + " timed out after "
                               + std::to_string(timeouts) + " retries",
                       "Transport",
                       "WARN");
                return makeError(Error::Code::Timeout,
                                 request.path + " timed out after " + std::to_string(timeouts) + " retries");
            }
            auto delay = options_.backoff_base * (1LL << timeouts);
            dk_log(request.path + " timed out, retrying in " + std::to_string(delay.count()) + "ms", "Transport", "INFO");
            ++timeouts;
            sleep_for(delay);
            continue;
        }

        auto const status = response->status;
        if (status == 429) {
            if (cooled_down) {
                return makeUpstreamError(Error::Code::RateLimited, status, std::move(response->body));
            }
            cooled_down = true;
            dk_log(request.path + " rate limited, cooling down for "
                           + std::to_string(options_.rate_limit_cooldown.count()) + "ms",
                   "Transport",
                   "WARN");
            sleep_for(options_.rate_limit_cooldown);
            continue;
        }
        if (is_auth_rejection(status)) {
            // The bootstrap never re-bootstraps itself.
            if (!reauthenticate || reauthenticated) {
                return makeUpstreamError(Error::Code::UpstreamBlocked, status, std::move(response->body));
            }
            reauthenticated = true;
            dk_log(request.path + " answered " + std::to_string(status) + ", re-bootstrapping session",
                   "Transport",
                   "WARN");
            resetSession();
            if (auto ready = initializeSession(); !ready) {
                return std::unexpected(ready.error());
            }
            continue;
        }
        if (status >= 400) {
            return makeUpstreamError(Error::Code::UpstreamError, status, std::move(response->body));
        }
        return response;
    }
}

auto Transport::get(std::string path, ParamList query, HeaderList headers) -> Expected<RawResponse> {
    HttpRequest req{};
    req.method  = HttpMethod::Get;
    req.path    = std::move(path);
    req.query   = std::move(query);
    req.headers = std::move(headers);
    return request(req);
}

auto Transport::postForm(std::string path, ParamList fields, HeaderList headers) -> Expected<RawResponse> {
    HttpRequest req{};
    req.method       = HttpMethod::Post;
    req.path         = std::move(path);
    req.form         = std::move(fields);
    req.content_type = "application/x-www-form-urlencoded";
    req.headers      = std::move(headers);
    return request(req);
}

auto Transport::postJson(std::string path, nlohmann::json const& payload, HeaderList headers) -> Expected<RawResponse> {
    HttpRequest req{};
    req.method       = HttpMethod::Post;
    req.path         = std::move(path);
    req.body         = payload.dump();
    req.content_type = "application/json";
    req.headers      = std::move(headers);
    return request(req);
}

void Transport::throttle() {
    std::lock_guard const gate{gate_mutex_};
    auto now = Clock::now();
    if (last_request_ && options_.min_request_interval.count() > 0) {
        auto ready_at = *last_request_ + options_.min_request_interval;
        if (now < ready_at) {
            sleep_for(std::chrono::duration_cast<std::chrono::milliseconds>(ready_at - now));
            now = std::max(Clock::now(), ready_at);
        }
    }
    last_request_ = now;

    std::lock_guard const lock{session_mutex_};
    if (session_) {
        session_->last_request = now;
    }
}

auto Transport::pageUrl(std::string_view path) const -> std::string {
    if (path.starts_with("http://") || path.starts_with("https://")) {
        return std::string{path};
    }
    return join_path(options_.base_url, path);
}

auto Transport::origin() const -> std::string {
    return url_origin(options_.base_url);
}

auto Transport::exchange(HttpRequest const& request) -> Expected<RawResponse> {
    throttle();

    HttpExchange ex{};
    ex.method  = request.method;
    ex.target  = build_target(request);
    ex.timeout = options_.request_timeout;
    ex.headers = request.headers;
    if (!has_header(ex.headers, "User-Agent") && !options_.user_agent.empty()) {
        ex.headers.emplace_back("User-Agent", options_.user_agent);
    }
    if (!has_header(ex.headers, "Accept")) {
        ex.headers.emplace_back("Accept", "text/html,application/xhtml+xml,application/json;q=0.9,*/*;q=0.8");
    }

    std::optional<std::string> csrf;
    {
        std::lock_guard const lock{session_mutex_};
        if (session_) {
            auto cookies = cookie_header(*session_);
            if (!cookies.empty()) {
                ex.headers.emplace_back("Cookie", std::move(cookies));
            }
            csrf = session_->csrf_token;
        }
    }

    if (request.method == HttpMethod::Post) {
        ex.content_type = request.content_type;
        if (request.form) {
            auto fields = *request.form;
            if (csrf) {
                fields.emplace_back("csrf-token", *csrf);
            }
            ex.body = encode_params(fields);
            if (ex.content_type.empty()) {
                ex.content_type = "application/x-www-form-urlencoded";
            }
        } else if (request.body) {
            ex.body = *request.body;
        }
        if (csrf) {
            ex.headers.emplace_back("X-CSRF-Token", *csrf);
        }
    }

    dk_log(std::string{method_name(ex.method)} + " " + ex.target, "Transport", "DEBUG");
    return backend_->perform(ex);
}

void Transport::merge_cookies(RawResponse const& response) {
    auto headers = response.headers_named("Set-Cookie");
    if (headers.empty()) {
        return;
    }
    std::lock_guard const lock{session_mutex_};
    if (!session_) {
        session_.emplace();
    }
    for (auto const& header : headers) {
        if (auto cookie = parse_set_cookie(header)) {
            session_->cookies.insert_or_assign(cookie->first, cookie->second);
        }
    }
}

void Transport::sleep_for(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        sleeper_(delay);
    }
}

} // namespace DK::Net
