#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif

#include "httplib.h"

#include <docket/strategy/WebDriverClient.hpp>
#include <docket/transport/HttpTypes.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace DK::Strategies {

namespace {

using json = nlohmann::json;

auto string_field(json const& object, char const* key) -> std::string {
    if (!object.is_object()) {
        return {};
    }
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

class WireClient {
public:
    WireClient(Net::UrlParts endpoint, std::chrono::milliseconds timeout)
        : endpoint_{std::move(endpoint)}
        , client_{endpoint_.host, endpoint_.port} {
        auto sec  = static_cast<time_t>(timeout.count() / 1000);
        auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        client_.set_connection_timeout(sec, usec);
        client_.set_read_timeout(sec, usec);
        client_.set_write_timeout(sec, usec);
    }

    // Issues one command and unwraps the protocol's {"value": ...} envelope.
    auto command(std::string const& method, std::string const& path, json const& body = json::object())
            -> Expected<json> {
        auto target = join(path);
        auto result = method == "GET"      ? client_.Get(target)
                      : method == "DELETE" ? client_.Delete(target)
                                           : client_.Post(target, body.dump(), "application/json");
        if (!result) {
            auto error = result.error();
            auto code  = error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read
                                ? Error::Code::Timeout
                                : Error::Code::Unreachable;
            return makeError(code, "webdriver " + method + " " + path + ": " + httplib::to_string(error));
        }
        auto document = json::parse(result->body, nullptr, false);
        if (document.is_discarded() || !document.is_object()) {
            return makeError(Error::Code::ParseFailure, "webdriver " + path + " answered non-JSON");
        }
        auto value = document.value("value", json{});
        if (result->status >= 400) {
            auto message = value.is_object() ? string_field(value, "error") + ": " + string_field(value, "message")
                                             : std::string{"HTTP "} + std::to_string(result->status);
            return makeError(Error::Code::Unreachable, "webdriver " + path + " " + message);
        }
        return value;
    }

private:
    auto join(std::string const& path) const -> std::string {
        auto prefix = endpoint_.path;
        while (!prefix.empty() && prefix.back() == '/') {
            prefix.pop_back();
        }
        return prefix + path;
    }

    Net::UrlParts   endpoint_;
    httplib::Client client_;
};

class WebDriverSession final : public BrowserSession {
public:
    WebDriverSession(std::unique_ptr<WireClient> wire, std::string id)
        : wire_{std::move(wire)}
        , id_{std::move(id)} {}

    ~WebDriverSession() override {
        auto closed = wire_->command("DELETE", "/session/" + id_);
        if (!closed) {
            dk_log("Could not close browser session " + id_ + ": " + describeError(closed.error()), "Strategy", "WARN");
        }
    }

    WebDriverSession(WebDriverSession const&)            = delete;
    WebDriverSession& operator=(WebDriverSession const&) = delete;

    auto navigate(std::string const& url) -> Expected<void> override {
        auto result = wire_->command("POST", "/session/" + id_ + "/url", json{{"url", url}});
        if (!result) {
            return std::unexpected(result.error());
        }
        return {};
    }

    auto execute(std::string const& script, json const& args) -> Expected<json> override {
        return wire_->command("POST",
                              "/session/" + id_ + "/execute/sync",
                              json{{"script", script}, {"args", args.is_array() ? args : json::array()}});
    }

    auto pageSource() -> Expected<std::string> override {
        auto value = wire_->command("GET", "/session/" + id_ + "/source");
        if (!value) {
            return std::unexpected(value.error());
        }
        if (!value->is_string()) {
            return makeError(Error::Code::ParseFailure, "page source is not a string");
        }
        return value->get<std::string>();
    }

private:
    std::unique_ptr<WireClient> wire_;
    std::string                 id_;
};

} // namespace

WebDriverClient::WebDriverClient(WebDriverOptions options)
    : options_{std::move(options)} {}

auto WebDriverClient::capabilities() const -> nlohmann::json {
    json args = json::array({"--no-sandbox", "--disable-dev-shm-usage", "--disable-gpu", "--window-size=1920,1080"});
    if (options_.headless) {
        args.push_back("--headless=new");
    }
    if (!options_.user_agent.empty()) {
        args.push_back("--user-agent=" + options_.user_agent);
    }
    auto const timeout_ms = options_.command_timeout.count();
    return json{{"capabilities",
                 {{"alwaysMatch",
                   {{"browserName", "chrome"},
                    {"goog:chromeOptions", {{"args", args}}},
                    {"timeouts", {{"pageLoad", timeout_ms}, {"script", timeout_ms}}}}}}}};
}

auto WebDriverClient::openSession() -> Expected<std::unique_ptr<BrowserSession>> {
    auto endpoint = Net::parse_url(options_.url);
    if (!endpoint || endpoint->tls) {
        return makeError(Error::Code::InvalidConfiguration, "unsupported webdriver url: " + options_.url);
    }
    auto wire    = std::make_unique<WireClient>(*endpoint, options_.command_timeout);
    auto created = wire->command("POST", "/session", capabilities());
    if (!created) {
        return std::unexpected(created.error());
    }
    auto id = string_field(*created, "sessionId");
    if (id.empty()) {
        return makeError(Error::Code::ParseFailure, "webdriver returned no session id");
    }
    dk_log("Opened browser session " + id, "Strategy", "INFO");
    return std::make_unique<WebDriverSession>(std::move(wire), std::move(id));
}

} // namespace DK::Strategies
