#include <doctest/doctest.h>
#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#include "httplib.h"

#include <docket/strategy/BrowserAutomationStrategy.hpp>
#include <docket/strategy/WebDriverClient.hpp>

#include "../DocketTestHelpers.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace DK;
using namespace DK::Test;
using namespace DK::Strategies;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

auto quick_browser_options(std::chrono::milliseconds timeout = 500ms) -> BrowserStrategyOptions {
    BrowserStrategyOptions options{};
    options.timeout       = timeout;
    options.poll_interval = 10ms;
    return options;
}

struct BrowserFixture {
    explicit BrowserFixture(std::size_t ready_after = 0, std::chrono::milliseconds timeout = 500ms) {
        auto driver = std::make_unique<FakeBrowserDriver>(
                log,
                state_select_page({{"10", "Andhra Pradesh"}, {"11", "Karnataka"}}),
                commission_select_page({{"1103", "Bangalore Urban"}, {"1104", "Mysore"}}),
                ready_after);
        fake_driver = driver.get();
        strategy    = std::make_unique<BrowserAutomationStrategy>(*portal.transport, std::move(driver),
                                                                quick_browser_options(timeout));
    }

    FakePortal                                 portal;
    std::shared_ptr<FakeBrowserSession::Log>   log = std::make_shared<FakeBrowserSession::Log>();
    FakeBrowserDriver*                         fake_driver{nullptr};
    std::unique_ptr<BrowserAutomationStrategy> strategy;
};

} // namespace

TEST_SUITE("strategy.browser") {

TEST_CASE("States are read once the rendered dropdown is populated") {
    BrowserFixture fixture{2};

    auto payload = fixture.strategy->probe(ListStatesOp{});
    REQUIRE(payload);
    REQUIRE(std::holds_alternative<OptionRows>(payload->data));
    CHECK(std::get<OptionRows>(payload->data).options.size() == 3);
    CHECK(fixture.log->polls == 3);
    CHECK(fixture.log->navigated == std::vector<std::string>{"https://portal.test/advance-case-search"});
    CHECK(fixture.log->closed == 1);
}

TEST_CASE("The search page is opened under a prefixed base URL") {
    auto options     = quick_transport_options();
    options.base_url = "https://host.test/portal/";
    FakePortal portal{options};
    auto       log    = std::make_shared<FakeBrowserSession::Log>();
    auto       driver = std::make_unique<FakeBrowserDriver>(log, state_select_page({{"11", "Karnataka"}}));
    BrowserAutomationStrategy strategy{*portal.transport, std::move(driver), quick_browser_options()};

    REQUIRE(strategy.probe(ListStatesOp{}));
    CHECK(log->navigated == std::vector<std::string>{"https://host.test/portal/advance-case-search"});
}

TEST_CASE("Commissions are read after choosing the state") {
    BrowserFixture fixture;

    auto payload = fixture.strategy->probe(ListCommissionsOp{"11"});
    REQUIRE(payload);
    REQUIRE(std::holds_alternative<OptionRows>(payload->data));
    auto const& options = std::get<OptionRows>(payload->data).options;
    CHECK(std::any_of(options.begin(), options.end(), [](auto const& option) { return option.value == "1104"; }));
    CHECK(fixture.log->chosen_states == std::vector<std::string>{"11"});
}

TEST_CASE("A state the dropdown does not offer is Empty") {
    BrowserFixture fixture;

    auto payload = fixture.strategy->probe(ListCommissionsOp{"99"});
    REQUIRE_FALSE(payload);
    CHECK(payload.error().code == Error::Code::Empty);
    CHECK(fixture.log->closed == 1);
}

TEST_CASE("Waiting is bounded by the probe timeout") {
    BrowserFixture fixture{1000000, 100ms};

    auto const started = std::chrono::steady_clock::now();
    auto       payload = fixture.strategy->probe(ListStatesOp{});
    REQUIRE_FALSE(payload);
    CHECK(payload.error().code == Error::Code::Unreachable);
    CHECK(std::chrono::steady_clock::now() - started < 2s);
    CHECK(fixture.log->closed == 1);
}

TEST_CASE("A browser that cannot start makes the tier unreachable") {
    BrowserFixture fixture;
    fixture.fake_driver->unavailable = true;

    auto payload = fixture.strategy->probe(ListStatesOp{});
    REQUIRE_FALSE(payload);
    CHECK(payload.error().code == Error::Code::Unreachable);
}

TEST_CASE("Searches and missing drivers are not supported") {
    BrowserFixture fixture;
    auto           search = fixture.strategy->probe(SearchCasesOp{SearchQuery{}});
    REQUIRE_FALSE(search);
    CHECK(search.error().code == Error::Code::NotSupported);
    CHECK(fixture.log->navigated.empty());

    FakePortal                portal;
    BrowserAutomationStrategy driverless{*portal.transport, nullptr};
    auto                      states = driverless.probe(ListStatesOp{});
    REQUIRE_FALSE(states);
    CHECK(states.error().code == Error::Code::NotSupported);
}

TEST_CASE("WebDriver capabilities follow the browser flags") {
    WebDriverOptions options{};
    options.user_agent = "docket-test";
    auto args          = WebDriverClient{options}.capabilities()["capabilities"]["alwaysMatch"]["goog:chromeOptions"]["args"];
    CHECK(std::find(args.begin(), args.end(), json("--headless=new")) != args.end());
    CHECK(std::find(args.begin(), args.end(), json("--user-agent=docket-test")) != args.end());

    options.headless = false;
    options.user_agent.clear();
    args = WebDriverClient{options}.capabilities()["capabilities"]["alwaysMatch"]["goog:chromeOptions"]["args"];
    CHECK(std::find(args.begin(), args.end(), json("--headless=new")) == args.end());
    CHECK(std::none_of(args.begin(), args.end(), [](json const& arg) {
        return arg.get<std::string>().starts_with("--user-agent=");
    }));
}

TEST_CASE("WebDriver sessions speak the W3C wire protocol") {
    httplib::Server  driver;
    std::atomic<int> deleted{0};
    std::string      navigated;
    std::mutex       navigated_mutex;

    driver.Post("/session", [](httplib::Request const& req, httplib::Response& res) {
        auto body = json::parse(req.body);
        auto ok   = body["capabilities"]["alwaysMatch"]["browserName"] == "chrome";
        res.set_content(json{{"value", {{"sessionId", ok ? "s-1" : ""}, {"capabilities", json::object()}}}}.dump(),
                        "application/json");
    });
    driver.Post(R"(/session/s-1/url)", [&](httplib::Request const& req, httplib::Response& res) {
        std::lock_guard const lock{navigated_mutex};
        navigated = json::parse(req.body)["url"].get<std::string>();
        res.set_content(R"({"value":null})", "application/json");
    });
    driver.Post(R"(/session/s-1/execute/sync)", [](httplib::Request const& req, httplib::Response& res) {
        auto args = json::parse(req.body)["args"];
        res.set_content(json{{"value", args.size()}}.dump(), "application/json");
    });
    driver.Get(R"(/session/s-1/source)", [](httplib::Request const&, httplib::Response& res) {
        res.set_content(R"({"value":"<html></html>"})", "application/json");
    });
    driver.Delete(R"(/session/s-1)", [&](httplib::Request const&, httplib::Response& res) {
        ++deleted;
        res.set_content(R"({"value":null})", "application/json");
    });

    auto        port   = driver.bind_to_any_port("127.0.0.1");
    std::thread worker = std::thread([&] { driver.listen_after_bind(); });
    driver.wait_until_ready();

    WebDriverOptions options{};
    options.url             = "http://127.0.0.1:" + std::to_string(port);
    options.command_timeout = 2s;
    {
        WebDriverClient client{options};
        auto            session = client.openSession();
        REQUIRE(session);
        CHECK((*session)->navigate("https://portal.test/advance-case-search"));
        auto count = (*session)->execute("return arguments.length;", json::array({1, 2}));
        REQUIRE(count);
        CHECK(*count == 2);
        auto source = (*session)->pageSource();
        REQUIRE(source);
        CHECK(*source == "<html></html>");
    }
    CHECK(deleted.load() == 1);
    {
        std::lock_guard const lock{navigated_mutex};
        CHECK(navigated == "https://portal.test/advance-case-search");
    }

    driver.stop();
    worker.join();
}

TEST_CASE("Malformed session replies are parse failures") {
    httplib::Server  driver;
    std::atomic<int> reply{0};

    driver.Post("/session", [&](httplib::Request const&, httplib::Response& res) {
        switch (reply.load()) {
            case 0: res.set_content(R"({"value":null})", "application/json"); break;
            case 1: res.set_content(R"({"value":{"sessionId":42}})", "application/json"); break;
            default:
                res.status = 500;
                res.set_content(R"({"value":{"error":7,"message":null}})", "application/json");
                break;
        }
    });

    auto        port   = driver.bind_to_any_port("127.0.0.1");
    std::thread worker = std::thread([&] { driver.listen_after_bind(); });
    driver.wait_until_ready();

    WebDriverOptions options{};
    options.url             = "http://127.0.0.1:" + std::to_string(port);
    options.command_timeout = 2s;
    WebDriverClient client{options};

    auto null_value = client.openSession();
    REQUIRE_FALSE(null_value);
    CHECK(null_value.error().code == Error::Code::ParseFailure);

    reply = 1;
    auto numeric_id = client.openSession();
    REQUIRE_FALSE(numeric_id);
    CHECK(numeric_id.error().code == Error::Code::ParseFailure);

    reply = 2;
    auto odd_error = client.openSession();
    REQUIRE_FALSE(odd_error);
    CHECK(odd_error.error().code == Error::Code::Unreachable);

    driver.stop();
    worker.join();
}

TEST_CASE("WebDriver URLs must be plain http") {
    WebDriverOptions options{};
    options.url = "https://remote-grid.test";
    auto session = WebDriverClient{options}.openSession();
    REQUIRE_FALSE(session);
    CHECK(session.error().code == Error::Code::InvalidConfiguration);
}

} // TEST_SUITE
