#include <doctest/doctest.h>
#include <docket/transport/Transport.hpp>

#include "../DocketTestHelpers.hpp"

#include <thread>

using namespace DK;
using namespace DK::Test;
using namespace std::chrono_literals;

namespace {

auto timeout() -> FakeBackend::Result {
    return std::unexpected(Error{Error::Code::Timeout, "deadline elapsed"});
}

auto header_value(Net::HttpExchange const& exchange, std::string const& name) -> std::optional<std::string> {
    for (auto const& [key, value] : exchange.headers) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

TEST_SUITE("transport") {

TEST_CASE("The first request bootstraps cookies and the CSRF token") {
    FakePortal fake;
    fake.get("/", {Net::RawResponse{200,
                                    "<meta name=\"csrf-token\" content=\"abc123\">",
                                    {{"Set-Cookie", "JSESSIONID=s1; Path=/; HttpOnly"},
                                     {"set-cookie", "lang=\"en\""}}}});
    fake.get("/api/states", {json_response({{"data", nlohmann::json::array({1})}})});

    auto response = fake.transport->get("/api/states");
    REQUIRE(response);
    CHECK(response->status == 200);

    auto session = fake.transport->session();
    REQUIRE(session);
    CHECK(session->cookies.at("JSESSIONID") == "s1");
    CHECK(session->cookies.at("lang") == "en");
    CHECK(session->csrf_token == std::optional<std::string>{"abc123"});

    auto exchanges = FakeBackend::exchanges(*fake.portal);
    REQUIRE(exchanges.size() == 2);
    CHECK(exchanges[0].target == "/");
    CHECK(header_value(exchanges[1], "Cookie") == std::optional<std::string>{"JSESSIONID=s1; lang=en"});
    CHECK(header_value(exchanges[1], "User-Agent").has_value());
}

TEST_CASE("Form posts carry the CSRF token as field and header") {
    FakePortal fake;
    fake.post("/ajax/getCommissions", {html_response("<select></select>")});

    auto response = fake.transport->postForm("/ajax/getCommissions", {{"state_code", "11"}});
    REQUIRE(response);

    auto exchanges = FakeBackend::exchanges(*fake.portal);
    auto const& post = exchanges.back();
    CHECK(post.method == Net::HttpMethod::Post);
    CHECK(post.content_type == "application/x-www-form-urlencoded");
    CHECK(post.body == "state_code=11&csrf-token=tok-1");
    CHECK(header_value(post, "X-CSRF-Token") == std::optional<std::string>{"tok-1"});
}

TEST_CASE("Query parameters are encoded onto the target") {
    FakePortal fake;
    fake.get("/api/commissions", {json_response(nlohmann::json::array())});
    REQUIRE(fake.transport->get("/api/commissions", {{"state id", "a&b"}}));
    CHECK(FakeBackend::exchanges(*fake.portal).back().target == "/api/commissions?state%20id=a%26b");
}

TEST_CASE("Timeouts retry with exponential backoff, then fail") {
    FakePortal fake;
    fake.get("/slow", {timeout()});

    auto response = fake.transport->get("/slow");
    REQUIRE_FALSE(response);
    CHECK(response.error().code == Error::Code::Timeout);
    CHECK(fake.hits("/slow") == 4);
    CHECK(*fake.sleeps.delays == std::vector<std::chrono::milliseconds>{100ms, 200ms, 400ms});
}

TEST_CASE("A timeout followed by success recovers") {
    FakePortal fake;
    fake.get("/flaky", {timeout(), html_response("ok")});

    auto response = fake.transport->get("/flaky");
    REQUIRE(response);
    CHECK(response->body == "ok");
    CHECK(fake.hits("/flaky") == 2);
}

TEST_CASE("HTTP 429 cools down once, then reports RateLimited") {
    FakePortal fake;
    fake.get("/busy", {status_response(429)});

    auto response = fake.transport->get("/busy");
    REQUIRE_FALSE(response);
    CHECK(response.error().code == Error::Code::RateLimited);
    CHECK(response.error().http_status == std::optional<int>{429});
    CHECK(fake.hits("/busy") == 2);
    CHECK(*fake.sleeps.delays == std::vector<std::chrono::milliseconds>{5000ms});

    FakePortal recovering;
    recovering.get("/busy", {status_response(429), html_response("fine")});
    auto second = recovering.transport->get("/busy");
    REQUIRE(second);
    CHECK(second->body == "fine");
}

TEST_CASE("HTTP 401/403 re-bootstraps the session once") {
    FakePortal fake;
    fake.get("/", {Net::RawResponse{200, "", {{"Set-Cookie", "sid=first"}}},
                   Net::RawResponse{200, "", {{"Set-Cookie", "sid=second"}}}});
    fake.get("/guarded", {status_response(403), html_response("granted")});

    auto response = fake.transport->get("/guarded");
    REQUIRE(response);
    CHECK(fake.hits("/") == 2);
    CHECK(fake.transport->session()->cookies.at("sid") == "second");

    FakePortal blocked;
    blocked.get("/guarded", {status_response(401)});
    auto denied = blocked.transport->get("/guarded");
    REQUIRE_FALSE(denied);
    CHECK(denied.error().code == Error::Code::UpstreamBlocked);
    CHECK(blocked.hits("/guarded") == 2);
}

TEST_CASE("Other error statuses fail without retry") {
    FakePortal fake;
    fake.get("/broken", {Net::RawResponse{500, "boom", {}}});

    auto response = fake.transport->get("/broken");
    REQUIRE_FALSE(response);
    CHECK(response.error().code == Error::Code::UpstreamError);
    CHECK(response.error().http_status == std::optional<int>{500});
    CHECK(response.error().body == "boom");
    CHECK(fake.hits("/broken") == 1);
}

TEST_CASE("A landing page timeout is retried with backoff") {
    FakePortal fake;
    fake.get("/", {timeout(), html_response("<meta name=\"csrf-token\" content=\"late\">")});
    fake.get("/api/states", {json_response(nlohmann::json::array())});

    auto response = fake.transport->get("/api/states");
    REQUIRE(response);
    CHECK(fake.hits("/") == 2);
    CHECK(*fake.sleeps.delays == std::vector<std::chrono::milliseconds>{100ms});
    CHECK(fake.transport->session()->csrf_token == std::optional<std::string>{"late"});
}

TEST_CASE("A landing page 429 cools down before the bootstrap retry") {
    FakePortal fake;
    fake.get("/", {status_response(429), html_response("<meta name=\"csrf-token\" content=\"t\">")});
    fake.get("/api/states", {json_response(nlohmann::json::array())});

    auto response = fake.transport->get("/api/states");
    REQUIRE(response);
    CHECK(fake.hits("/") == 2);
    CHECK(*fake.sleeps.delays == std::vector<std::chrono::milliseconds>{5000ms});
}

TEST_CASE("An exhausted bootstrap is the request's failure") {
    SUBCASE("timeouts") {
        FakePortal fake;
        fake.get("/", {timeout()});
        auto response = fake.transport->get("/api/states");
        REQUIRE_FALSE(response);
        CHECK(response.error().code == Error::Code::Timeout);
        CHECK(fake.hits("/") == 4);
        CHECK(fake.hits("/api/states") == 0);
        CHECK(*fake.sleeps.delays == std::vector<std::chrono::milliseconds>{100ms, 200ms, 400ms});
        CHECK_FALSE(fake.transport->session().has_value());
    }
    SUBCASE("rate limited twice") {
        FakePortal fake;
        fake.get("/", {status_response(429)});
        auto response = fake.transport->get("/api/states");
        REQUIRE_FALSE(response);
        CHECK(response.error().code == Error::Code::RateLimited);
        CHECK(fake.hits("/") == 2);
    }
    SUBCASE("blocked landing page") {
        FakePortal fake;
        fake.get("/", {status_response(403)});
        auto response = fake.transport->get("/api/states");
        REQUIRE_FALSE(response);
        CHECK(response.error().code == Error::Code::UpstreamBlocked);
        CHECK(fake.hits("/") == 1);
    }
    SUBCASE("connection refused") {
        FakePortal fake;
        fake.get("/", {std::unexpected(Error{Error::Code::Unreachable, "connection refused"})});
        auto response = fake.transport->get("/api/states");
        REQUIRE_FALSE(response);
        CHECK(response.error().code == Error::Code::Unreachable);
        CHECK(fake.hits("/") == 1);
        CHECK(fake.hits("/api/states") == 0);
        CHECK_FALSE(fake.transport->session().has_value());
    }
}

TEST_CASE("An adopted session skips the bootstrap") {
    FakePortal fake;
    Net::Session session{};
    session.cookies["auth"] = "otp-verified";
    fake.transport->adoptSession(session);
    fake.get("/api/states", {json_response(nlohmann::json::array())});

    REQUIRE(fake.transport->get("/api/states"));
    CHECK(fake.hits("/") == 0);
    CHECK(header_value(FakeBackend::exchanges(*fake.portal).back(), "Cookie")
          == std::optional<std::string>{"auth=otp-verified"});
}

TEST_CASE("Requests are spaced by the minimum interval") {
    auto options                 = quick_transport_options();
    options.min_request_interval = 1000ms;
    FakePortal fake{options};
    fake.get("/a", {html_response("a")});

    REQUIRE(fake.transport->get("/a"));
    REQUIRE(fake.transport->get("/a"));

    // The recording sleeper does not block, so each admission is scheduled one interval after the previous.
    auto const& delays = *fake.sleeps.delays;
    REQUIRE(delays.size() == 2);
    CHECK(delays[0] > 900ms);
    CHECK(delays[0] <= 1000ms);
    CHECK(delays[1] > 1900ms);
    CHECK(delays[1] <= 2000ms);
}

TEST_CASE("Concurrent first calls share one bootstrap") {
    FakePortal fake;
    fake.get("/a", {html_response("a")});

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&] { CHECK(fake.transport->get("/a")); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    CHECK(fake.hits("/") == 1);
    CHECK(fake.hits("/a") == 4);
}

TEST_CASE("Page URLs keep the base URL's path prefix") {
    FakePortal plain;
    CHECK(plain.transport->pageUrl("/advance-case-search") == "https://portal.test/advance-case-search");
    CHECK(plain.transport->origin() == "https://portal.test");

    auto options     = quick_transport_options();
    options.base_url = "https://host.test:8443/portal/";
    FakePortal prefixed{options};
    CHECK(prefixed.transport->pageUrl("/advance-case-search") == "https://host.test:8443/portal/advance-case-search");
    CHECK(prefixed.transport->pageUrl("advance-case-search") == "https://host.test:8443/portal/advance-case-search");
    CHECK(prefixed.transport->pageUrl("http://other.test/y") == "http://other.test/y");
    CHECK(prefixed.transport->origin() == "https://host.test:8443");
}

} // TEST_SUITE
