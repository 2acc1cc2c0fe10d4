#include <doctest/doctest.h>
#include <docket/core/DocketEngine.hpp>

#include "../DocketTestHelpers.hpp"

#include <algorithm>

using namespace DK;
using namespace DK::Test;

namespace {

auto by_name(SearchType type, std::string state, std::string commission, std::string value) -> CaseSearchRequest {
    CaseSearchRequest request{};
    request.search_type  = type;
    request.state        = std::move(state);
    request.commission   = std::move(commission);
    request.search_value = std::move(value);
    return request;
}

} // namespace

TEST_SUITE("core.engine") {

TEST_CASE("States come from the form tier when no API answers, then from cache") {
    FakeDocket docket;

    auto states = docket.engine->listStates();
    REQUIRE(states);
    REQUIRE(states->size() == 3);
    CHECK((*states)[1] == State{"11", "KARNATAKA", "Karnataka"});
    CHECK(docket.hits("/api/states") == 1);
    CHECK(docket.hits("/graphql") == 1);

    auto const before = docket.total();
    auto       again  = docket.engine->listStates();
    REQUIRE(again);
    CHECK(*again == *states);
    CHECK(docket.total() == before);
}

TEST_CASE("Five scraped states are cached and resolve in any casing") {
    FakeDocket docket;
    docket.get("/advance-case-search",
               {html_response(state_select_page({{"27", "Maharashtra"},
                                                 {"28", "Andhra Pradesh"},
                                                 {"29", "Karnataka"},
                                                 {"32", "Kerala"},
                                                 {"33", "Tamil Nadu"}}))});

    auto states = docket.engine->listStates();
    REQUIRE(states);
    REQUIRE(states->size() == 5);
    CHECK((*states)[2] == State{"29", "KARNATAKA", "Karnataka"});

    auto const before = docket.total();
    auto       again  = docket.engine->listStates();
    REQUIRE(again);
    CHECK(*again == *states);
    CHECK(docket.total() == before);

    for (auto const* spelling : {"karnataka", "KARNATAKA", "Karnataka", "kArNaTaKa"}) {
        auto state = docket.engine->resolveState(spelling);
        REQUIRE(state);
        CHECK(state->id == "29");
    }
    CHECK(docket.total() == before);
}

TEST_CASE("Tier order is direct API, then form scraping") {
    FakeDocket docket;
    CHECK(docket.engine->chain().tierNames(OperationKind::ListStates)
          == std::vector<std::string>{"direct_api", "form_scrape"});
    CHECK(docket.engine->chain().tierNames(OperationKind::SearchCases)
          == std::vector<std::string>{"direct_api", "form_scrape"});
}

TEST_CASE("Names resolve case-insensitively and misses list alternatives") {
    FakeDocket docket;

    auto karnataka = docket.engine->resolveState("  karnataka ");
    REQUIRE(karnataka);
    CHECK(karnataka->id == "11");

    auto goa = docket.engine->resolveState("Goa");
    REQUIRE_FALSE(goa);
    CHECK(goa.error().code == Error::Code::StateNotFound);
    CHECK(goa.error().alternatives.size() == 3);

    auto commission = docket.engine->resolveCommission("11", "BANGALORE");
    REQUIRE(commission);
    CHECK(commission->id == "1103");
    CHECK(commission->state_id == "11");

    auto chennai = docket.engine->resolveCommission("11", "Chennai");
    REQUIRE_FALSE(chennai);
    CHECK(chennai.error().code == Error::Code::CommissionNotFound);
    CHECK(chennai.error().alternatives == std::vector<std::string>{"Bangalore Urban", "Mysore"});
}

TEST_CASE("Commission lists are per state") {
    FakeDocket docket;

    auto commissions = docket.engine->listCommissions("11");
    REQUIRE(commissions);
    CHECK(commissions->size() == 2);

    auto unknown = docket.engine->listCommissions("99");
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == Error::Code::StateNotFound);

    auto blank = docket.engine->listCommissions("  ");
    REQUIRE_FALSE(blank);
    CHECK(blank.error().code == Error::Code::MalformedInput);
}

TEST_CASE("Searches by name resolve ids and normalize records") {
    FakeDocket docket;

    auto records = docket.engine->searchCasesByName(
            by_name(SearchType::Complainant, "Karnataka", "bangalore urban", "Ravi"));
    REQUIRE(records);
    REQUIRE(records->size() == 1);

    auto const& record = records->front();
    CHECK(record.case_number == "DC/1/2024");
    CHECK(record.case_stage == "Admitted");
    CHECK(record.filing_date == "2024-01-15");
    CHECK(record.complainant == "Ravi Kumar");
    CHECK(record.complainant_advocate == std::optional<std::string>{"Adv. Rao"});
    CHECK(record.respondent == "Acme Builders");
    CHECK_FALSE(record.respondent_advocate.has_value());
    CHECK(record.document_link == std::optional<std::string>{"https://portal.test/orders/1.pdf"});

    auto post = FakeBackend::exchanges(*docket.portal).back();
    CHECK(post.target == "/advance-case-search-result");
    CHECK(post.body.find("state_code=11") != std::string::npos);
    CHECK(post.body.find("dist_code=1103") != std::string::npos);
    CHECK(post.body.find("pet_name=Ravi") != std::string::npos);
}

TEST_CASE("Search results are cached per query") {
    FakeDocket docket;
    auto       request = by_name(SearchType::Respondent, "Karnataka", "Mysore", "Acme");

    REQUIRE(docket.engine->searchCasesByName(request));
    auto const before = docket.total();
    REQUIRE(docket.engine->searchCasesByName(request));
    CHECK(docket.total() == before);

    request.search_value = "Other";
    REQUIRE(docket.engine->searchCasesByName(request));
    CHECK(docket.total() > before);
}

TEST_CASE("A search the portal answers without rows is an empty success") {
    FakeDocket docket;
    docket.post("/advance-case-search-result", {html_response(results_page({}))});

    auto request = by_name(SearchType::Judge, "Karnataka", "Mysore", "Sharma");
    auto records = docket.engine->searchCasesByName(request);
    REQUIRE(records);
    CHECK(records->empty());

    auto const before = docket.hits("/advance-case-search-result");
    REQUIRE(docket.engine->searchCasesByName(request));
    CHECK(docket.hits("/advance-case-search-result") == before + 1);
}

TEST_CASE("Malformed requests are rejected before any portal traffic") {
    FakeDocket docket;

    auto check_rejected = [&](CaseSearchRequest const& request) {
        auto result = docket.engine->searchCasesByName(request);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::MalformedInput);
    };

    check_rejected(by_name(SearchType::Complainant, "Karnataka", "Mysore", "   "));

    auto one_date      = by_name(SearchType::Complainant, "Karnataka", "Mysore", "Ravi");
    one_date.from_date = "2024-01-01";
    check_rejected(one_date);

    auto bad_date      = one_date;
    bad_date.to_date   = "31st March";
    check_rejected(bad_date);

    CHECK(docket.total() == 0);

    auto reversed    = one_date;
    reversed.to_date = "2023-12-31";
    check_rejected(reversed);

    auto unnamed = by_name(SearchType::Complainant, "", "Mysore", "Ravi");
    check_rejected(unnamed);
}

TEST_CASE("Searches with resolved ids skip the catalog") {
    FakeDocket  docket;
    SearchQuery query{};
    query.search_type   = SearchType::CaseNumber;
    query.state_id      = "11";
    query.commission_id = "1103";
    query.search_value  = "DC/1/2024";

    auto records = docket.engine->searchCases(query);
    REQUIRE(records);
    CHECK(records->size() == 1);
    CHECK(docket.hits("/advance-case-search") == 0);

    query.commission_id.clear();
    auto missing = docket.engine->searchCases(query);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == Error::Code::MalformedInput);
}

TEST_CASE("A portal with nothing usable exhausts every tier") {
    FakeDocket docket;
    docket.get("/advance-case-search", {status_response(500)});

    auto states = docket.engine->listStates();
    REQUIRE_FALSE(states);
    CHECK(states.error().code == Error::Code::AllStrategiesExhausted);
    REQUIRE(states.error().attempts.size() == 2);
    CHECK(states.error().attempts[0].tier == "direct_api");
    CHECK(states.error().attempts[1].tier == "form_scrape");
    CHECK(states.error().attempts[1].code == Error::Code::Unreachable);
}

TEST_CASE("The browser tier is the last resort for catalog lists") {
    auto options            = quick_docket_options();
    options.browser_enabled = true;
    auto log                = std::make_shared<FakeBrowserSession::Log>();
    auto driver             = std::make_unique<FakeBrowserDriver>(
            log, state_select_page({{"27", "Maharashtra"}, {"29", "Tamil Nadu"}}));

    FakeDocket docket{options, std::move(driver)};
    docket.get("/advance-case-search", {html_response("<html><body><div id=\"app\"></div></body></html>")});

    CHECK(docket.engine->chain().tierNames(OperationKind::ListStates)
          == std::vector<std::string>{"direct_api", "form_scrape", "browser_automation"});
    CHECK(docket.engine->chain().tierNames(OperationKind::SearchCases)
          == std::vector<std::string>{"direct_api", "form_scrape"});

    auto states = docket.engine->listStates();
    REQUIRE(states);
    REQUIRE(states->size() == 2);
    CHECK(states->front().display_name == "Maharashtra");
    CHECK(log->navigated == std::vector<std::string>{"https://portal.test/advance-case-search"});
}

} // TEST_SUITE
