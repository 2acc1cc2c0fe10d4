#include <doctest/doctest.h>
#include <docket/core/Catalog.hpp>

#include "../DocketTestHelpers.hpp"
#include "utils/Text.hpp"

using namespace DK;
using DK::Test::failure;
using DK::Test::option_payload;
using DK::Test::ScriptedStrategy;

namespace {

struct CatalogFixture {
    explicit CatalogFixture(std::vector<Expected<RawPayload>> state_answers,
                            std::vector<Expected<RawPayload>> commission_answers = {},
                            CatalogOptions                    options            = {})
        : states{std::make_shared<ScriptedStrategy>("states", std::move(state_answers))}
        , commissions{std::make_shared<ScriptedStrategy>("commissions", std::move(commission_answers))}
        , chain{{{OperationKind::ListStates, {states}}, {OperationKind::ListCommissions, {commissions}}}}
        , normalizer{"https://portal.test"}
        , catalog{chain, normalizer, options} {}

    std::shared_ptr<ScriptedStrategy> states;
    std::shared_ptr<ScriptedStrategy> commissions;
    FallbackChain                     chain;
    Normalizer                        normalizer;
    Catalog                           catalog;
};

auto indian_states() -> RawPayload {
    return option_payload({{"", "--Select State--"},
                           {"10", "Andhra Pradesh"},
                           {"11", "Karnataka"},
                           {"12", "Kerala"},
                           {"13", "Arunachal Pradesh"},
                           {"11", "Karnataka"}});
}

auto karnataka_commissions() -> RawPayload {
    return option_payload({{"-1", "Select Commission"},
                           {"1101", "Bangalore Urban"},
                           {"1102", "Bangalore Rural"},
                           {"1103", "Mysore"}});
}

} // namespace

TEST_SUITE("core.catalog") {

TEST_CASE("States load once and are served from cache afterwards") {
    CatalogFixture fixture{{indian_states()}};

    auto first = fixture.catalog.listStates();
    REQUIRE(first);
    CHECK(first->size() == 4);
    CHECK(first->at(1) == State{"11", "KARNATAKA", "Karnataka"});

    auto second = fixture.catalog.listStates();
    REQUIRE(second);
    CHECK(*second == *first);
    CHECK(fixture.states->probes == 1);
}

TEST_CASE("An empty state list is returned but not cached") {
    CatalogFixture fixture{{failure(Error::Code::Empty), indian_states()}};

    auto empty = fixture.catalog.listStates();
    REQUIRE(empty);
    CHECK(empty->empty());

    auto loaded = fixture.catalog.listStates();
    REQUIRE(loaded);
    CHECK(loaded->size() == 4);
    CHECK(fixture.states->probes == 2);
}

TEST_CASE("Name resolution prefers canonical, then display, then substring") {
    std::vector<State> states{{"1", "ANDHRA PRADESH", "Andhra Pradesh"},
                              {"2", "PRADESH", "Pradesh Region"},
                              {"3", "UTTAR PRADESH", "Uttar Pradesh"}};

    auto canonical = Catalog::matchState(states, "  pradesh ");
    REQUIRE(canonical);
    CHECK(canonical->id == "2");

    auto display = Catalog::matchState(states, "uttar pradesh");
    REQUIRE(display);
    CHECK(display->id == "3");

    auto substring = Catalog::matchState(states, "andhra");
    REQUIRE(substring);
    CHECK(substring->id == "1");

    // Query containing the name also matches; the first in catalog order wins.
    auto containing = Catalog::matchState(std::vector<State>{{"1", "GOA", "Goa"}, {"2", "GOA NORTH", "Goa North"}},
                                          "Goa Beaches");
    REQUIRE(containing);
    CHECK(containing->id == "1");

    CHECK_FALSE(Catalog::matchState(states, "Kerala").has_value());
    CHECK_FALSE(Catalog::matchState(states, "   ").has_value());
}

TEST_CASE("Every spelling of a state resolves to the same record") {
    CatalogFixture fixture{{indian_states()}};

    auto states = fixture.catalog.listStates();
    REQUIRE(states);
    for (auto const& state : *states) {
        for (auto const& spelling : {state.canonical_name,
                                     state.display_name,
                                     DK::Text::toLower(state.display_name),
                                     "The State Of " + state.display_name + " (India)"}) {
            auto resolved = fixture.catalog.resolveState(spelling);
            REQUIRE(resolved);
            CHECK(*resolved == state);
        }
    }
}

TEST_CASE("Resolving an unknown state lists the known names") {
    CatalogFixture fixture{{indian_states()}};

    auto karnataka = fixture.catalog.resolveState("karnataka");
    REQUIRE(karnataka);
    CHECK(karnataka->id == "11");

    auto missing = fixture.catalog.resolveState("Atlantis");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == Error::Code::StateNotFound);
    CHECK(missing.error().alternatives
          == std::vector<std::string>{"Andhra Pradesh", "Karnataka", "Kerala", "Arunachal Pradesh"});

    auto blank = fixture.catalog.resolveState("  ");
    REQUIRE_FALSE(blank);
    CHECK(blank.error().code == Error::Code::MalformedInput);
}

TEST_CASE("Alternatives are capped when configured") {
    CatalogOptions options{};
    options.max_alternatives = 2;
    CatalogFixture fixture{{indian_states()}, {}, options};

    auto missing = fixture.catalog.resolveState("Atlantis");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().alternatives.size() == 2);
}

TEST_CASE("Commissions require a known state") {
    CatalogFixture fixture{{indian_states()}, {karnataka_commissions()}};

    auto unknown = fixture.catalog.listCommissions("99");
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == Error::Code::StateNotFound);
    CHECK(fixture.commissions->probes == 0);

    auto known = fixture.catalog.listCommissions("11");
    REQUIRE(known);
    REQUIRE(known->size() == 3);
    CHECK(known->front() == Commission{"1101", "Bangalore Urban", "11"});

    auto cached = fixture.catalog.listCommissions("11");
    REQUIRE(cached);
    CHECK(fixture.commissions->probes == 1);
}

TEST_CASE("Commission resolution reports the commissions of the state") {
    CatalogFixture fixture{{indian_states()}, {karnataka_commissions()}};

    auto rural = fixture.catalog.resolveCommission("11", "BANGALORE RURAL");
    REQUIRE(rural);
    CHECK(rural->id == "1102");

    auto mysore = fixture.catalog.resolveCommission("11", "mysore district consumer forum");
    REQUIRE(mysore);
    CHECK(mysore->id == "1103");

    auto missing = fixture.catalog.resolveCommission("11", "Hubli");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == Error::Code::CommissionNotFound);
    CHECK(missing.error().alternatives == std::vector<std::string>{"Bangalore Urban", "Bangalore Rural", "Mysore"});
}

TEST_CASE("Invalidation forces a reload") {
    CatalogFixture fixture{{indian_states()}};
    REQUIRE(fixture.catalog.listStates());
    fixture.catalog.invalidate();
    REQUIRE(fixture.catalog.listStates());
    CHECK(fixture.states->probes == 2);
}

TEST_CASE("Chain exhaustion reaches the caller") {
    CatalogFixture fixture{{failure(Error::Code::Unreachable)}};
    auto           states = fixture.catalog.resolveState("Karnataka");
    REQUIRE_FALSE(states);
    CHECK(states.error().code == Error::Code::AllStrategiesExhausted);
}

} // TEST_SUITE
