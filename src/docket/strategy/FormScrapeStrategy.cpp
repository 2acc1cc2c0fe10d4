#include <docket/strategy/FormScrapeStrategy.hpp>

#include "log/TaggedLogger.hpp"
#include "strategy/PageHeuristics.hpp"
#include "strategy/ProbeSupport.hpp"

#include <array>

namespace DK::Strategies {

namespace {

constexpr std::array<std::string_view, 3> kSearchPages{"/advance-case-search", "/case-search", "/search"};
constexpr std::array<std::string_view, 3> kCommissionEndpoints{"/advance-case-search", "/ajax/getCommissions",
                                                               "/services/commissions"};
constexpr std::array<std::string_view, 4> kResultEndpoints{"/advance-case-search-result", "/advance-search",
                                                           "/case-search", "/search-cases"};

auto search_field(SearchType type) -> std::string_view {
    switch (type) {
    case SearchType::CaseNumber:
        return "case_no";
    case SearchType::Complainant:
        return "pet_name";
    case SearchType::Respondent:
        return "res_name";
    case SearchType::ComplainantAdvocate:
        return "pet_adv";
    case SearchType::RespondentAdvocate:
        return "res_adv";
    case SearchType::IndustryType:
        return "business_cat";
    case SearchType::Judge:
        return "judge_name";
    }
    return "pet_name";
}

// A JSON answer with data, if the endpoint answered JSON at all.
auto json_answer(Net::RawResponse const& response, std::string const& source) -> std::optional<RawPayload> {
    if (!response.is_json()) {
        return std::nullopt;
    }
    auto document = nlohmann::json::parse(response.body, nullptr, false);
    if (document.is_discarded() || !jsonHasData(document)) {
        return std::nullopt;
    }
    return RawPayload{JsonPayload{std::move(document)}, source};
}

} // namespace

FormScrapeStrategy::FormScrapeStrategy(Net::Transport& transport, CaseColumnLayout layout)
    : transport_{transport}
    , layout_{layout} {}

auto FormScrapeStrategy::searchForm(SearchQuery const& query) -> Net::ParamList {
    Net::ParamList form{
            {"state_code", query.state_id},
            {"dist_code", query.commission_id},
            {"court_code", "DCDRC"},
            {"case_type", std::string{caseTypeToString(query.case_type)}},
            {"date_type", "case_filing_date"},
    };
    if (query.date_range) {
        form.emplace_back("from_date", formatPortalDate(query.date_range->from));
        form.emplace_back("to_date", formatPortalDate(query.date_range->to));
    }
    form.emplace_back(std::string{search_field(query.search_type)}, query.search_value);
    return form;
}

auto FormScrapeStrategy::probe(Operation const& operation) -> Expected<RawPayload> {
    if (std::holds_alternative<ListStatesOp>(operation)) {
        return listStates();
    }
    if (auto const* commissions = std::get_if<ListCommissionsOp>(&operation)) {
        return listCommissions(commissions->state_id);
    }
    return searchCases(std::get<SearchCasesOp>(operation).query);
}

auto FormScrapeStrategy::listStates() -> Expected<RawPayload> {
    CandidateTally tally;
    for (auto page : kSearchPages) {
        std::string path{page};
        auto        response = transport_.get(path);
        if (!response) {
            dk_log("form_scrape GET " + path + " failed: " + describeError(response.error()), "Strategy", "INFO");
            tally.failed(response.error());
            continue;
        }
        tally.answered();
        auto payload = extractFromPage(response->body, OperationKind::ListStates, layout_, path);
        if (payload) {
            dk_log("form_scrape read states from " + path, "Strategy", "INFO");
            return payload;
        }
        dk_log("form_scrape " + describeError(payload.error()), "Strategy", "DEBUG");
    }
    return tally.verdict(std::string{name()});
}

auto FormScrapeStrategy::listCommissions(std::string const& state_id) -> Expected<RawPayload> {
    CandidateTally tally;
    for (auto endpoint : kCommissionEndpoints) {
        std::string path{endpoint};
        auto        response = transport_.postForm(path, {{"state_code", state_id}, {"state_id", state_id}});
        if (!response) {
            dk_log("form_scrape POST " + path + " failed: " + describeError(response.error()), "Strategy", "INFO");
            tally.failed(response.error());
            continue;
        }
        tally.answered();
        if (auto answer = json_answer(*response, path)) {
            return std::move(*answer);
        }
        auto payload = extractFromPage(response->body, OperationKind::ListCommissions, layout_, path);
        if (payload) {
            dk_log("form_scrape read commissions of state " + state_id + " from " + path, "Strategy", "INFO");
            return payload;
        }
        dk_log("form_scrape " + describeError(payload.error()), "Strategy", "DEBUG");
    }
    return tally.verdict(std::string{name()});
}

auto FormScrapeStrategy::searchCases(SearchQuery const& query) -> Expected<RawPayload> {
    auto           form = searchForm(query);
    CandidateTally tally;
    for (auto endpoint : kResultEndpoints) {
        std::string path{endpoint};
        auto        response = transport_.postForm(path, form);
        if (!response) {
            dk_log("form_scrape POST " + path + " failed: " + describeError(response.error()), "Strategy", "INFO");
            tally.failed(response.error());
            continue;
        }
        tally.answered();
        if (auto answer = json_answer(*response, path)) {
            return std::move(*answer);
        }
        auto payload = extractFromPage(response->body, OperationKind::SearchCases, layout_, path);
        if (payload) {
            dk_log("form_scrape read " + std::to_string(std::get<TableRows>(payload->data).rows.size())
                           + " result row(s) from " + path,
                   "Strategy",
                   "INFO");
            return payload;
        }
        dk_log("form_scrape " + describeError(payload.error()), "Strategy", "DEBUG");
    }
    return tally.verdict(std::string{name()});
}

} // namespace DK::Strategies
