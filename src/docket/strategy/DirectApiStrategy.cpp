#include <docket/strategy/DirectApiStrategy.hpp>

#include "log/TaggedLogger.hpp"
#include "strategy/ProbeSupport.hpp"

#include <array>
#include <string_view>

namespace DK::Strategies {

namespace {

using json = nlohmann::json;

constexpr std::array<std::string_view, 8> kStatePaths{
        "/api/states",
        "/api/master/states",
        "/api/v1/states",
        "/api/public/states",
        "/api/master/state-list",
        "/api/dropdown/states",
        "/services/states",
        "/rest/states",
};

constexpr std::array<std::string_view, 3> kSearchPaths{
        "/api/cases/search",
        "/api/v1/cases/search",
        "/api/case-search",
};

constexpr std::string_view kStatesGraphQl{"{ states { id name displayName } }"};

auto api_headers(Net::Transport const& transport) -> Net::HeaderList {
    return {
            {"Accept", "application/json, text/plain, */*"},
            {"Origin", transport.origin()},
            {"Referer", transport.pageUrl("/advance-case-search")},
    };
}

auto get_request(std::string path, Net::ParamList query = {}) -> Net::HttpRequest {
    Net::HttpRequest request{};
    request.method = Net::HttpMethod::Get;
    request.path   = std::move(path);
    request.query  = std::move(query);
    return request;
}

auto json_request(std::string path, json const& body) -> Net::HttpRequest {
    Net::HttpRequest request{};
    request.method       = Net::HttpMethod::Post;
    request.path         = std::move(path);
    request.body         = body.dump();
    request.content_type = "application/json";
    return request;
}

auto search_body(SearchQuery const& query) -> json {
    json body{
            {"searchType", std::string{searchTypeToString(query.search_type)}},
            {"stateId", query.state_id},
            {"commissionId", query.commission_id},
            {"searchValue", query.search_value},
            {"caseType", std::string{caseTypeToString(query.case_type)}},
    };
    if (query.date_range) {
        body["fromDate"] = formatIsoDate(query.date_range->from);
        body["toDate"]   = formatIsoDate(query.date_range->to);
    }
    return body;
}

} // namespace

DirectApiStrategy::DirectApiStrategy(Net::Transport& transport)
    : transport_{transport} {}

auto DirectApiStrategy::candidates(Operation const& operation) const -> std::vector<Net::HttpRequest> {
    std::vector<Net::HttpRequest> requests;
    if (std::holds_alternative<ListStatesOp>(operation)) {
        for (auto path : kStatePaths) {
            requests.push_back(get_request(std::string{path}));
        }
        requests.push_back(json_request("/graphql", json{{"query", std::string{kStatesGraphQl}}}));
    } else if (auto const* commissions = std::get_if<ListCommissionsOp>(&operation)) {
        auto const& id = commissions->state_id;
        requests.push_back(get_request("/api/commissions", {{"state_id", id}}));
        requests.push_back(get_request("/api/master/commissions/" + Net::percent_encode(id)));
        requests.push_back(get_request("/api/v1/commissions", {{"stateId", id}}));
        requests.push_back(get_request("/api/public/commissions", {{"state", id}}));
        requests.push_back(get_request("/api/dropdown/commissions", {{"state_code", id}}));
    } else if (auto const* search = std::get_if<SearchCasesOp>(&operation)) {
        auto body = search_body(search->query);
        for (auto path : kSearchPaths) {
            requests.push_back(json_request(std::string{path}, body));
        }
    }
    for (auto& request : requests) {
        request.headers = api_headers(transport_);
    }
    return requests;
}

auto DirectApiStrategy::probe(Operation const& operation) -> Expected<RawPayload> {
    auto requests = candidates(operation);
    if (requests.empty()) {
        return makeError(Error::Code::NotSupported, "no endpoints for operation");
    }

    CandidateTally tally;
    for (auto const& request : requests) {
        auto response = transport_.request(request);
        if (!response) {
            dk_log("direct_api " + request.path + " failed: " + describeError(response.error()), "Strategy", "INFO");
            tally.failed(response.error());
            continue;
        }
        tally.answered();
        if (!response->is_json()) {
            dk_log("direct_api " + request.path + " answered non-JSON", "Strategy", "DEBUG");
            continue;
        }
        auto document = json::parse(response->body, nullptr, false);
        if (document.is_discarded() || !jsonHasData(document)) {
            continue;
        }
        dk_log("direct_api found data at " + request.path, "Strategy", "INFO");
        return RawPayload{JsonPayload{std::move(document)}, request.path};
    }
    return tally.verdict(std::string{name()});
}

} // namespace DK::Strategies
