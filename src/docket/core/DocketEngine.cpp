#include <docket/core/DocketEngine.hpp>
#include <docket/strategy/BrowserAutomationStrategy.hpp>
#include <docket/strategy/DirectApiStrategy.hpp>
#include <docket/strategy/FormScrapeStrategy.hpp>
#include <docket/strategy/WebDriverClient.hpp>
#include <docket/transport/HttplibBackend.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/Text.hpp"

#include <utility>

namespace DK {

namespace {

auto seconds(std::int64_t value) -> std::chrono::seconds {
    return std::chrono::seconds{value};
}

auto millis(std::int64_t value) -> std::chrono::milliseconds {
    return std::chrono::milliseconds{value};
}

auto catalogOptionsFrom(DocketOptions const& options) -> CatalogOptions {
    CatalogOptions catalog{};
    catalog.ttls.states      = seconds(options.states_ttl_seconds);
    catalog.ttls.commissions = seconds(options.commissions_ttl_seconds);
    catalog.ttls.search      = seconds(options.search_ttl_seconds);
    catalog.max_alternatives = static_cast<std::size_t>(options.max_alternatives);
    return catalog;
}

auto makeDriver(DocketOptions const& options) -> std::unique_ptr<BrowserDriver> {
    if (!options.browser_enabled) {
        return nullptr;
    }
    Strategies::WebDriverOptions driver{};
    driver.url             = options.webdriver_url;
    driver.headless        = options.browser_headless;
    driver.user_agent      = options.user_agent;
    driver.command_timeout = millis(options.browser_timeout_ms);
    return std::make_unique<Strategies::WebDriverClient>(std::move(driver));
}

} // namespace

auto transportOptionsFrom(DocketOptions const& options) -> Net::TransportOptions {
    Net::TransportOptions transport{};
    transport.base_url             = options.base_url;
    transport.request_timeout      = millis(options.request_timeout_ms);
    transport.max_retries          = static_cast<int>(options.max_retries);
    transport.backoff_base         = millis(options.backoff_base_ms);
    transport.min_request_interval = millis(options.min_request_interval_ms);
    transport.rate_limit_cooldown  = millis(options.rate_limit_cooldown_ms);
    transport.user_agent           = options.user_agent;
    return transport;
}

DocketEngine::DocketEngine(DocketOptions options)
    : DocketEngine(options, std::make_unique<Net::HttplibBackend>(options.base_url), makeDriver(options)) {}

DocketEngine::DocketEngine(DocketOptions                     options,
                           std::unique_ptr<Net::HttpBackend> backend,
                           std::unique_ptr<BrowserDriver>    driver,
                           Net::Transport::Sleeper           sleeper)
    : options_{std::move(options)}
    , transport_{transportOptionsFrom(options_), std::move(backend), std::move(sleeper)}
    , normalizer_{options_.base_url}
    , chain_{buildTiers(options_, transport_, std::move(driver))}
    , catalog_{chain_, normalizer_, catalogOptionsFrom(options_)}
    , search_cache_{seconds(options_.search_ttl_seconds)} {
    search_cache_.set_ttl(CacheNamespace::Search, seconds(options_.search_ttl_seconds));
}

auto DocketEngine::buildTiers(DocketOptions const& options, Net::Transport& transport, std::unique_ptr<BrowserDriver> driver)
        -> FallbackChain::Tiers {
    auto direct = std::make_shared<Strategies::DirectApiStrategy>(transport);
    auto form   = std::make_shared<Strategies::FormScrapeStrategy>(transport);

    std::vector<std::shared_ptr<Strategy>> catalog_tiers{direct, form};
    if (options.browser_enabled && driver) {
        Strategies::BrowserStrategyOptions browser{};
        browser.timeout = millis(options.browser_timeout_ms);
        catalog_tiers.push_back(
                std::make_shared<Strategies::BrowserAutomationStrategy>(transport, std::move(driver), browser));
    }

    FallbackChain::Tiers tiers;
    tiers[OperationKind::ListStates]      = catalog_tiers;
    tiers[OperationKind::ListCommissions] = catalog_tiers;
    tiers[OperationKind::SearchCases]     = {direct, form};
    return tiers;
}

auto DocketEngine::listStates() -> Expected<std::vector<State>> {
    return catalog_.listStates();
}

auto DocketEngine::listCommissions(std::string const& state_id) -> Expected<std::vector<Commission>> {
    if (Text::trim(state_id).empty()) {
        return makeError(Error::Code::MalformedInput, "state id is empty");
    }
    return catalog_.listCommissions(state_id);
}

auto DocketEngine::resolveState(std::string_view name) -> Expected<State> {
    return catalog_.resolveState(name);
}

auto DocketEngine::resolveCommission(std::string const& state_id, std::string_view name) -> Expected<Commission> {
    return catalog_.resolveCommission(state_id, name);
}

auto DocketEngine::searchCases(SearchQuery const& query) -> Expected<std::vector<CaseRecord>> {
    if (Text::trim(query.search_value).empty()) {
        return makeError(Error::Code::MalformedInput, "search value is empty");
    }
    if (query.state_id.empty() || query.commission_id.empty()) {
        return makeError(Error::Code::MalformedInput, "search needs a resolved state and commission");
    }
    if (query.date_range && query.date_range->to < query.date_range->from) {
        return makeError(Error::Code::MalformedInput, "date range ends before it starts");
    }

    auto const key = queryCacheKey(query);
    if (auto cached = search_cache_.get(CacheNamespace::Search, key)) {
        return std::move(*cached);
    }

    auto records = chain_.run<CaseRecord>(SearchCasesOp{query}, [this](RawPayload const& payload) {
        return normalizer_.cases(payload);
    });
    if (!records) {
        return std::unexpected(records.error());
    }
    if (!records->empty()) {
        search_cache_.set(CacheNamespace::Search, key, *records);
    }
    return records;
}

auto DocketEngine::searchCasesByName(CaseSearchRequest const& request) -> Expected<std::vector<CaseRecord>> {
    if (Text::trim(request.search_value).empty()) {
        return makeError(Error::Code::MalformedInput, "search_value must not be empty");
    }
    if (request.from_date.has_value() != request.to_date.has_value()) {
        return makeError(Error::Code::MalformedInput, "from_date and to_date must be given together");
    }

    SearchQuery query{};
    query.search_type  = request.search_type;
    query.search_value = Text::trim(request.search_value);
    query.case_type    = request.case_type.value_or(CaseType::DailyOrder);
    if (request.from_date) {
        auto from = parseDate(*request.from_date);
        auto to   = parseDate(*request.to_date);
        if (!from || !to) {
            return makeError(Error::Code::MalformedInput, "dates must be yyyy-mm-dd or dd/mm/yyyy");
        }
        query.date_range = DateRange{*from, *to};
    }

    auto state = catalog_.resolveState(request.state);
    if (!state) {
        return std::unexpected(state.error());
    }
    auto commission = catalog_.resolveCommission(state->id, request.commission);
    if (!commission) {
        return std::unexpected(commission.error());
    }
    query.state_id      = state->id;
    query.commission_id = commission->id;

    dk_log("Searching " + std::string{searchTypeToString(query.search_type)} + " in " + state->display_name + " / "
                   + commission->display_name,
           "Service",
           "INFO");
    return searchCases(query);
}

} // namespace DK
