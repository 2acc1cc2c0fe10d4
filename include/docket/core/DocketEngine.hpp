#pragma once

#include <docket/cache/TtlCache.hpp>
#include <docket/config/DocketOptions.hpp>
#include <docket/core/Catalog.hpp>
#include <docket/core/FallbackChain.hpp>
#include <docket/core/Records.hpp>
#include <docket/normalize/Normalizer.hpp>
#include <docket/strategy/BrowserDriver.hpp>
#include <docket/transport/Transport.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace DK {

// A search phrased with human-entered names; dates in any format parseDate accepts.
struct CaseSearchRequest {
    SearchType                 search_type{SearchType::Complainant};
    std::string                state;
    std::string                commission;
    std::string                search_value;
    std::optional<CaseType>    case_type;
    std::optional<std::string> from_date;
    std::optional<std::string> to_date;
};

/**
 * Owns one Transport (and with it the one portal Session), the tier chain, the
 * Catalog and the search cache. Safe to share between threads; portal traffic is
 * serialized by the Transport's rate gate.
 */
class DocketEngine {
public:
    explicit DocketEngine(DocketOptions options);
    DocketEngine(DocketOptions                     options,
                 std::unique_ptr<Net::HttpBackend> backend,
                 std::unique_ptr<BrowserDriver>    driver,
                 Net::Transport::Sleeper           sleeper = {});

    DocketEngine(DocketEngine const&)            = delete;
    DocketEngine& operator=(DocketEngine const&) = delete;

    auto listStates() -> Expected<std::vector<State>>;
    auto listCommissions(std::string const& state_id) -> Expected<std::vector<Commission>>;
    auto resolveState(std::string_view name) -> Expected<State>;
    auto resolveCommission(std::string const& state_id, std::string_view name) -> Expected<Commission>;

    auto searchCases(SearchQuery const& query) -> Expected<std::vector<CaseRecord>>;
    auto searchCasesByName(CaseSearchRequest const& request) -> Expected<std::vector<CaseRecord>>;

    auto transport() -> Net::Transport& { return transport_; }
    auto catalog() -> Catalog& { return catalog_; }
    auto chain() const -> FallbackChain const& { return chain_; }
    auto options() const -> DocketOptions const& { return options_; }

private:
    static auto buildTiers(DocketOptions const& options, Net::Transport& transport, std::unique_ptr<BrowserDriver> driver)
            -> FallbackChain::Tiers;

    DocketOptions                     options_;
    Net::Transport                    transport_;
    Normalizer                        normalizer_;
    FallbackChain                     chain_;
    Catalog                           catalog_;
    TtlCache<std::vector<CaseRecord>> search_cache_;
};

// Transport settings carried by the options.
auto transportOptionsFrom(DocketOptions const& options) -> Net::TransportOptions;

} // namespace DK
