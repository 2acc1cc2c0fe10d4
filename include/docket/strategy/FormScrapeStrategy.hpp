#pragma once

#include <docket/strategy/Strategy.hpp>
#include <docket/transport/Transport.hpp>

namespace DK::Strategies {

/**
 * Fetches the portal's HTML search pages and reads dropdowns and result tables
 * by structure. Commission lists and searches are form POSTs; JSON answers to
 * those posts are passed through untouched.
 */
class FormScrapeStrategy final : public Strategy {
public:
    explicit FormScrapeStrategy(Net::Transport& transport, CaseColumnLayout layout = {});

    auto name() const -> std::string_view override { return "form_scrape"; }
    auto probe(Operation const& operation) -> Expected<RawPayload> override;

    // Form body the portal's advanced search expects for a query.
    static auto searchForm(SearchQuery const& query) -> Net::ParamList;

private:
    auto listStates() -> Expected<RawPayload>;
    auto listCommissions(std::string const& state_id) -> Expected<RawPayload>;
    auto searchCases(SearchQuery const& query) -> Expected<RawPayload>;

    Net::Transport&  transport_;
    CaseColumnLayout layout_;
};

} // namespace DK::Strategies
