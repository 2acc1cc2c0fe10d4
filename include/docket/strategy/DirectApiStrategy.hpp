#pragma once

#include <docket/strategy/Strategy.hpp>
#include <docket/transport/Transport.hpp>

#include <vector>

namespace DK::Strategies {

/**
 * Probes a fixed, ordered list of plausible JSON endpoints (REST paths, then a
 * GraphQL query for states). The first JSON answer carrying data wins.
 */
class DirectApiStrategy final : public Strategy {
public:
    explicit DirectApiStrategy(Net::Transport& transport);

    auto name() const -> std::string_view override { return "direct_api"; }
    auto probe(Operation const& operation) -> Expected<RawPayload> override;

    // Candidate requests for an operation, in probing order.
    auto candidates(Operation const& operation) const -> std::vector<Net::HttpRequest>;

private:
    Net::Transport& transport_;
};

} // namespace DK::Strategies
