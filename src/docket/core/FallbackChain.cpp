#include <docket/core/FallbackChain.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace DK {

FallbackChain::FallbackChain(Tiers tiers)
    : tiers_{std::move(tiers)} {
    for (auto& [kind, list] : tiers_) {
        std::erase_if(list, [](auto const& tier) { return tier == nullptr; });
    }
}

auto FallbackChain::tierNames(OperationKind kind) const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (auto const& tier : tiersFor(kind)) {
        names.emplace_back(tier->name());
    }
    return names;
}

auto FallbackChain::tiersFor(OperationKind kind) const -> std::vector<std::shared_ptr<Strategy>> const& {
    static std::vector<std::shared_ptr<Strategy>> const none;
    auto it = tiers_.find(kind);
    return it == tiers_.end() ? none : it->second;
}

void FallbackChain::noteFailure(OperationKind kind, Error::Attempt const& attempt) const {
    dk_log(std::string{operationKindToString(kind)} + ": tier " + attempt.tier + " failed with "
                   + std::string{errorCodeToString(attempt.code)} + (attempt.message.empty() ? "" : ": " + attempt.message),
           "FallbackChain",
           "INFO");
}

void FallbackChain::noteWinner(OperationKind kind, Strategy const& tier, std::size_t records) const {
    dk_log(std::string{operationKindToString(kind)} + ": tier " + std::string{tier.name()} + " produced "
                   + std::to_string(records) + " record(s)",
           "FallbackChain",
           "INFO");
}

void FallbackChain::noteNothingFound(OperationKind kind) const {
    dk_log(std::string{operationKindToString(kind)} + ": portal answered but no tier found records", "FallbackChain", "INFO");
}

auto FallbackChain::exhausted(OperationKind kind, std::vector<Error::Attempt> attempts) const
        -> std::unexpected<Error> {
    std::string summary = std::string{operationKindToString(kind)} + ": every tier failed";
    if (attempts.empty()) {
        summary = std::string{operationKindToString(kind)} + ": no tiers configured";
    }
    for (auto const& attempt : attempts) {
        summary += "; " + attempt.tier + "=" + std::string{errorCodeToString(attempt.code)};
    }
    dk_log(summary, "FallbackChain", "WARN");

    Error error{Error::Code::AllStrategiesExhausted, std::move(summary)};
    error.attempts = std::move(attempts);
    return std::unexpected(std::move(error));
}

} // namespace DK
