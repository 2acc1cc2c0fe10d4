#pragma once

#include <docket/core/Error.hpp>
#include <docket/strategy/Strategy.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace DK {

/**
 * Runs the tiers configured for an operation kind strictly in order.
 *
 * The first tier whose probe succeeds and whose payload normalizes to at least
 * one record wins. A tier that normalizes to nothing counts as Empty and a
 * payload the normalizer rejects counts as ParseFailure; both move on to the next
 * tier. Once every tier is spent the chain answers an empty success if some tier
 * reported Empty (the portal answered, there is just nothing), otherwise it fails
 * with AllStrategiesExhausted carrying every tier's failure.
 */
class FallbackChain {
public:
    using Tiers = std::map<OperationKind, std::vector<std::shared_ptr<Strategy>>>;

    explicit FallbackChain(Tiers tiers);

    template <typename Record, typename Normalize>
    auto run(Operation const& operation, Normalize&& normalize) const -> Expected<std::vector<Record>>;

    auto tierNames(OperationKind kind) const -> std::vector<std::string>;

private:
    auto tiersFor(OperationKind kind) const -> std::vector<std::shared_ptr<Strategy>> const&;
    void noteFailure(OperationKind kind, Error::Attempt const& attempt) const;
    void noteWinner(OperationKind kind, Strategy const& tier, std::size_t records) const;
    void noteNothingFound(OperationKind kind) const;
    auto exhausted(OperationKind kind, std::vector<Error::Attempt> attempts) const -> std::unexpected<Error>;

    Tiers tiers_;
};

template <typename Record, typename Normalize>
auto FallbackChain::run(Operation const& operation, Normalize&& normalize) const -> Expected<std::vector<Record>> {
    auto const                  kind = operationKind(operation);
    std::vector<Error::Attempt> attempts;
    bool                        saw_empty = false;

    for (auto const& tier : tiersFor(kind)) {
        std::string const tier_name{tier->name()};

        auto payload = tier->probe(operation);
        if (!payload) {
            auto const& error = payload.error();
            saw_empty         = saw_empty || error.code == Error::Code::Empty;
            attempts.push_back(Error::Attempt{tier_name, error.code, error.message.value_or(std::string{})});
            noteFailure(kind, attempts.back());
            continue;
        }

        Expected<std::vector<Record>> records = normalize(*payload);
        if (!records) {
            attempts.push_back(Error::Attempt{tier_name,
                                              Error::Code::ParseFailure,
                                              records.error().message.value_or(std::string{"unreadable payload"})});
            noteFailure(kind, attempts.back());
            continue;
        }
        if (records->empty()) {
            saw_empty = true;
            attempts.push_back(Error::Attempt{tier_name, Error::Code::Empty, "payload held no usable records"});
            noteFailure(kind, attempts.back());
            continue;
        }

        noteWinner(kind, *tier, records->size());
        return records;
    }

    if (saw_empty) {
        noteNothingFound(kind);
        return std::vector<Record>{};
    }
    return exhausted(kind, std::move(attempts));
}

} // namespace DK
