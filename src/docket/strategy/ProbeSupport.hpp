#pragma once

#include <docket/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace DK::Strategies {

// Whether a decoded answer carries anything beyond an empty envelope or an error list.
auto jsonHasData(nlohmann::json const& document) -> bool;

/**
 * Folds the outcomes of a tier's candidate requests into its failure verdict:
 * Empty when any candidate answered, the shared transport code when every
 * candidate was throttled, blocked or timed out the same way, else Unreachable.
 */
class CandidateTally {
public:
    void answered() { ++answered_; }
    void failed(Error const& error);

    auto verdict(std::string const& tier) const -> std::unexpected<Error>;

private:
    std::size_t          answered_{0};
    std::optional<Error> last_error_;
    bool                 same_code_{true};
};

} // namespace DK::Strategies
