#pragma once

#include <docket/core/Error.hpp>
#include <docket/core/Records.hpp>
#include <docket/strategy/Payload.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace DK {

/**
 * Maps raw tier output onto canonical records.
 *
 * Source records missing a required field are skipped, never raised. A payload
 * whose overall shape is not understood (a JSON object with no known container,
 * table rows offered as states, ...) fails with ParseFailure; a recognized shape
 * that yields no usable records succeeds with an empty list.
 */
class Normalizer {
public:
    explicit Normalizer(std::string base_url);

    auto states(RawPayload const& payload) const -> Expected<std::vector<State>>;
    auto commissions(RawPayload const& payload, std::string const& state_id) const
            -> Expected<std::vector<Commission>>;
    auto cases(RawPayload const& payload) const -> Expected<std::vector<CaseRecord>>;

    // Options such as "--Select State--" or value "-1".
    static auto isPlaceholderOption(RawOption const& option) -> bool;

private:
    std::string base_url_;
};

} // namespace DK
