#include "strategy/ProbeSupport.hpp"

namespace DK::Strategies {

auto jsonHasData(nlohmann::json const& document) -> bool {
    if (document.is_array()) {
        return !document.empty();
    }
    if (!document.is_object() || document.empty()) {
        return false;
    }
    if (auto data = document.find("data"); data != document.end()) {
        if (data->is_null()) {
            return false;
        }
        if (data->is_array()) {
            return !data->empty();
        }
        if (data->is_object()) {
            for (auto const& value : *data) {
                if (!value.is_null() && !value.empty()) {
                    return true;
                }
            }
            return false;
        }
    }
    return !(document.size() == 1 && document.contains("errors"));
}

void CandidateTally::failed(Error const& error) {
    if (last_error_ && last_error_->code != error.code) {
        same_code_ = false;
    }
    last_error_ = error;
}

auto CandidateTally::verdict(std::string const& tier) const -> std::unexpected<Error> {
    if (answered_ > 0) {
        return makeError(Error::Code::Empty,
                         tier + ": " + std::to_string(answered_) + " candidate(s) answered without usable data");
    }
    if (last_error_ && same_code_
        && (last_error_->code == Error::Code::RateLimited || last_error_->code == Error::Code::UpstreamBlocked
            || last_error_->code == Error::Code::Timeout)) {
        return std::unexpected(*last_error_);
    }
    return makeError(Error::Code::Unreachable,
                     tier + ": no candidate answered"
                             + (last_error_ ? " (" + describeError(*last_error_) + ")" : std::string{}));
}

} // namespace DK::Strategies
