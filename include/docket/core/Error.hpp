#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DK {

struct Error {
    enum class Code {
        UnknownError = 0,
        StateNotFound,
        CommissionNotFound,
        Timeout,
        RateLimited,
        UpstreamError,
        UpstreamBlocked,
        AllStrategiesExhausted,
        ParseFailure,
        NotSupported,
        Unreachable,
        Empty,
        MalformedInput,
        InvalidConfiguration
    };

    // One tier's failure, recorded by FallbackChain for diagnostics.
    struct Attempt {
        std::string tier;
        Code        code{Code::UnknownError};
        std::string message;
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
    std::vector<std::string>   alternatives;
    std::optional<int>         http_status;
    std::string                body;
    std::vector<Attempt>       attempts;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::StateNotFound:
        return "state_not_found";
    case Error::Code::CommissionNotFound:
        return "commission_not_found";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::RateLimited:
        return "rate_limited";
    case Error::Code::UpstreamError:
        return "upstream_error";
    case Error::Code::UpstreamBlocked:
        return "upstream_blocked";
    case Error::Code::AllStrategiesExhausted:
        return "all_strategies_exhausted";
    case Error::Code::ParseFailure:
        return "parse_failure";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::Unreachable:
        return "unreachable";
    case Error::Code::Empty:
        return "empty";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    std::string description{label};
    if (error.http_status) {
        description.append("(");
        description.append(std::to_string(*error.http_status));
        description.append(")");
    }
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description.append(*error.message);
    }
    return description;
}

[[nodiscard]] inline auto makeError(Error::Code code, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{code, std::move(message)});
}

// NotFound failures carry the names a human could have meant.
[[nodiscard]] inline auto makeNotFound(Error::Code code, std::string message, std::vector<std::string> alternatives)
    -> std::unexpected<Error> {
    Error error{code, std::move(message)};
    error.alternatives = std::move(alternatives);
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline auto makeUpstreamError(Error::Code code, int status, std::string body) -> std::unexpected<Error> {
    Error error{code, "upstream responded with HTTP " + std::to_string(status)};
    error.http_status = status;
    error.body        = std::move(body);
    return std::unexpected(std::move(error));
}

} // namespace DK
