#pragma once

#include <docket/core/Error.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DK::Net {

enum class HttpMethod {
    Get,
    Post
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using ParamList  = std::vector<std::pair<std::string, std::string>>;

// A logical request as the strategies describe it; the Transport adds session state.
struct HttpRequest {
    HttpMethod                 method{HttpMethod::Get};
    std::string                path{"/"};
    ParamList                  query;
    std::optional<ParamList>   form;
    std::optional<std::string> body;
    std::string                content_type;
    HeaderList                 headers;
};

// Fully prepared exchange handed to an HttpBackend.
struct HttpExchange {
    HttpMethod                method{HttpMethod::Get};
    std::string               target{"/"};
    HeaderList                headers;
    std::string               body;
    std::string               content_type;
    std::chrono::milliseconds timeout{std::chrono::seconds{30}};
};

struct RawResponse {
    int         status{0};
    std::string body;
    HeaderList  headers;

    auto header(std::string_view name) const -> std::optional<std::string>;
    auto headers_named(std::string_view name) const -> std::vector<std::string>;
    auto content_type() const -> std::string;
    auto is_json() const -> bool;
};

/**
 * Performs one HTTP exchange. Fails with Error::Code::Timeout when the deadline in
 * HttpExchange::timeout elapses and with Error::Code::Unreachable when no response
 * could be obtained. Any HTTP status, including 4xx/5xx, is a successful exchange.
 */
class HttpBackend {
public:
    virtual ~HttpBackend() = default;

    virtual auto perform(HttpExchange const& exchange) -> Expected<RawResponse> = 0;
};

// scheme://host[:port][/prefix] split into the pieces an HTTP client needs.
struct UrlParts {
    bool        tls{false};
    std::string host;
    int         port{80};
    std::string path{"/"};
};

auto parse_url(std::string_view url) -> std::optional<UrlParts>;

// Absolute URL for an href found on a page served under base_url.
auto resolve_url(std::string_view base_url, std::string_view href) -> std::string;

// prefix + target with exactly one slash between them; an empty or "/" prefix leaves target alone.
auto join_path(std::string_view prefix, std::string_view target) -> std::string;

// scheme://host[:port] of url.
auto url_origin(std::string_view url) -> std::string;

auto percent_encode(std::string_view value) -> std::string;
auto encode_params(ParamList const& params) -> std::string;
auto method_name(HttpMethod method) -> std::string_view;

} // namespace DK::Net
