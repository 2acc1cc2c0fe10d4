#include <docket/transport/HttpTypes.hpp>

#include "utils/Text.hpp"

#include <cctype>
#include <charconv>

namespace DK::Net {

auto RawResponse::header(std::string_view name) const -> std::optional<std::string> {
    for (auto const& [key, value] : headers) {
        if (Text::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

auto RawResponse::headers_named(std::string_view name) const -> std::vector<std::string> {
    std::vector<std::string> values;
    for (auto const& [key, value] : headers) {
        if (Text::iequals(key, name)) {
            values.push_back(value);
        }
    }
    return values;
}

auto RawResponse::content_type() const -> std::string {
    return Text::toLower(header("Content-Type").value_or(std::string{}));
}

auto RawResponse::is_json() const -> bool {
    auto type = content_type();
    if (type.find("json") != std::string::npos) {
        return true;
    }
    // Some endpoints answer JSON as text/html; sniff the first significant byte.
    if (!type.empty() && type.find("text/plain") == std::string::npos && type.find("text/html") == std::string::npos) {
        return false;
    }
    for (char ch : body) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        return ch == '{' || ch == '[';
    }
    return false;
}

auto parse_url(std::string_view url) -> std::optional<UrlParts> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::nullopt;
    }
    UrlParts parts{};
    auto     scheme = Text::toLower(url.substr(0, scheme_end));
    if (scheme == "https") {
        parts.tls  = true;
        parts.port = 443;
    } else if (scheme != "http") {
        return std::nullopt;
    }

    auto remainder = url.substr(scheme_end + 3);
    auto slash     = remainder.find('/');
    auto authority = remainder.substr(0, slash);
    if (slash != std::string_view::npos) {
        parts.path = std::string{remainder.substr(slash)};
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        parts.host = std::string{authority};
        return parts;
    }
    parts.host     = std::string{authority.substr(0, colon)};
    auto port_view = authority.substr(colon + 1);
    int  port      = 0;
    auto result    = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
    if (parts.host.empty() || result.ec != std::errc{} || result.ptr != port_view.data() + port_view.size()
        || port <= 0 || port > 65535) {
        return std::nullopt;
    }
    parts.port = port;
    return parts;
}

auto resolve_url(std::string_view base_url, std::string_view href) -> std::string {
    if (href.starts_with("http://") || href.starts_with("https://")) {
        return std::string{href};
    }
    std::string base{base_url};
    if (href.starts_with("//")) {
        auto scheme_end = base.find("://");
        return (scheme_end == std::string::npos ? std::string{"https:"} : base.substr(0, scheme_end + 1))
               + std::string{href};
    }
    auto scheme_end = base.find("://");
    auto path_start = scheme_end == std::string::npos ? std::string::npos : base.find('/', scheme_end + 3);
    // Absolute paths hang off the origin, not the base path.
    if (!href.empty() && href.front() == '/') {
        return (path_start == std::string::npos ? base : base.substr(0, path_start)) + std::string{href};
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + std::string{href};
}

auto join_path(std::string_view prefix, std::string_view target) -> std::string {
    std::string base{prefix};
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (target.empty() || target.front() != '/') {
        base.push_back('/');
    }
    return base + std::string{target};
}

auto url_origin(std::string_view url) -> std::string {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::string{url};
    }
    return std::string{url.substr(0, url.find('/', scheme_end + 3))};
}

auto percent_encode(std::string_view value) -> std::string {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string           encoded;
    encoded.reserve(value.size() * 2);
    for (unsigned char ch : value) {
        if ((std::isalnum(ch) != 0) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
    }
    return encoded;
}

auto encode_params(ParamList const& params) -> std::string {
    std::string encoded;
    for (auto const& [key, value] : params) {
        if (!encoded.empty()) {
            encoded.push_back('&');
        }
        encoded.append(percent_encode(key));
        encoded.push_back('=');
        encoded.append(percent_encode(value));
    }
    return encoded;
}

auto method_name(HttpMethod method) -> std::string_view {
    return method == HttpMethod::Post ? "POST" : "GET";
}

} // namespace DK::Net
