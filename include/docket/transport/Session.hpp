#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace DK::Net {

// Cookie and CSRF state of one Transport. Only the owning Transport mutates it.
struct Session {
    std::map<std::string, std::string>    cookies;
    std::optional<std::string>            csrf_token;
    std::chrono::steady_clock::time_point last_request{};
};

// Parses the leading name=value pair of a Set-Cookie header value.
auto parse_set_cookie(std::string_view header) -> std::optional<std::pair<std::string, std::string>>;

// Builds a Cookie request header value ("a=1; b=2"); empty when there are no cookies.
auto cookie_header(Session const& session) -> std::string;

// Pattern search for a CSRF token in meta tags, hidden inputs or script assignments.
auto extract_csrf_token(std::string_view body) -> std::optional<std::string>;

} // namespace DK::Net
