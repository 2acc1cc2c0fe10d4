#include <docket/transport/Session.hpp>

#include "utils/Text.hpp"

#include <array>
#include <regex>

namespace DK::Net {

namespace {

auto csrf_patterns() -> std::array<std::regex, 5> const& {
    static const std::array<std::regex, 5> patterns{
            std::regex{R"(<meta[^>]*name\s*=\s*["']csrf-token["'][^>]*content\s*=\s*["']([^"']+)["'])",
                       std::regex::icase},
            std::regex{R"(<meta[^>]*content\s*=\s*["']([^"']+)["'][^>]*name\s*=\s*["']csrf-token["'])",
                       std::regex::icase},
            std::regex{R"(<input[^>]*name\s*=\s*["'](?:csrf-token|csrf_token|_token|_csrf)["'][^>]*value\s*=\s*["']([^"']+)["'])",
                       std::regex::icase},
            std::regex{R"(<input[^>]*value\s*=\s*["']([^"']+)["'][^>]*name\s*=\s*["'](?:csrf-token|csrf_token|_token|_csrf)["'])",
                       std::regex::icase},
            std::regex{R"(csrf[_-]?token["']?\s*[:=]\s*["']([^"']+)["'])", std::regex::icase},
    };
    return patterns;
}

} // namespace

auto parse_set_cookie(std::string_view header) -> std::optional<std::pair<std::string, std::string>> {
    auto pair = header.substr(0, header.find(';'));
    auto eq   = pair.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }
    auto name  = Text::trim(pair.substr(0, eq));
    auto value = Text::trim(pair.substr(eq + 1));
    if (name.empty()) {
        return std::nullopt;
    }
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return std::make_pair(std::move(name), std::move(value));
}

auto cookie_header(Session const& session) -> std::string {
    std::string header;
    for (auto const& [name, value] : session.cookies) {
        if (!header.empty()) {
            header.append("; ");
        }
        header.append(name);
        header.push_back('=');
        header.append(value);
    }
    return header;
}

auto extract_csrf_token(std::string_view body) -> std::optional<std::string> {
    std::string const text{body};
    for (auto const& pattern : csrf_patterns()) {
        std::smatch match;
        if (std::regex_search(text, match, pattern) && match.size() > 1) {
            auto token = Text::trim(match[1].str());
            if (!token.empty()) {
                return token;
            }
        }
    }
    return std::nullopt;
}

} // namespace DK::Net
