#include <docket/config/DocketOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace DK {

namespace {

constexpr std::int64_t kMaxInt64 = std::numeric_limits<std::int64_t>::max();

bool is_http_url(std::string_view value) {
    return value.starts_with("http://") || value.starts_with("https://");
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

// Integer settings shared by the environment and the command line: env key, flag, bounds.
struct IntegerSetting {
    char const*   env;
    char const*   flag;
    std::int64_t DocketOptions::*field;
    std::int64_t  min;
    std::int64_t  max;
    char const*   message;
};

constexpr IntegerSetting kIntegerSettings[] = {
        {"DOCKET_REQUEST_TIMEOUT_MS", "--request-timeout-ms", &DocketOptions::request_timeout_ms, 1, kMaxInt64, "must be > 0"},
        {"DOCKET_MAX_RETRIES", "--max-retries", &DocketOptions::max_retries, 0, 10, "must be within 0-10"},
        {"DOCKET_BACKOFF_BASE_MS", "--backoff-base-ms", &DocketOptions::backoff_base_ms, 0, kMaxInt64, "must be >= 0"},
        {"DOCKET_MIN_REQUEST_INTERVAL_MS", "--min-request-interval-ms", &DocketOptions::min_request_interval_ms, 0,
         kMaxInt64, "must be >= 0"},
        {"DOCKET_RATE_LIMIT_COOLDOWN_MS", "--rate-limit-cooldown-ms", &DocketOptions::rate_limit_cooldown_ms, 0,
         kMaxInt64, "must be >= 0"},
        {"DOCKET_STATES_TTL_SECONDS", "--states-ttl-seconds", &DocketOptions::states_ttl_seconds, 0, kMaxInt64,
         "must be >= 0"},
        {"DOCKET_COMMISSIONS_TTL_SECONDS", "--commissions-ttl-seconds", &DocketOptions::commissions_ttl_seconds, 0,
         kMaxInt64, "must be >= 0"},
        {"DOCKET_SEARCH_TTL_SECONDS", "--search-ttl-seconds", &DocketOptions::search_ttl_seconds, 0, kMaxInt64,
         "must be >= 0"},
        {"DOCKET_BROWSER_TIMEOUT_MS", "--browser-timeout-ms", &DocketOptions::browser_timeout_ms, 1, kMaxInt64,
         "must be > 0"},
        {"DOCKET_MAX_ALTERNATIVES", "--max-alternatives", &DocketOptions::max_alternatives, 0, kMaxInt64,
         "must be >= 0"},
        {"DOCKET_RATE_LIMIT_PER_MINUTE", "--rate-limit-per-minute", &DocketOptions::rate_limit_per_minute, 0,
         kMaxInt64, "must be >= 0"},
        {"DOCKET_RATE_LIMIT_BURST", "--rate-limit-burst", &DocketOptions::rate_limit_burst, 0, kMaxInt64,
         "must be >= 0"},
};

struct BoolSetting {
    char const* env;
    char const* flag;
    bool DocketOptions::*field;
};

constexpr BoolSetting kBoolSettings[] = {
        {"DOCKET_BROWSER_ENABLED", "--browser-enabled", &DocketOptions::browser_enabled},
        {"DOCKET_BROWSER_HEADLESS", "--browser-headless", &DocketOptions::browser_headless},
};

} // namespace

bool IsValidDocketPort(int port) {
    return port > 0 && port <= 65535;
}

auto ValidateDocketOptions(DocketOptions const& options) -> std::optional<std::string> {
    if (!is_http_url(options.base_url)) {
        return std::string{"--base-url must be an http(s) URL"};
    }
    if (!options.webdriver_url.starts_with("http://")) {
        return std::string{"--webdriver-url must be an http URL"};
    }
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidDocketPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    for (auto const& setting : kIntegerSettings) {
        auto value = options.*setting.field;
        if (value < setting.min || value > setting.max) {
            return std::string{setting.flag} + " " + setting.message;
        }
    }
    return std::nullopt;
}

bool ApplyDocketEnvOverrides(DocketOptions& options) {
    auto apply_url_env = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (!is_http_url(value)) {
                std::cerr << key << " must be an http(s) URL\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    if (!apply_url_env("DOCKET_BASE_URL", options.base_url)) {
        return false;
    }
    if (!apply_url_env("DOCKET_WEBDRIVER_URL", options.webdriver_url)) {
        return false;
    }

    if (!apply_env("DOCKET_USER_AGENT", [&](std::string_view value) {
            options.user_agent = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DOCKET_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "DOCKET_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("DOCKET_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "DOCKET_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    for (auto const& setting : kIntegerSettings) {
        auto& target = options.*setting.field;
        if (!apply_env(setting.env, [&](std::string_view value) {
                std::int64_t parsed = target;
                if (!parse_integer_in_range<std::int64_t>(value, setting.min, setting.max, parsed)) {
                    std::cerr << setting.env << ' ' << setting.message << "\n";
                    return false;
                }
                target = parsed;
                return true;
            })) {
            return false;
        }
    }

    for (auto const& setting : kBoolSettings) {
        auto& target = options.*setting.field;
        if (!apply_env(setting.env, [&](std::string_view value) {
                auto parsed = parse_bool(value);
                if (!parsed.has_value()) {
                    std::cerr << setting.env << " must be a boolean (true/false, 1/0, yes/no)\n";
                    return false;
                }
                target = *parsed;
                return true;
            })) {
            return false;
        }
    }

    return true;
}

void PrintDocketUsage(std::string_view program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --base-url <url>                 Portal base URL (default https://e-jagriti.gov.in)\n"
              << "  --request-timeout-ms <ms>        Per-request deadline (default 30000)\n"
              << "  --max-retries <n>                Retries after a timeout (default 3)\n"
              << "  --backoff-base-ms <ms>           Backoff base, doubled per retry (default 1000)\n"
              << "  --min-request-interval-ms <ms>   Minimum gap between portal requests (default 1000)\n"
              << "  --rate-limit-cooldown-ms <ms>    Pause after an HTTP 429 (default 60000)\n"
              << "  --states-ttl-seconds <sec>       State list cache lifetime (default 21600)\n"
              << "  --commissions-ttl-seconds <sec>  Commission list cache lifetime (default 3600)\n"
              << "  --search-ttl-seconds <sec>       Search result cache lifetime (default 300)\n"
              << "  --browser-enabled <bool>         Use the browser tier (default true)\n"
              << "  --browser-headless <bool>        Run the browser headless (default true)\n"
              << "  --browser-timeout-ms <ms>        Browser tier deadline (default 60000)\n"
              << "  --webdriver-url <url>            WebDriver endpoint (default http://127.0.0.1:9515)\n"
              << "  --max-alternatives <n>           Names listed on a failed lookup, 0 = all (default 0)\n"
              << "  --user-agent <ua>                User-Agent sent to the portal\n"
              << "  --host <host>                    Bind address (default 127.0.0.1)\n"
              << "  --port <port>                    Bind port (default 8000)\n"
              << "  --rate-limit-per-minute <n>      Inbound requests per minute per client (default 120)\n"
              << "  --rate-limit-burst <n>           Inbound burst per client (default 30)\n"
              << "  --help                           Show this help\n";
}

std::optional<DocketOptions> ParseDocketArguments(int argc, char** argv, std::vector<std::string>* positional) {
    DocketOptions options{};
    if (!ApplyDocketEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};

        auto integer = std::find_if(std::begin(kIntegerSettings), std::end(kIntegerSettings), [&](auto const& s) {
            return arg == s.flag;
        });
        if (integer != std::end(kIntegerSettings)) {
            auto value = require_value(i, integer->flag);
            if (!value) {
                return std::nullopt;
            }
            std::int64_t parsed = options.*integer->field;
            if (!parse_integer_in_range<std::int64_t>(*value, integer->min, integer->max, parsed)) {
                std::cerr << integer->flag << ' ' << integer->message << "\n";
                return std::nullopt;
            }
            options.*integer->field = parsed;
            continue;
        }

        auto boolean = std::find_if(std::begin(kBoolSettings), std::end(kBoolSettings), [&](auto const& s) {
            return arg == s.flag;
        });
        if (boolean != std::end(kBoolSettings)) {
            auto value = require_value(i, boolean->flag);
            if (!value) {
                return std::nullopt;
            }
            auto parsed = parse_bool(*value);
            if (!parsed) {
                std::cerr << boolean->flag << " must be a boolean (true/false, 1/0, yes/no)\n";
                return std::nullopt;
            }
            options.*boolean->field = *parsed;
            continue;
        }

        if (arg == "--base-url" || arg == "--webdriver-url") {
            if (auto value = require_value(i, arg)) {
                if (!is_http_url(*value)) {
                    std::cerr << arg << " must be an http(s) URL\n";
                    return std::nullopt;
                }
                (arg == "--base-url" ? options.base_url : options.webdriver_url) = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--user-agent") {
            if (auto value = require_value(i, "--user-agent")) {
                options.user_agent = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else if (positional != nullptr && !arg.starts_with("--")) {
            positional->emplace_back(arg);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    while (options.base_url.size() > 1 && options.base_url.back() == '/') {
        options.base_url.pop_back();
    }

    if (auto error = ValidateDocketOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }
    return options;
}

} // namespace DK
