#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DK {

struct DocketOptions {
    std::string  base_url{"https://e-jagriti.gov.in"};
    std::int64_t request_timeout_ms{30000};
    std::int64_t max_retries{3};
    std::int64_t backoff_base_ms{1000};
    std::int64_t min_request_interval_ms{1000};
    std::int64_t rate_limit_cooldown_ms{60000};
    std::int64_t states_ttl_seconds{21600};
    std::int64_t commissions_ttl_seconds{3600};
    std::int64_t search_ttl_seconds{300};
    bool         browser_enabled{true};
    bool         browser_headless{true};
    std::int64_t browser_timeout_ms{60000};
    std::string  webdriver_url{"http://127.0.0.1:9515"};
    std::int64_t max_alternatives{0};
    std::string  user_agent{
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/121.0.0.0 Safari/537.36"};
    std::string  host{"127.0.0.1"};
    int          port{8000};
    std::int64_t rate_limit_per_minute{120};
    std::int64_t rate_limit_burst{30};
    bool         show_help{false};
};

// Environment first, then flags. Non-flag arguments go to `positional` when given, else they are rejected.
auto ParseDocketArguments(int argc, char** argv, std::vector<std::string>* positional = nullptr)
        -> std::optional<DocketOptions>;

void PrintDocketUsage(std::string_view program);

bool ApplyDocketEnvOverrides(DocketOptions& options);

auto ValidateDocketOptions(DocketOptions const& options) -> std::optional<std::string>;

bool IsValidDocketPort(int port);

} // namespace DK
