#pragma once

#include <docket/strategy/BrowserDriver.hpp>

#include <chrono>
#include <string>

namespace DK::Strategies {

struct WebDriverOptions {
    std::string               url{"http://127.0.0.1:9515"};
    bool                      headless{true};
    std::string               user_agent;
    std::chrono::milliseconds command_timeout{std::chrono::seconds{60}};
};

/**
 * BrowserDriver speaking the W3C WebDriver protocol (chromedriver and compatible
 * servers) over cpp-httplib.
 */
class WebDriverClient final : public BrowserDriver {
public:
    explicit WebDriverClient(WebDriverOptions options);

    auto openSession() -> Expected<std::unique_ptr<BrowserSession>> override;

    // New-session request body for the configured browser flags.
    auto capabilities() const -> nlohmann::json;

private:
    WebDriverOptions options_;
};

} // namespace DK::Strategies
