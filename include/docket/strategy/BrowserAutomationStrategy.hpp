#pragma once

#include <docket/strategy/BrowserDriver.hpp>
#include <docket/strategy/Strategy.hpp>
#include <docket/transport/Transport.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace DK::Strategies {

struct BrowserStrategyOptions {
    std::string               page{"/advance-case-search"};
    std::chrono::milliseconds timeout{std::chrono::seconds{60}};
    std::chrono::milliseconds poll_interval{std::chrono::milliseconds{500}};
};

/**
 * Last-resort tier: loads the search page in a real browser, waits for script
 * rendered dropdowns and reads them from the live DOM. Every probe owns one
 * browser session for its whole duration and is bounded by `timeout`; when the
 * wanted element never shows up the probe fails with Unreachable.
 */
class BrowserAutomationStrategy final : public Strategy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    BrowserAutomationStrategy(Net::Transport&                transport,
                              std::unique_ptr<BrowserDriver> driver,
                              BrowserStrategyOptions         options = {},
                              Sleeper                        sleeper = {});

    auto name() const -> std::string_view override { return "browser_automation"; }
    auto probe(Operation const& operation) -> Expected<RawPayload> override;

private:
    using Clock = std::chrono::steady_clock;

    // Polls the rendered page until `kind`'s element can be read or the deadline passes.
    auto awaitPayload(BrowserSession& session, OperationKind kind, Clock::time_point deadline)
            -> Expected<RawPayload>;

    Net::Transport&                transport_;
    std::unique_ptr<BrowserDriver> driver_;
    BrowserStrategyOptions         options_;
    Sleeper                        sleeper_;
};

} // namespace DK::Strategies
