#include <docket/strategy/BrowserAutomationStrategy.hpp>

#include "log/TaggedLogger.hpp"
#include "strategy/PageHeuristics.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace DK::Strategies {

namespace {

constexpr char kPopulatedSelectCount[] =
        "return Array.from(document.querySelectorAll('select')).filter(s => s.options.length > 1).length;";

// Picks the state dropdown the same way the HTML heuristics do, then fires `change`.
constexpr char kChooseState[] = R"(
const wanted = String(arguments[0]);
const selects = Array.from(document.querySelectorAll('select'));
const byName = s => /state/i.test([s.name, s.id, s.className].join(' '));
const target = selects.find(byName) || selects.find(s => s.options.length > 10);
if (!target) { return false; }
if (!Array.from(target.options).some(o => o.value === wanted)) { return false; }
target.value = wanted;
target.dispatchEvent(new Event('change', { bubbles: true }));
return true;
)";

} // namespace

BrowserAutomationStrategy::BrowserAutomationStrategy(Net::Transport&                transport,
                                                     std::unique_ptr<BrowserDriver> driver,
                                                     BrowserStrategyOptions         options,
                                                     Sleeper                        sleeper)
    : transport_{transport}
    , driver_{std::move(driver)}
    , options_{std::move(options)}
    , sleeper_{std::move(sleeper)} {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

auto BrowserAutomationStrategy::probe(Operation const& operation) -> Expected<RawPayload> {
    if (std::holds_alternative<SearchCasesOp>(operation)) {
        return makeError(Error::Code::NotSupported, "browser tier does not run searches");
    }
    if (!driver_) {
        return makeError(Error::Code::NotSupported, "no browser driver configured");
    }

    auto const deadline = Clock::now() + options_.timeout;
    transport_.throttle();

    auto session = driver_->openSession();
    if (!session) {
        dk_log("browser_automation could not start: " + describeError(session.error()), "Strategy", "WARN");
        return makeError(Error::Code::Unreachable, "browser unavailable: " + describeError(session.error()));
    }

    auto url = transport_.pageUrl(options_.page);
    if (auto loaded = (*session)->navigate(url); !loaded) {
        return makeError(Error::Code::Unreachable, "could not load " + url + ": " + describeError(loaded.error()));
    }

    auto states = awaitPayload(**session, OperationKind::ListStates, deadline);
    if (std::holds_alternative<ListStatesOp>(operation) || !states) {
        return states;
    }

    auto const& state_id = std::get<ListCommissionsOp>(operation).state_id;
    auto        chosen   = (*session)->execute(kChooseState, nlohmann::json::array({state_id}));
    if (!chosen) {
        return makeError(Error::Code::Unreachable, "could not choose state: " + describeError(chosen.error()));
    }
    if (!chosen->is_boolean() || !chosen->get<bool>()) {
        return makeError(Error::Code::Empty, "state " + state_id + " is not offered by the rendered dropdown");
    }
    return awaitPayload(**session, OperationKind::ListCommissions, deadline);
}

auto BrowserAutomationStrategy::awaitPayload(BrowserSession& session, OperationKind kind, Clock::time_point deadline)
        -> Expected<RawPayload> {
    auto const source = std::string{name()} + " " + options_.page;
    while (true) {
        auto count = session.execute(kPopulatedSelectCount, nlohmann::json::array());
        if (!count) {
            return makeError(Error::Code::Unreachable, "browser stopped answering: " + describeError(count.error()));
        }
        if (count->is_number_integer() && count->get<long long>() > 0) {
            auto html = session.pageSource();
            if (!html) {
                return makeError(Error::Code::Unreachable, "could not read page source: " + describeError(html.error()));
            }
            auto payload = extractFromPage(*html, kind, CaseColumnLayout{}, source);
            if (payload) {
                return payload;
            }
        }
        auto now = Clock::now();
        if (!(now < deadline)) {
            dk_log("browser_automation gave up waiting for " + std::string{operationKindToString(kind)}, "Strategy", "WARN");
            return makeError(Error::Code::Unreachable,
                             "no usable dropdown appeared within " + std::to_string(options_.timeout.count()) + "ms");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        sleeper_(std::min(options_.poll_interval, remaining));
    }
}

} // namespace DK::Strategies
