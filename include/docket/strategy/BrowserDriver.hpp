#pragma once

#include <docket/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace DK {

// One live browser session. Destroying it ends the remote session.
class BrowserSession {
public:
    virtual ~BrowserSession() = default;

    virtual auto navigate(std::string const& url) -> Expected<void>                                        = 0;
    virtual auto execute(std::string const& script, nlohmann::json const& args) -> Expected<nlohmann::json> = 0;
    virtual auto pageSource() -> Expected<std::string>                                                      = 0;
};

class BrowserDriver {
public:
    virtual ~BrowserDriver() = default;

    virtual auto openSession() -> Expected<std::unique_ptr<BrowserSession>> = 0;
};

} // namespace DK
