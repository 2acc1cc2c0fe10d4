#pragma once

#include <docket/transport/HttpTypes.hpp>

#include <string>

namespace DK::Net {

// HttpBackend over cpp-httplib. One client per exchange; the Transport owns all state.
class HttplibBackend final : public HttpBackend {
public:
    explicit HttplibBackend(std::string base_url, bool verify_tls = true);

    auto perform(HttpExchange const& exchange) -> Expected<RawResponse> override;

    auto base() const -> UrlParts const& { return base_; }

private:
    std::string base_url_;
    UrlParts    base_;
    bool        valid_{false};
    bool        verify_tls_{true};
};

} // namespace DK::Net
