#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif

#include "httplib.h"

#include <docket/transport/HttplibBackend.hpp>

#include <memory>
#include <utility>

namespace DK::Net {

namespace {

auto make_client(UrlParts const& url, bool verify_tls, std::chrono::milliseconds timeout)
    -> std::unique_ptr<httplib::ClientImpl> {
    std::unique_ptr<httplib::ClientImpl> client;
    if (url.tls) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        auto ssl_client = std::make_unique<httplib::SSLClient>(url.host, url.port);
        ssl_client->enable_server_certificate_verification(verify_tls);
        client = std::unique_ptr<httplib::ClientImpl>(std::move(ssl_client));
#else
        (void)verify_tls;
        return nullptr;
#endif
    } else {
        client = std::make_unique<httplib::ClientImpl>(url.host, url.port);
    }
    auto sec  = static_cast<time_t>(timeout.count() / 1000);
    auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    client->set_follow_location(true);
    client->set_keep_alive(false);
    return client;
}

} // namespace

HttplibBackend::HttplibBackend(std::string base_url, bool verify_tls)
    : base_url_{std::move(base_url)}
    , verify_tls_{verify_tls} {
    if (auto parsed = parse_url(base_url_)) {
        base_  = std::move(*parsed);
        valid_ = true;
    }
}

auto HttplibBackend::perform(HttpExchange const& exchange) -> Expected<RawResponse> {
    if (!valid_) {
        return makeError(Error::Code::InvalidConfiguration, "unsupported base url: " + base_url_);
    }
    auto client = make_client(base_, verify_tls_, exchange.timeout);
    if (!client) {
        return makeError(Error::Code::Unreachable, "TLS requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }

    httplib::Headers headers;
    for (auto const& [name, value] : exchange.headers) {
        headers.emplace(name, value);
    }
    auto target = join_path(base_.path, exchange.target);

    auto result = exchange.method == HttpMethod::Post
                          ? client->Post(target, headers, exchange.body, exchange.content_type)
                          : client->Get(target, headers);
    if (!result) {
        auto error  = result.error();
        auto reason = std::string{method_name(exchange.method)} + " " + target + ": " + httplib::to_string(error);
        if (error == httplib::Error::ConnectionTimeout || error == httplib::Error::Read
            || error == httplib::Error::Write) {
            return makeError(Error::Code::Timeout, std::move(reason));
        }
        return makeError(Error::Code::Unreachable, std::move(reason));
    }

    RawResponse response{};
    response.status = result->status;
    response.body   = result->body;
    for (auto const& [name, value] : result->headers) {
        response.headers.emplace_back(name, value);
    }
    return response;
}

} // namespace DK::Net
