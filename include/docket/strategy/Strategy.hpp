#pragma once

#include <docket/core/Error.hpp>
#include <docket/strategy/Payload.hpp>

#include <string_view>

namespace DK {

/**
 * One way of reaching the portal. probe() fails with NotSupported when the tier
 * has no method for the operation, Unreachable when nothing answered usefully and
 * Empty when the portal answered but carried no recognizable data. Transport codes
 * (Timeout, RateLimited, UpstreamBlocked) may surface as the tier's failure.
 *
 * Strategies keep no business data between probes.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual auto name() const -> std::string_view                          = 0;
    virtual auto probe(Operation const& operation) -> Expected<RawPayload> = 0;
};

} // namespace DK
