#pragma once

#include <docket/cache/TtlCache.hpp>
#include <docket/core/Error.hpp>
#include <docket/core/FallbackChain.hpp>
#include <docket/core/Records.hpp>
#include <docket/normalize/Normalizer.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DK {

struct CatalogOptions {
    CacheTtls   ttls{};
    std::size_t max_alternatives{0}; // 0 lists every known name
};

/**
 * State/Commission hierarchy backed by the TTL cache and, on a miss, by the
 * fallback chain.
 *
 * Name matching is trimmed and case-insensitive with a fixed precedence: exact
 * canonical name, then exact display name, then substring containment in either
 * direction. Within one level the earliest entry in catalog order wins.
 */
class Catalog {
public:
    Catalog(FallbackChain const& chain, Normalizer const& normalizer, CatalogOptions options = {});

    auto listStates() -> Expected<std::vector<State>>;
    auto listCommissions(std::string const& state_id) -> Expected<std::vector<Commission>>;

    auto resolveState(std::string_view name) -> Expected<State>;
    auto resolveCommission(std::string const& state_id, std::string_view name) -> Expected<Commission>;

    // Drops every cached list; the next call reloads through the chain.
    void invalidate();

    static auto matchState(std::vector<State> const& states, std::string_view name) -> std::optional<State>;
    static auto matchCommission(std::vector<Commission> const& commissions, std::string_view name)
            -> std::optional<Commission>;

private:
    auto alternatives(std::vector<std::string> names) const -> std::vector<std::string>;

    FallbackChain const&              chain_;
    Normalizer const&                 normalizer_;
    CatalogOptions                    options_;
    TtlCache<std::vector<State>>      states_;
    TtlCache<std::vector<Commission>> commissions_;
    std::mutex                        load_mutex_;
};

} // namespace DK
