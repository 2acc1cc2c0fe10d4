#include <docket/core/Catalog.hpp>

#include "log/TaggedLogger.hpp"
#include "utils/Text.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace DK {

namespace {

constexpr std::string_view kAllStatesKey{"all"};

// Precedence levels, lowest wins.
enum class MatchLevel {
    Canonical = 0,
    Display,
    Substring,
    None
};

auto match_level(std::string_view query, std::string_view canonical, std::string_view display) -> MatchLevel {
    if (Text::iequals(query, Text::trim(canonical))) {
        return MatchLevel::Canonical;
    }
    if (Text::iequals(query, Text::trim(display))) {
        return MatchLevel::Display;
    }
    if (Text::icontains(display, query) || Text::icontains(query, display) || Text::icontains(canonical, query)
        || Text::icontains(query, canonical)) {
        return MatchLevel::Substring;
    }
    return MatchLevel::None;
}

template <typename Entity, typename Canonical>
auto best_match(std::vector<Entity> const& entities, std::string_view name, Canonical canonical_of)
        -> std::optional<Entity> {
    auto const query = Text::trim(Text::collapseWhitespace(name));
    if (query.empty()) {
        return std::nullopt;
    }
    Entity const* best       = nullptr;
    auto          best_level = MatchLevel::None;
    for (auto const& entity : entities) {
        auto level = match_level(query, canonical_of(entity), entity.display_name);
        if (level < best_level) {
            best       = &entity;
            best_level = level;
            if (level == MatchLevel::Canonical) {
                break;
            }
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

template <typename Entity>
void drop_duplicate_ids(std::vector<Entity>& entities) {
    std::set<std::string> seen;
    std::erase_if(entities, [&](Entity const& entity) { return !seen.insert(entity.id).second; });
}

} // namespace

Catalog::Catalog(FallbackChain const& chain, Normalizer const& normalizer, CatalogOptions options)
    : chain_{chain}
    , normalizer_{normalizer}
    , options_{options}
    , states_{options.ttls.states}
    , commissions_{options.ttls.commissions} {
    states_.set_ttl(CacheNamespace::States, options_.ttls.states);
    commissions_.set_ttl(CacheNamespace::Commissions, options_.ttls.commissions);
}

auto Catalog::listStates() -> Expected<std::vector<State>> {
    if (auto cached = states_.get(CacheNamespace::States, kAllStatesKey)) {
        return std::move(*cached);
    }

    std::lock_guard const lock{load_mutex_};
    if (auto cached = states_.get(CacheNamespace::States, kAllStatesKey)) {
        return std::move(*cached);
    }

    auto states = chain_.run<State>(ListStatesOp{}, [this](RawPayload const& payload) {
        return normalizer_.states(payload);
    });
    if (!states) {
        return std::unexpected(states.error());
    }
    drop_duplicate_ids(*states);
    if (!states->empty()) {
        dk_log("Loaded " + std::to_string(states->size()) + " state(s)", "Catalog", "INFO");
        states_.set(CacheNamespace::States, kAllStatesKey, *states);
    }
    return states;
}

auto Catalog::listCommissions(std::string const& state_id) -> Expected<std::vector<Commission>> {
    auto states = listStates();
    if (!states) {
        return std::unexpected(states.error());
    }
    bool const known = std::any_of(states->begin(), states->end(), [&](State const& state) {
        return state.id == state_id;
    });
    if (!known) {
        std::vector<std::string> names;
        for (auto const& state : *states) {
            names.push_back(state.display_name);
        }
        return makeNotFound(Error::Code::StateNotFound,
                            "no state with id '" + state_id + "'",
                            alternatives(std::move(names)));
    }

    if (auto cached = commissions_.get(CacheNamespace::Commissions, state_id)) {
        return std::move(*cached);
    }

    std::lock_guard const lock{load_mutex_};
    if (auto cached = commissions_.get(CacheNamespace::Commissions, state_id)) {
        return std::move(*cached);
    }

    auto commissions = chain_.run<Commission>(ListCommissionsOp{state_id}, [&](RawPayload const& payload) {
        return normalizer_.commissions(payload, state_id);
    });
    if (!commissions) {
        return std::unexpected(commissions.error());
    }
    drop_duplicate_ids(*commissions);
    if (!commissions->empty()) {
        dk_log("Loaded " + std::to_string(commissions->size()) + " commission(s) for state " + state_id,
               "Catalog",
               "INFO");
        commissions_.set(CacheNamespace::Commissions, state_id, *commissions);
    }
    return commissions;
}

auto Catalog::resolveState(std::string_view name) -> Expected<State> {
    if (Text::trim(name).empty()) {
        return makeError(Error::Code::MalformedInput, "state name is empty");
    }
    auto states = listStates();
    if (!states) {
        return std::unexpected(states.error());
    }
    if (auto match = matchState(*states, name)) {
        return std::move(*match);
    }
    std::vector<std::string> names;
    for (auto const& state : *states) {
        names.push_back(state.display_name);
    }
    dk_log("No state matches '" + std::string{name} + "'", "Catalog", "INFO");
    return makeNotFound(Error::Code::StateNotFound,
                        "state '" + Text::trim(name) + "' not found",
                        alternatives(std::move(names)));
}

auto Catalog::resolveCommission(std::string const& state_id, std::string_view name) -> Expected<Commission> {
    if (Text::trim(name).empty()) {
        return makeError(Error::Code::MalformedInput, "commission name is empty");
    }
    auto commissions = listCommissions(state_id);
    if (!commissions) {
        return std::unexpected(commissions.error());
    }
    if (auto match = matchCommission(*commissions, name)) {
        return std::move(*match);
    }
    std::vector<std::string> names;
    for (auto const& commission : *commissions) {
        names.push_back(commission.display_name);
    }
    dk_log("No commission of state " + state_id + " matches '" + std::string{name} + "'", "Catalog", "INFO");
    return makeNotFound(Error::Code::CommissionNotFound,
                        "commission '" + Text::trim(name) + "' not found",
                        alternatives(std::move(names)));
}

void Catalog::invalidate() {
    states_.clear();
    commissions_.clear();
}

auto Catalog::matchState(std::vector<State> const& states, std::string_view name) -> std::optional<State> {
    return best_match(states, name, [](State const& state) -> std::string const& { return state.canonical_name; });
}

auto Catalog::matchCommission(std::vector<Commission> const& commissions, std::string_view name)
        -> std::optional<Commission> {
    return best_match(commissions, name, [](Commission const& commission) {
        return Text::toUpper(commission.display_name);
    });
}

auto Catalog::alternatives(std::vector<std::string> names) const -> std::vector<std::string> {
    if (options_.max_alternatives > 0 && names.size() > options_.max_alternatives) {
        names.resize(options_.max_alternatives);
    }
    return names;
}

} // namespace DK
