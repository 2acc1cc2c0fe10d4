#include "strategy/PageHeuristics.hpp"

#include "utils/Text.hpp"

#include <algorithm>
#include <array>

namespace DK::Strategies {

namespace {

constexpr std::size_t kStateSelectMinOptions = 10;

auto usable_options(Html::Select const& select) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(select.options.begin(), select.options.end(), [](auto const& option) {
        return !Text::trim(option.value).empty();
    }));
}

// End of the bracketed literal starting at `open`, honouring quoted strings.
auto matching_bracket(std::string_view text, std::size_t open) -> std::optional<std::size_t> {
    int  depth  = 0;
    char quote  = 0;
    bool escape = false;
    for (auto i = open; i < text.size(); ++i) {
        char const ch = text[i];
        if (quote != 0) {
            if (escape) {
                escape = false;
            } else if (ch == '\\') {
                escape = true;
            } else if (ch == quote) {
                quote = 0;
            }
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '[') {
            ++depth;
        } else if (ch == ']') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::nullopt;
}

} // namespace

auto pickStateSelect(std::vector<Html::Select> const& selects) -> std::optional<Html::Select> {
    for (auto const& select : selects) {
        if (select.mentions("state") && usable_options(select) > 0) {
            return select;
        }
    }
    for (auto const& select : selects) {
        if (select.options.size() > kStateSelectMinOptions) {
            return select;
        }
    }
    return std::nullopt;
}

auto pickCommissionSelect(std::vector<Html::Select> const& selects) -> std::optional<Html::Select> {
    for (auto const& select : selects) {
        if ((select.mentions("commission") || select.mentions("district")) && usable_options(select) > 0) {
            return select;
        }
    }
    Html::Select const* largest = nullptr;
    for (auto const& select : selects) {
        if (select.mentions("state")) {
            continue;
        }
        if (usable_options(select) > 0 && (largest == nullptr || select.options.size() > largest->options.size())) {
            largest = &select;
        }
    }
    if (largest == nullptr) {
        return std::nullopt;
    }
    return *largest;
}

auto pickCaseRows(std::vector<Html::Table> const& tables, std::size_t min_cells) -> std::optional<std::vector<RawRow>> {
    auto data_rows = [&](Html::Table const& table) {
        std::vector<RawRow> rows;
        for (auto const& row : table.rows) {
            bool const header_row = std::all_of(row.begin(), row.end(), [](auto const& cell) { return cell.header; });
            if (header_row || row.size() < min_cells) {
                continue;
            }
            RawRow raw;
            raw.reserve(row.size());
            for (auto const& cell : row) {
                raw.push_back(RawCell{cell.text, cell.href});
            }
            rows.push_back(std::move(raw));
        }
        return rows;
    };

    std::optional<std::vector<RawRow>> fallback;
    for (auto const& table : tables) {
        auto rows = data_rows(table);
        if (rows.empty()) {
            continue;
        }
        if (Text::icontains(table.css_class, "table")) {
            return rows;
        }
        if (!fallback) {
            fallback = std::move(rows);
        }
    }
    return fallback;
}

auto embeddedStateArray(std::vector<std::string> const& scripts) -> std::optional<nlohmann::json> {
    static constexpr std::array<std::string_view, 3> kNames{"STATE_OPTIONS", "stateList", "states"};
    for (auto const& script : scripts) {
        for (auto name : kNames) {
            for (auto pos = script.find(name); pos != std::string::npos; pos = script.find(name, pos + 1)) {
                auto cursor = pos + name.size();
                while (cursor < script.size() && (script[cursor] == ' ' || script[cursor] == '\t')) {
                    ++cursor;
                }
                if (cursor >= script.size() || (script[cursor] != '=' && script[cursor] != ':')) {
                    continue;
                }
                auto open = script.find_first_not_of(" \t\r\n", cursor + 1);
                if (open == std::string::npos || script[open] != '[') {
                    continue;
                }
                auto close = matching_bracket(script, open);
                if (!close) {
                    continue;
                }
                auto parsed = nlohmann::json::parse(script.substr(open, *close - open + 1), nullptr, false);
                if (!parsed.is_discarded() && parsed.is_array() && !parsed.empty()) {
                    return parsed;
                }
            }
        }
    }
    return std::nullopt;
}

auto toOptionRows(Html::Select const& select) -> OptionRows {
    OptionRows rows;
    rows.options.reserve(select.options.size());
    for (auto const& option : select.options) {
        rows.options.push_back(RawOption{option.value, option.text});
    }
    return rows;
}

auto extractFromPage(std::string_view html, OperationKind kind, CaseColumnLayout const& layout, std::string source)
        -> Expected<RawPayload> {
    auto document = Html::HtmlDocument::parse(html);
    if (!document) {
        return std::unexpected(document.error());
    }

    switch (kind) {
    case OperationKind::ListStates: {
        auto selects = document->selects();
        if (auto select = pickStateSelect(selects)) {
            return RawPayload{toOptionRows(*select), std::move(source)};
        }
        if (auto embedded = embeddedStateArray(document->scripts())) {
            return RawPayload{JsonPayload{std::move(*embedded)}, std::move(source)};
        }
        return makeError(Error::Code::Empty, "no state dropdown on " + source);
    }
    case OperationKind::ListCommissions: {
        if (auto select = pickCommissionSelect(document->selects())) {
            return RawPayload{toOptionRows(*select), std::move(source)};
        }
        return makeError(Error::Code::Empty, "no commission dropdown on " + source);
    }
    case OperationKind::SearchCases: {
        if (auto rows = pickCaseRows(document->tables(), layout.min_cells)) {
            return RawPayload{TableRows{std::move(*rows), layout}, std::move(source)};
        }
        return makeError(Error::Code::Empty, "no result table on " + source);
    }
    }
    return makeError(Error::Code::NotSupported, "unknown operation");
}

} // namespace DK::Strategies
