#pragma once

#include <docket/strategy/Payload.hpp>

#include "html/HtmlDocument.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DK::Strategies {

// The state dropdown: a select named/id'd/classed "state", else the first with more than ten options.
auto pickStateSelect(std::vector<Html::Select> const& selects) -> std::optional<Html::Select>;

// The commission dropdown: a select mentioning "commission" or "district", else the largest one.
auto pickCommissionSelect(std::vector<Html::Select> const& selects) -> std::optional<Html::Select>;

// Data rows of the first table holding at least one row of min_cells cells; tables classed "table" win.
auto pickCaseRows(std::vector<Html::Table> const& tables, std::size_t min_cells) -> std::optional<std::vector<RawRow>>;

// A `states = [...]`, `stateList = [...]` or `STATE_OPTIONS = [...]` literal that parses as JSON.
auto embeddedStateArray(std::vector<std::string> const& scripts) -> std::optional<nlohmann::json>;

auto toOptionRows(Html::Select const& select) -> OptionRows;

// Applies the select/table heuristics of one operation kind to a fetched page.
auto extractFromPage(std::string_view html, OperationKind kind, CaseColumnLayout const& layout, std::string source)
        -> Expected<RawPayload>;

} // namespace DK::Strategies
