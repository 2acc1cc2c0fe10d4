#pragma once

#include <docket/core/Records.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DK {

struct ListStatesOp {};

struct ListCommissionsOp {
    std::string state_id;
};

struct SearchCasesOp {
    SearchQuery query;
};

using Operation = std::variant<ListStatesOp, ListCommissionsOp, SearchCasesOp>;

enum class OperationKind {
    ListStates,
    ListCommissions,
    SearchCases
};

auto operationKind(Operation const& operation) -> OperationKind;
auto operationKindToString(OperationKind kind) -> std::string_view;

struct RawOption {
    std::string value;
    std::string text;
};

struct RawCell {
    std::string                text;
    std::optional<std::string> href;
};

using RawRow = std::vector<RawCell>;

// Cell positions of the result table a tier reads. Missing optional columns yield absent fields.
struct CaseColumnLayout {
    std::size_t min_cells{6};
    std::size_t case_number{0};
    std::size_t case_stage{1};
    std::size_t filing_date{2};
    std::size_t complainant{3};
    std::size_t complainant_advocate{4};
    std::size_t respondent{5};
    std::size_t respondent_advocate{6};
    // Rows wider than this carry the document link in their last cell, others in the case number cell.
    std::size_t link_in_last_cell_above{7};
};

struct JsonPayload {
    nlohmann::json document;
};

struct OptionRows {
    std::vector<RawOption> options;
};

struct TableRows {
    std::vector<RawRow> rows;
    CaseColumnLayout    layout;
};

// A tier's output before normalization. `source` names the endpoint or page it came from.
struct RawPayload {
    std::variant<JsonPayload, OptionRows, TableRows> data;
    std::string                                      source;
};

} // namespace DK
