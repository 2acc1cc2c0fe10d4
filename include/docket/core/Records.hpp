#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace DK {

struct State {
    std::string id;
    std::string canonical_name;
    std::string display_name;

    auto operator==(State const&) const -> bool = default;
};

struct Commission {
    std::string id;
    std::string display_name;
    std::string state_id;

    auto operator==(Commission const&) const -> bool = default;
};

enum class SearchType {
    CaseNumber,
    Complainant,
    Respondent,
    ComplainantAdvocate,
    RespondentAdvocate,
    IndustryType,
    Judge
};

enum class CaseType {
    DailyOrder,
    FinalOrder,
    Judgment
};

struct DateRange {
    std::chrono::year_month_day from;
    std::chrono::year_month_day to;

    auto operator==(DateRange const&) const -> bool = default;
};

// Built only from ids that came out of Catalog resolution.
struct SearchQuery {
    SearchType               search_type{SearchType::Complainant};
    std::string              state_id;
    std::string              commission_id;
    std::string              search_value;
    std::optional<DateRange> date_range;
    CaseType                 case_type{CaseType::DailyOrder};

    auto operator==(SearchQuery const&) const -> bool = default;
};

struct CaseRecord {
    std::string                case_number;
    std::string                case_stage;
    std::string                filing_date;
    std::string                complainant;
    std::optional<std::string> complainant_advocate;
    std::string                respondent;
    std::optional<std::string> respondent_advocate;
    std::optional<std::string> document_link;

    auto operator==(CaseRecord const&) const -> bool = default;
};

[[nodiscard]] auto searchTypeToString(SearchType type) -> std::string_view;
[[nodiscard]] auto parseSearchType(std::string_view text) -> std::optional<SearchType>;

[[nodiscard]] auto caseTypeToString(CaseType type) -> std::string_view;
[[nodiscard]] auto parseCaseType(std::string_view text) -> std::optional<CaseType>;

// Accepts yyyy-mm-dd, dd/mm/yyyy and dd-mm-yyyy.
[[nodiscard]] auto parseDate(std::string_view text) -> std::optional<std::chrono::year_month_day>;
[[nodiscard]] auto formatIsoDate(std::chrono::year_month_day date) -> std::string;
[[nodiscard]] auto formatPortalDate(std::chrono::year_month_day date) -> std::string;

// Stable text form of a query, used as a cache key.
[[nodiscard]] auto queryCacheKey(SearchQuery const& query) -> std::string;

void to_json(nlohmann::json& out, State const& state);
void to_json(nlohmann::json& out, Commission const& commission);
void to_json(nlohmann::json& out, CaseRecord const& record);

} // namespace DK
