#include <docket/core/Records.hpp>

#include "utils/Text.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <utility>

namespace DK {

namespace {

constexpr std::array<std::pair<SearchType, std::string_view>, 7> kSearchTypeNames{{
        {SearchType::CaseNumber, "case_number"},
        {SearchType::Complainant, "complainant"},
        {SearchType::Respondent, "respondent"},
        {SearchType::ComplainantAdvocate, "complainant_advocate"},
        {SearchType::RespondentAdvocate, "respondent_advocate"},
        {SearchType::IndustryType, "industry_type"},
        {SearchType::Judge, "judge"},
}};

constexpr std::array<std::pair<CaseType, std::string_view>, 3> kCaseTypeNames{{
        {CaseType::DailyOrder, "Daily Order"},
        {CaseType::FinalOrder, "Final Order"},
        {CaseType::Judgment, "Judgment"},
}};

auto parse_int(std::string_view text, int& out) -> bool {
    if (text.empty()) {
        return false;
    }
    auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

auto make_date(int year, int month, int day) -> std::optional<std::chrono::year_month_day> {
    std::chrono::year_month_day date{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}};
    if (month < 1 || day < 1 || !date.ok()) {
        return std::nullopt;
    }
    return date;
}

auto optional_json(std::optional<std::string> const& value) -> nlohmann::json {
    if (value) {
        return *value;
    }
    return nullptr;
}

} // namespace

auto searchTypeToString(SearchType type) -> std::string_view {
    for (auto const& [candidate, name] : kSearchTypeNames) {
        if (candidate == type) {
            return name;
        }
    }
    return "complainant";
}

auto parseSearchType(std::string_view text) -> std::optional<SearchType> {
    auto normalized = Text::toLower(Text::trim(text));
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    for (auto const& [type, name] : kSearchTypeNames) {
        if (normalized == name) {
            return type;
        }
    }
    return std::nullopt;
}

auto caseTypeToString(CaseType type) -> std::string_view {
    for (auto const& [candidate, name] : kCaseTypeNames) {
        if (candidate == type) {
            return name;
        }
    }
    return "Daily Order";
}

auto parseCaseType(std::string_view text) -> std::optional<CaseType> {
    auto normalized = Text::trim(text);
    std::replace(normalized.begin(), normalized.end(), '_', ' ');
    for (auto const& [type, name] : kCaseTypeNames) {
        if (Text::iequals(normalized, name)) {
            return type;
        }
    }
    return std::nullopt;
}

auto parseDate(std::string_view text) -> std::optional<std::chrono::year_month_day> {
    auto trimmed = Text::trim(text);
    // ISO timestamps from JSON sources carry a time part.
    if (auto t = trimmed.find('T'); t != std::string::npos) {
        trimmed.resize(t);
    }
    if (trimmed.size() != 10) {
        return std::nullopt;
    }
    std::string_view view{trimmed};
    int year = 0;
    int month = 0;
    int day = 0;
    if (view[4] == '-' && view[7] == '-') {
        if (!parse_int(view.substr(0, 4), year) || !parse_int(view.substr(5, 2), month)
            || !parse_int(view.substr(8, 2), day)) {
            return std::nullopt;
        }
        return make_date(year, month, day);
    }
    if ((view[2] == '/' && view[5] == '/') || (view[2] == '-' && view[5] == '-')) {
        if (!parse_int(view.substr(0, 2), day) || !parse_int(view.substr(3, 2), month)
            || !parse_int(view.substr(6, 4), year)) {
            return std::nullopt;
        }
        return make_date(year, month, day);
    }
    return std::nullopt;
}

auto formatIsoDate(std::chrono::year_month_day date) -> std::string {
    char buffer[16];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buffer;
}

auto formatPortalDate(std::chrono::year_month_day date) -> std::string {
    char buffer[16];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%02u/%02u/%04d",
                  static_cast<unsigned>(date.day()),
                  static_cast<unsigned>(date.month()),
                  static_cast<int>(date.year()));
    return buffer;
}

auto queryCacheKey(SearchQuery const& query) -> std::string {
    std::string key;
    key.append(searchTypeToString(query.search_type));
    key.push_back('|');
    key.append(query.state_id);
    key.push_back('|');
    key.append(query.commission_id);
    key.push_back('|');
    key.append(Text::trim(query.search_value));
    key.push_back('|');
    key.append(caseTypeToString(query.case_type));
    if (query.date_range) {
        key.push_back('|');
        key.append(formatIsoDate(query.date_range->from));
        key.push_back('/');
        key.append(formatIsoDate(query.date_range->to));
    }
    return key;
}

void to_json(nlohmann::json& out, State const& state) {
    out = nlohmann::json{{"id", state.id}, {"name", state.canonical_name}, {"display_name", state.display_name}};
}

void to_json(nlohmann::json& out, Commission const& commission) {
    out = nlohmann::json{{"id", commission.id},
                         {"name", commission.display_name},
                         {"display_name", commission.display_name},
                         {"state_id", commission.state_id}};
}

void to_json(nlohmann::json& out, CaseRecord const& record) {
    out = nlohmann::json{{"case_number", record.case_number},
                         {"case_stage", record.case_stage},
                         {"filing_date", record.filing_date},
                         {"complainant", record.complainant},
                         {"complainant_advocate", optional_json(record.complainant_advocate)},
                         {"respondent", record.respondent},
                         {"respondent_advocate", optional_json(record.respondent_advocate)},
                         {"document_link", optional_json(record.document_link)}};
}

} // namespace DK
