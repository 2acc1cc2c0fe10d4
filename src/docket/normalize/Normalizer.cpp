#include <docket/normalize/Normalizer.hpp>
#include <docket/transport/HttpTypes.hpp>

#include "utils/Text.hpp"

#include <initializer_list>
#include <optional>
#include <utility>

namespace DK {

namespace {

using json = nlohmann::json;

// Stringified scalar under the first present key; numbers keep their integer form.
auto field(json const& item, std::initializer_list<std::string_view> keys) -> std::string {
    for (auto key : keys) {
        auto it = item.find(std::string{key});
        if (it == item.end() || it->is_null()) {
            continue;
        }
        std::string value;
        if (it->is_string()) {
            value = it->get<std::string>();
        } else if (it->is_number_unsigned()) {
            value = std::to_string(it->get<unsigned long long>());
        } else if (it->is_number_integer()) {
            value = std::to_string(it->get<long long>());
        } else if (it->is_number_float() || it->is_boolean()) {
            value = it->dump();
        } else {
            continue;
        }
        value = Text::trim(Text::collapseWhitespace(value));
        if (!value.empty()) {
            return value;
        }
    }
    return {};
}

auto optional_field(json const& item, std::initializer_list<std::string_view> keys) -> std::optional<std::string> {
    auto value = field(item, keys);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// Locates the record array inside the accepted container shapes.
auto record_array(json const& document, std::string_view collection) -> json const* {
    if (document.is_array()) {
        return &document;
    }
    if (!document.is_object()) {
        return nullptr;
    }
    if (auto data = document.find("data"); data != document.end()) {
        if (data->is_array()) {
            return &*data;
        }
        if (data->is_object()) {
            if (auto nested = data->find(std::string{collection}); nested != data->end() && nested->is_array()) {
                return &*nested;
            }
        }
    }
    if (auto direct = document.find(std::string{collection}); direct != document.end() && direct->is_array()) {
        return &*direct;
    }
    return nullptr;
}

auto parse_failure(std::string_view what, RawPayload const& payload) -> std::unexpected<Error> {
    return makeError(Error::Code::ParseFailure,
                     std::string{what} + (payload.source.empty() ? std::string{} : " from " + payload.source));
}

auto cell_text(RawRow const& row, std::size_t index) -> std::string {
    if (index >= row.size()) {
        return {};
    }
    return Text::trim(Text::collapseWhitespace(row[index].text));
}

auto non_empty(std::string value) -> std::optional<std::string> {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Normalizer::Normalizer(std::string base_url)
    : base_url_{std::move(base_url)} {}

auto Normalizer::isPlaceholderOption(RawOption const& option) -> bool {
    auto value = Text::trim(option.value);
    auto text  = Text::toLower(Text::trim(option.text));
    if (value.empty() || value == "-1" || value == "0" || Text::iequals(value, "select")) {
        return true;
    }
    return text.empty() || text.starts_with("select") || text.starts_with("choose") || text.starts_with("--");
}

auto Normalizer::states(RawPayload const& payload) const -> Expected<std::vector<State>> {
    std::vector<State> states;
    if (auto const* rows = std::get_if<OptionRows>(&payload.data)) {
        for (auto const& option : rows->options) {
            if (isPlaceholderOption(option)) {
                continue;
            }
            auto display = Text::trim(Text::collapseWhitespace(option.text));
            states.push_back(State{Text::trim(option.value), Text::toUpper(display), display});
        }
        return states;
    }
    auto const* document = std::get_if<JsonPayload>(&payload.data);
    if (document == nullptr) {
        return parse_failure("table rows cannot describe states", payload);
    }
    auto const* items = record_array(document->document, "states");
    if (items == nullptr) {
        return parse_failure("no state list in JSON", payload);
    }
    for (auto const& item : *items) {
        if (!item.is_object()) {
            continue;
        }
        auto id   = field(item, {"id", "stateId", "state_id", "code", "value"});
        auto name = field(item, {"name", "stateName", "state_name", "text", "label"});
        if (id.empty() || name.empty()) {
            continue;
        }
        auto display = field(item, {"displayName", "display_name"});
        states.push_back(State{std::move(id), Text::toUpper(name), display.empty() ? name : std::move(display)});
    }
    return states;
}

auto Normalizer::commissions(RawPayload const& payload, std::string const& state_id) const
        -> Expected<std::vector<Commission>> {
    std::vector<Commission> commissions;
    if (auto const* rows = std::get_if<OptionRows>(&payload.data)) {
        for (auto const& option : rows->options) {
            if (isPlaceholderOption(option)) {
                continue;
            }
            commissions.push_back(
                    Commission{Text::trim(option.value), Text::trim(Text::collapseWhitespace(option.text)), state_id});
        }
        return commissions;
    }
    auto const* document = std::get_if<JsonPayload>(&payload.data);
    if (document == nullptr) {
        return parse_failure("table rows cannot describe commissions", payload);
    }
    auto const* items = record_array(document->document, "commissions");
    if (items == nullptr) {
        return parse_failure("no commission list in JSON", payload);
    }
    for (auto const& item : *items) {
        if (!item.is_object()) {
            continue;
        }
        auto id      = field(item, {"id", "commissionId", "commission_id", "code", "value"});
        auto display = field(item, {"displayName", "display_name"});
        if (display.empty()) {
            display = field(item, {"name", "commissionName", "commission_name", "text", "label"});
        }
        if (id.empty() || display.empty()) {
            continue;
        }
        commissions.push_back(Commission{std::move(id), std::move(display), state_id});
    }
    return commissions;
}

auto Normalizer::cases(RawPayload const& payload) const -> Expected<std::vector<CaseRecord>> {
    std::vector<CaseRecord> records;

    auto finish = [&](CaseRecord record, std::string const& raw_date, std::optional<std::string> link) {
        auto date = parseDate(raw_date);
        if (record.case_number.empty() || record.case_stage.empty() || !date || record.complainant.empty()
            || record.respondent.empty()) {
            return;
        }
        record.filing_date = formatIsoDate(*date);
        if (link) {
            record.document_link = Net::resolve_url(base_url_, *link);
        }
        records.push_back(std::move(record));
    };

    if (auto const* table = std::get_if<TableRows>(&payload.data)) {
        auto const& layout = table->layout;
        for (auto const& row : table->rows) {
            if (row.size() < layout.min_cells) {
                continue;
            }
            CaseRecord record{};
            record.case_number          = cell_text(row, layout.case_number);
            record.case_stage           = cell_text(row, layout.case_stage);
            record.complainant          = cell_text(row, layout.complainant);
            record.complainant_advocate = non_empty(cell_text(row, layout.complainant_advocate));
            record.respondent           = cell_text(row, layout.respondent);
            record.respondent_advocate  = non_empty(cell_text(row, layout.respondent_advocate));

            auto link_index = row.size() > layout.link_in_last_cell_above ? row.size() - 1 : layout.case_number;
            std::optional<std::string> link;
            if (link_index < row.size()) {
                link = row[link_index].href;
            }
            finish(std::move(record), cell_text(row, layout.filing_date), std::move(link));
        }
        return records;
    }

    auto const* document = std::get_if<JsonPayload>(&payload.data);
    if (document == nullptr) {
        return parse_failure("option rows cannot describe cases", payload);
    }
    auto const* items = record_array(document->document, "cases");
    if (items == nullptr) {
        return parse_failure("no case list in JSON", payload);
    }
    for (auto const& item : *items) {
        if (!item.is_object()) {
            continue;
        }
        CaseRecord record{};
        record.case_number          = field(item, {"caseNumber", "case_number", "caseNo"});
        record.case_stage           = field(item, {"caseStage", "case_stage", "stage"});
        record.complainant          = field(item, {"complainantName", "complainant"});
        record.complainant_advocate = optional_field(item, {"complainantAdvocate", "complainant_advocate"});
        record.respondent           = field(item, {"respondentName", "respondent"});
        record.respondent_advocate  = optional_field(item, {"respondentAdvocate", "respondent_advocate"});
        finish(std::move(record),
               field(item, {"filingDate", "filing_date"}),
               optional_field(item, {"documentLink", "document_link"}));
    }
    return records;
}

} // namespace DK
