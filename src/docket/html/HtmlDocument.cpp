#include "html/HtmlDocument.hpp"

#include "utils/Text.hpp"

#include <functional>
#include <limits>

namespace DK::Html {

namespace {

auto is_element(xmlNode const* node, std::string_view name) -> bool {
    return node != nullptr && node->type == XML_ELEMENT_NODE && node->name != nullptr
           && Text::iequals(reinterpret_cast<char const*>(node->name), name);
}

auto attribute(xmlNode const* node, char const* name) -> std::string {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<xmlChar const*>(name));
    if (value == nullptr) {
        return {};
    }
    std::string out{reinterpret_cast<char const*>(value)};
    xmlFree(value);
    return out;
}

auto text_of(xmlNode const* node) -> std::string {
    xmlChar* content = xmlNodeGetContent(node);
    if (content == nullptr) {
        return {};
    }
    std::string out{reinterpret_cast<char const*>(content)};
    xmlFree(content);
    return Text::trim(Text::collapseWhitespace(out));
}

void walk(xmlNode* node, std::function<void(xmlNode*)> const& visit) {
    for (auto* current = node; current != nullptr; current = current->next) {
        if (current->type == XML_ELEMENT_NODE) {
            visit(current);
        }
        walk(current->children, visit);
    }
}

auto first_link(xmlNode* cell) -> std::optional<std::string> {
    std::optional<std::string> href;
    walk(cell->children, [&](xmlNode* node) {
        if (!href && is_element(node, "a")) {
            auto value = Text::trim(attribute(node, "href"));
            if (!value.empty() && !value.starts_with("#") && !Text::iequals(value.substr(0, 11), "javascript:")) {
                href = std::move(value);
            }
        }
    });
    return href;
}

// Rows owned by this table, skipping rows of nested tables.
void collect_rows(xmlNode* node, Table& table) {
    for (auto* child = node->children; child != nullptr; child = child->next) {
        if (is_element(child, "table")) {
            continue;
        }
        if (!is_element(child, "tr")) {
            collect_rows(child, table);
            continue;
        }
        std::vector<Cell> row;
        for (auto* cell = child->children; cell != nullptr; cell = cell->next) {
            bool const is_th = is_element(cell, "th");
            if (!is_th && !is_element(cell, "td")) {
                continue;
            }
            row.push_back(Cell{text_of(cell), first_link(cell), is_th});
        }
        if (!row.empty()) {
            table.rows.push_back(std::move(row));
        }
    }
}

} // namespace

auto Select::mentions(std::string_view needle) const -> bool {
    return Text::icontains(name, needle) || Text::icontains(id, needle) || Text::icontains(css_class, needle);
}

auto HtmlDocument::parse(std::string_view html) -> Expected<HtmlDocument> {
    if (html.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return makeError(Error::Code::ParseFailure, "document too large");
    }
    int const options = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;
    xmlDoc*   doc     = htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8", options);
    if (doc == nullptr) {
        return makeError(Error::Code::ParseFailure, "libxml2 could not build a document");
    }
    return HtmlDocument{doc};
}

auto HtmlDocument::selects() const -> std::vector<Select> {
    std::vector<Select> found;
    walk(xmlDocGetRootElement(doc_.get()), [&](xmlNode* node) {
        if (!is_element(node, "select")) {
            return;
        }
        Select select{attribute(node, "name"), attribute(node, "id"), attribute(node, "class"), {}};
        walk(node->children, [&](xmlNode* child) {
            if (!is_element(child, "option")) {
                return;
            }
            auto text = text_of(child);
            // An option without a value attribute submits its text.
            xmlChar* raw   = xmlGetProp(child, reinterpret_cast<xmlChar const*>("value"));
            auto     value = raw == nullptr ? text : Text::trim(reinterpret_cast<char const*>(raw));
            if (raw != nullptr) {
                xmlFree(raw);
            }
            select.options.push_back(Option{std::move(value), std::move(text)});
        });
        found.push_back(std::move(select));
    });
    return found;
}

auto HtmlDocument::tables() const -> std::vector<Table> {
    std::vector<Table> found;
    walk(xmlDocGetRootElement(doc_.get()), [&](xmlNode* node) {
        if (!is_element(node, "table")) {
            return;
        }
        Table table{attribute(node, "id"), attribute(node, "class"), {}};
        collect_rows(node, table);
        found.push_back(std::move(table));
    });
    return found;
}

auto HtmlDocument::scripts() const -> std::vector<std::string> {
    std::vector<std::string> found;
    walk(xmlDocGetRootElement(doc_.get()), [&](xmlNode* node) {
        if (!is_element(node, "script")) {
            return;
        }
        xmlChar* content = xmlNodeGetContent(node);
        if (content != nullptr) {
            found.emplace_back(reinterpret_cast<char const*>(content));
            xmlFree(content);
        }
    });
    return found;
}

} // namespace DK::Html
