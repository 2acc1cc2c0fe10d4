#pragma once

#include <docket/core/Error.hpp>

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DK::Html {

struct Option {
    std::string value;
    std::string text;
};

struct Select {
    std::string         name;
    std::string         id;
    std::string         css_class;
    std::vector<Option> options;

    // True when name, id or class mentions the needle (case-insensitive).
    auto mentions(std::string_view needle) const -> bool;
};

struct Cell {
    std::string                text;
    std::optional<std::string> href;
    bool                       header{false};
};

struct Table {
    std::string                    id;
    std::string                    css_class;
    std::vector<std::vector<Cell>> rows;
};

/**
 * Parsed HTML document. libxml2 runs in recover mode, so tag soup still yields a
 * tree; only input libxml2 cannot turn into any document fails with ParseFailure.
 */
class HtmlDocument {
public:
    static auto parse(std::string_view html) -> Expected<HtmlDocument>;

    // Document order.
    auto selects() const -> std::vector<Select>;
    auto tables() const -> std::vector<Table>;
    auto scripts() const -> std::vector<std::string>;

private:
    struct DocFree {
        void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
    };

    explicit HtmlDocument(xmlDoc* doc)
        : doc_{doc} {}

    std::unique_ptr<xmlDoc, DocFree> doc_;
};

} // namespace DK::Html
