#pragma once
#include <gumbo.h>
#include <optional>
#include <string>
#include <vector>

namespace Vortex {
namespace Parsing {

class Selector;

// Non-owning view of an element node; valid while its HtmlDocument lives.
class Element {
public:
    explicit Element(const GumboNode* node) : node_(node) {
    }

    std::string                tag_name() const;
    std::optional<std::string> attr(const std::string& name) const;
    bool                       has_attr(const std::string& name) const;
    std::string                id() const;
    std::vector<std::string>   classes() const;

    // Concatenated descendant text, whitespace collapsed.
    std::string text() const;

    std::optional<Element> parent() const;
    std::vector<Element>   children() const;

    const GumboNode* node() const {
        return node_;
    }
    bool operator==(const Element& other) const {
        return node_ == other.node_;
    }

private:
    const GumboNode* node_;
};

/**
 * @brief RAII owner of a gumbo parse tree.
 */
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html);
    ~HtmlDocument();
    HtmlDocument(const HtmlDocument&)            = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    Element root() const;

    // Matches in document order.
    std::vector<Element> select(const Selector& selector) const;
    std::vector<Element> select(const std::string& css) const;
    std::vector<Element> select_within(const Element& scope, const Selector& selector) const;

    std::string title() const;

private:
    GumboOutput* output_;
};

}  // namespace Parsing
}  // namespace Vortex
