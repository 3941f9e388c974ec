#include "html_document.hpp"
#include "../utils/text/string_utils.hpp"
#include "selector.hpp"

namespace Vortex {
namespace Parsing {

namespace {

void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE
        || node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        out += ' ';
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
        return;

    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE)
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i)
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
}

bool is_element(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

template <typename Fn>
void walk_descendants(const GumboNode* node, Fn&& fn) {
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        auto* child = static_cast<const GumboNode*>(children->data[i]);
        if (!is_element(child))
            continue;
        fn(child);
        walk_descendants(child, fn);
    }
}

}  // namespace

std::string Element::tag_name() const {
    GumboTag tag = node_->v.element.tag;
    if (tag != GUMBO_TAG_UNKNOWN)
        return gumbo_normalized_tagname(tag);

    GumboStringPiece original = node_->v.element.original_tag;
    gumbo_tag_from_original_text(&original);
    return Utils::Text::to_lower(std::string(original.data, original.length));
}

std::optional<std::string> Element::attr(const std::string& name) const {
    const GumboAttribute* attribute =
        gumbo_get_attribute(&node_->v.element.attributes, name.c_str());
    if (!attribute)
        return std::nullopt;
    return std::string(attribute->value);
}

bool Element::has_attr(const std::string& name) const {
    return gumbo_get_attribute(&node_->v.element.attributes, name.c_str()) != nullptr;
}

std::string Element::id() const {
    return attr("id").value_or("");
}

std::vector<std::string> Element::classes() const {
    std::vector<std::string> out;
    std::string              normalized = Utils::Text::collapse_whitespace(attr("class").value_or(""));
    for (const auto& token : Utils::Text::split(normalized, ' ')) {
        if (!token.empty())
            out.push_back(token);
    }
    return out;
}

std::string Element::text() const {
    std::string raw;
    collect_text(node_, raw);
    return Utils::Text::collapse_whitespace(raw);
}

std::optional<Element> Element::parent() const {
    const GumboNode* p = node_->parent;
    if (!is_element(p))
        return std::nullopt;
    return Element(p);
}

std::vector<Element> Element::children() const {
    std::vector<Element> out;
    const GumboVector*   children = &node_->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        auto* child = static_cast<const GumboNode*>(children->data[i]);
        if (is_element(child))
            out.emplace_back(child);
    }
    return out;
}

HtmlDocument::HtmlDocument(const std::string& html)
    : output_(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size())) {
}

HtmlDocument::~HtmlDocument() {
    if (output_)
        gumbo_destroy_output(&kGumboDefaultOptions, output_);
}

Element HtmlDocument::root() const {
    return Element(output_->root);
}

std::vector<Element> HtmlDocument::select(const Selector& selector) const {
    std::vector<Element> out;
    Element              top = root();
    if (selector.matches(top))
        out.push_back(top);
    walk_descendants(output_->root, [&](const GumboNode* node) {
        Element element(node);
        if (selector.matches(element))
            out.push_back(element);
    });
    return out;
}

std::vector<Element> HtmlDocument::select(const std::string& css) const {
    return select(Selector::parse(css));
}

std::vector<Element> HtmlDocument::select_within(const Element&  scope,
                                                 const Selector& selector) const {
    std::vector<Element> out;
    walk_descendants(scope.node(), [&](const GumboNode* node) {
        Element element(node);
        if (selector.matches(element))
            out.push_back(element);
    });
    return out;
}

std::string HtmlDocument::title() const {
    auto titles = select("title");
    return titles.empty() ? "" : titles.front().text();
}

}  // namespace Parsing
}  // namespace Vortex
