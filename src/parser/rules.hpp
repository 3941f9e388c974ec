#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "../core/types/record.hpp"
#include "../core/types/response.hpp"
#include "html_document.hpp"
#include "selector.hpp"

namespace Vortex {
namespace Parsing {

enum class Condition { Follow, Parse, Both };

std::optional<Condition> parse_condition(const std::string& name);
const char*              to_string(Condition condition);

/**
 * @brief A fetched response as seen by extractors.
 *
 * The HTML tree is built on first use and shared by every rule that runs
 * against the same response.
 */
class Page {
public:
    explicit Page(const Core::Response& response);

    const Core::Response& response() const {
        return response_;
    }
    const std::string& url() const {
        return url_;
    }
    const std::string& body() const {
        return response_.body;
    }
    unsigned depth() const {
        return response_.request.depth;
    }

    const HtmlDocument& document() const;

    // Empty record attributed to this page.
    Core::Record new_record() const;

private:
    const Core::Response&                 response_;
    std::string                           url_;
    Core::Record::Clock::time_point       fetched_at_;
    mutable std::unique_ptr<HtmlDocument> document_;
};

class Extractor {
public:
    virtual ~Extractor() = default;

    // An empty record means nothing was found; throwing reports an extraction failure.
    virtual Core::Record extract(const Page& page) const = 0;
};

struct FieldSpec {
    enum class Source { Text, Attribute, Regex, Group };

    std::string name;
    Source      source = Source::Text;
    std::string selector;   // scope for Text/Attribute/Group; optional for Regex
    std::string attribute;  // Attribute
    std::string pattern;    // Regex: first capture group, or whole match
    bool        multiple = false;

    std::vector<FieldSpec> children;  // Group

    static FieldSpec text(std::string name, std::string selector, bool multiple = false);
    static FieldSpec attr(std::string name,
                          std::string selector,
                          std::string attribute,
                          bool        multiple = false);
    static FieldSpec regex(std::string name, std::string pattern, bool multiple = false);
    static FieldSpec group(std::string name, std::string selector, std::vector<FieldSpec> children);
};

/**
 * @brief Declarative field extraction.
 *
 * Single-valued fields take the first match; list fields take every match in
 * document order. Fields that match nothing are left out. A group selects its
 * first matching element and extracts its children relative to it into a
 * nested record. Selectors and patterns are compiled up front and a bad one
 * raises Core::ConfigError.
 */
class FieldExtractor : public Extractor {
public:
    explicit FieldExtractor(std::vector<FieldSpec> fields);

    Core::Record extract(const Page& page) const override;

private:
    struct CompiledField {
        FieldSpec                  spec;
        std::optional<Selector>    selector;
        std::optional<std::regex>  pattern;
        std::vector<CompiledField> children;
    };

    static CompiledField compile(const FieldSpec& spec);
    static void          extract_into(const std::vector<CompiledField>& fields,
                                      const Page&                       page,
                                      const Element*                    scope,
                                      Core::Record&                     out);

    std::vector<CompiledField> fields_;
};

class CallbackExtractor : public Extractor {
public:
    using Callback = std::function<Core::Record(const Page&)>;

    explicit CallbackExtractor(Callback callback);

    Core::Record extract(const Page& page) const override;

private:
    Callback callback_;
};

struct LinkSpec {
    enum class Kind { Css, Regex };

    Kind        kind      = Kind::Css;
    std::string selector  = "a[href]";
    std::string attribute = "href";
    std::string pattern;  // Regex: first capture group, or whole match

    std::vector<std::string> allow;  // empty: everything
    std::vector<std::string> deny;
};

struct ParseRule {
    std::string                      pattern;  // matched against the response URL
    Condition                        condition = Condition::Both;
    LinkSpec                         links;
    std::shared_ptr<const Extractor> extractor;
    std::string                      name;
};

/**
 * @brief Validated, ordered rule list.
 *
 * add() compiles every regex and selector of a rule; invalid input raises
 * Core::ConfigError, as does a Parse rule without an extractor.
 */
class RuleSet {
public:
    struct Compiled {
        ParseRule                 rule;
        std::regex                url_pattern;
        std::optional<Selector>   link_selector;
        std::optional<std::regex> link_pattern;
        std::vector<std::regex>   allow;
        std::vector<std::regex>   deny;

        bool follows() const {
            return rule.condition != Condition::Parse;
        }
        bool parses() const {
            return rule.condition != Condition::Follow;
        }
    };

    RuleSet() = default;
    RuleSet(std::initializer_list<ParseRule> rules);

    RuleSet& add(ParseRule rule);

    const std::vector<Compiled>& rules() const {
        return rules_;
    }
    bool empty() const {
        return rules_.empty();
    }
    size_t size() const {
        return rules_.size();
    }

private:
    std::vector<Compiled> rules_;
};

}  // namespace Parsing
}  // namespace Vortex
