#include "rules.hpp"
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"

namespace Vortex {
namespace Parsing {

namespace {

std::regex compile_regex(const std::string& pattern, const std::string& what) {
    try {
        return std::regex(pattern);
    } catch (const std::regex_error& e) {
        throw Core::ConfigError("Invalid " + what + " '" + pattern + "': " + e.what());
    }
}

std::string first_group(const std::smatch& match) {
    return match.size() > 1 && match[1].matched ? match[1].str() : match[0].str();
}

}  // namespace

std::optional<Condition> parse_condition(const std::string& name) {
    std::string lower = Utils::Text::to_lower(name);
    if (lower == "follow")
        return Condition::Follow;
    if (lower == "parse")
        return Condition::Parse;
    if (lower == "both")
        return Condition::Both;
    return std::nullopt;
}

const char* to_string(Condition condition) {
    switch (condition) {
        case Condition::Follow: return "follow";
        case Condition::Parse: return "parse";
        case Condition::Both: return "both";
    }
    return "both";
}

Page::Page(const Core::Response& response)
    : response_(response), url_(response.url()), fetched_at_(Core::Record::Clock::now()) {
}

const HtmlDocument& Page::document() const {
    if (!document_)
        document_ = std::make_unique<HtmlDocument>(response_.body);
    return *document_;
}

Core::Record Page::new_record() const {
    return Core::Record(url_, fetched_at_);
}

FieldSpec FieldSpec::text(std::string name, std::string selector, bool multiple) {
    FieldSpec spec;
    spec.name     = std::move(name);
    spec.source   = Source::Text;
    spec.selector = std::move(selector);
    spec.multiple = multiple;
    return spec;
}

FieldSpec FieldSpec::attr(std::string name,
                          std::string selector,
                          std::string attribute,
                          bool        multiple) {
    FieldSpec spec;
    spec.name      = std::move(name);
    spec.source    = Source::Attribute;
    spec.selector  = std::move(selector);
    spec.attribute = std::move(attribute);
    spec.multiple  = multiple;
    return spec;
}

FieldSpec FieldSpec::regex(std::string name, std::string pattern, bool multiple) {
    FieldSpec spec;
    spec.name     = std::move(name);
    spec.source   = Source::Regex;
    spec.pattern  = std::move(pattern);
    spec.multiple = multiple;
    return spec;
}

FieldSpec FieldSpec::group(std::string name, std::string selector, std::vector<FieldSpec> children) {
    FieldSpec spec;
    spec.name     = std::move(name);
    spec.source   = Source::Group;
    spec.selector = std::move(selector);
    spec.children = std::move(children);
    return spec;
}

FieldExtractor::FieldExtractor(std::vector<FieldSpec> fields) {
    for (const auto& spec : fields)
        fields_.push_back(compile(spec));
}

FieldExtractor::CompiledField FieldExtractor::compile(const FieldSpec& spec) {
    if (spec.name.empty())
        throw Core::ConfigError("Field without a name");

    CompiledField out;
    out.spec = spec;

    if (!spec.selector.empty())
        out.selector = Selector::parse(spec.selector);

    switch (spec.source) {
        case FieldSpec::Source::Text:
        case FieldSpec::Source::Group:
            if (!out.selector)
                throw Core::ConfigError("Field '" + spec.name + "' needs a selector");
            break;
        case FieldSpec::Source::Attribute:
            if (!out.selector || spec.attribute.empty())
                throw Core::ConfigError("Field '" + spec.name + "' needs a selector and attribute");
            break;
        case FieldSpec::Source::Regex:
            if (spec.pattern.empty())
                throw Core::ConfigError("Field '" + spec.name + "' needs a pattern");
            out.pattern = compile_regex(spec.pattern, "field pattern");
            break;
    }

    for (const auto& child : spec.children)
        out.children.push_back(compile(child));
    return out;
}

void FieldExtractor::extract_into(const std::vector<CompiledField>& fields,
                                  const Page&                       page,
                                  const Element*                    scope,
                                  Core::Record&                     out) {
    const HtmlDocument& doc = page.document();

    for (const auto& field : fields) {
        const FieldSpec& spec = field.spec;

        std::vector<Element> elements;
        if (field.selector) {
            elements = scope ? doc.select_within(*scope, *field.selector)
                             : doc.select(*field.selector);
        }

        std::vector<std::string> values;
        switch (spec.source) {
            case FieldSpec::Source::Text:
                for (const auto& element : elements) {
                    std::string text = element.text();
                    if (!text.empty())
                        values.push_back(std::move(text));
                }
                break;

            case FieldSpec::Source::Attribute:
                for (const auto& element : elements) {
                    auto value = element.attr(spec.attribute);
                    if (value)
                        values.push_back(Utils::Text::trim(*value));
                }
                break;

            case FieldSpec::Source::Regex: {
                std::vector<std::string> haystacks;
                if (field.selector) {
                    for (const auto& element : elements)
                        haystacks.push_back(element.text());
                }
                else {
                    haystacks.push_back(scope ? scope->text() : page.body());
                }
                for (const auto& haystack : haystacks) {
                    auto begin =
                        std::sregex_iterator(haystack.begin(), haystack.end(), *field.pattern);
                    for (auto it = begin; it != std::sregex_iterator(); ++it)
                        values.push_back(first_group(*it));
                }
                break;
            }

            case FieldSpec::Source::Group:
                if (!elements.empty()) {
                    Core::Record nested = page.new_record();
                    extract_into(field.children, page, &elements.front(), nested);
                    if (!nested.empty())
                        out.set(spec.name, nested);
                }
                continue;
        }

        if (values.empty())
            continue;
        if (spec.multiple)
            out.set(spec.name, std::move(values));
        else
            out.set(spec.name, std::move(values.front()));
    }
}

Core::Record FieldExtractor::extract(const Page& page) const {
    Core::Record record = page.new_record();
    extract_into(fields_, page, nullptr, record);
    return record;
}

CallbackExtractor::CallbackExtractor(Callback callback) : callback_(std::move(callback)) {
    if (!callback_)
        throw Core::ConfigError("CallbackExtractor needs a callable");
}

Core::Record CallbackExtractor::extract(const Page& page) const {
    return callback_(page);
}

RuleSet::RuleSet(std::initializer_list<ParseRule> rules) {
    for (const auto& rule : rules)
        add(rule);
}

RuleSet& RuleSet::add(ParseRule rule) {
    Compiled compiled;
    compiled.url_pattern = compile_regex(rule.pattern, "rule pattern");

    if (rule.condition != Condition::Parse) {
        if (rule.links.kind == LinkSpec::Kind::Css) {
            compiled.link_selector =
                Selector::parse(rule.links.selector.empty() ? "a[href]" : rule.links.selector);
            if (rule.links.attribute.empty())
                rule.links.attribute = "href";
        }
        else {
            if (rule.links.pattern.empty())
                throw Core::ConfigError("Regex link extraction needs a pattern");
            compiled.link_pattern = compile_regex(rule.links.pattern, "link pattern");
        }
        for (const auto& allow : rule.links.allow)
            compiled.allow.push_back(compile_regex(allow, "allow pattern"));
        for (const auto& deny : rule.links.deny)
            compiled.deny.push_back(compile_regex(deny, "deny pattern"));
    }

    if (rule.condition != Condition::Follow && !rule.extractor)
        throw Core::ConfigError("Rule '" + rule.pattern + "' parses but has no extractor");

    if (rule.name.empty())
        rule.name = rule.pattern;
    compiled.rule = std::move(rule);
    rules_.push_back(std::move(compiled));
    return *this;
}

}  // namespace Parsing
}  // namespace Vortex
