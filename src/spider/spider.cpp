#include "spider.hpp"
#include "../core/config/config.hpp"
#include "../core/logger/logger.hpp"
#include "../core/types/errors.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Vortex {
namespace Spider {

void Spider::validate() const {
    if (start_requests.empty())
        throw Core::ConfigError("No start URLs given");

    for (const auto& request : start_requests) {
        if (!Utils::Url::is_http(request.url))
            throw Core::ConfigError("Invalid start URL: " + request.url);
    }
}

Parsing::FieldSpec Spider::build_field(const Core::FieldConfig& field) {
    if (field.name.empty())
        throw Core::ConfigError("Field without a name");

    std::string source = Utils::Text::to_lower(field.source);
    if (source == "text")
        return Parsing::FieldSpec::text(field.name, field.selector, field.multiple);
    if (source == "attr" || source == "attribute")
        return Parsing::FieldSpec::attr(
            field.name, field.selector, field.attribute, field.multiple);
    if (source == "regex") {
        auto spec     = Parsing::FieldSpec::regex(field.name, field.pattern, field.multiple);
        spec.selector = field.selector;
        return spec;
    }
    if (source == "group") {
        std::vector<Parsing::FieldSpec> children;
        for (const auto& child : field.children)
            children.push_back(build_field(child));
        return Parsing::FieldSpec::group(field.name, field.selector, std::move(children));
    }
    throw Core::ConfigError("Unknown field source '" + field.source + "' for " + field.name);
}

Parsing::ParseRule Spider::build_rule(const Core::RuleConfig& config) {
    Parsing::ParseRule rule;
    rule.name    = config.name;
    rule.pattern = config.pattern;

    auto condition = Parsing::parse_condition(config.condition);
    if (!condition)
        throw Core::ConfigError("Unknown rule condition: " + config.condition);
    rule.condition = *condition;

    if (!config.link_regex.empty()) {
        rule.links.kind    = Parsing::LinkSpec::Kind::Regex;
        rule.links.pattern = config.link_regex;
    }
    else {
        rule.links.selector  = config.link_selector;
        rule.links.attribute = config.link_attribute;
    }
    rule.links.allow = config.allow;
    rule.links.deny  = config.deny;

    if (!config.fields.empty()) {
        std::vector<Parsing::FieldSpec> fields;
        for (const auto& field : config.fields)
            fields.push_back(build_field(field));
        rule.extractor = std::make_shared<Parsing::FieldExtractor>(std::move(fields));
    }
    else if (rule.condition == Parsing::Condition::Both) {
        rule.condition = Parsing::Condition::Follow;
    }
    return rule;
}

// name=selector, name=selector@attr, name=re:pattern; a trailing [] makes a list.
Core::FieldConfig Spider::parse_field_flag(const std::string& flag) {
    size_t eq = flag.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= flag.size())
        throw Core::ConfigError("Invalid --field '" + flag + "', expected name=selector[@attr]");

    Core::FieldConfig field;
    field.name       = Utils::Text::trim(flag.substr(0, eq));
    std::string rest = Utils::Text::trim(flag.substr(eq + 1));

    if (Utils::Text::ends_with(field.name, "[]")) {
        field.multiple = true;
        field.name     = field.name.substr(0, field.name.size() - 2);
    }

    if (Utils::Text::starts_with(rest, "re:")) {
        field.source  = "regex";
        field.pattern = rest.substr(3);
        return field;
    }

    size_t at = rest.rfind('@');
    if (at != std::string::npos && at > 0) {
        field.source    = "attr";
        field.selector  = rest.substr(0, at);
        field.attribute = rest.substr(at + 1);
    }
    else {
        field.selector = rest;
    }
    return field;
}

Spider Spider::from_config(const Core::Config& config) {
    Spider spider;
    spider.name           = config.name;
    spider.start_requests = Core::Request::from_strings(config.urls);

    if (!config.rules.empty()) {
        for (const auto& rule : config.rules)
            spider.rules.add(build_rule(rule));
    }
    else {
        Core::RuleConfig rule;
        rule.name    = "cli";
        rule.pattern = config.rule_pattern;
        rule.allow   = config.follow_patterns;
        rule.deny    = config.deny_links;
        for (const auto& flag : config.field_specs)
            rule.fields.push_back(parse_field_flag(flag));
        spider.rules.add(build_rule(rule));
    }

    Core::Logger::debug("Spider " + spider.name + ": "
                        + std::to_string(spider.start_requests.size()) + " start URLs, "
                        + std::to_string(spider.rules.size()) + " rules");
    return spider;
}

}  // namespace Spider
}  // namespace Vortex
