#pragma once
#include <string>
#include <vector>

#include "../core/types/request.hpp"
#include "../parser/rules.hpp"

namespace Vortex {
namespace Core {
struct Config;
struct RuleConfig;
struct FieldConfig;
}  // namespace Core

namespace Spider {

/**
 * @brief What to crawl: seed requests plus the rules applied to responses.
 */
struct Spider {
    std::string                name = "vortex";
    std::vector<Core::Request> start_requests;
    Parsing::RuleSet           rules;

    // Throws Core::ConfigError on an empty seed set or a non-HTTP seed URL.
    void validate() const;

    // Rules come from the YAML `rules` list when present, otherwise from the
    // --follow / --deny-link / --field command line shorthands.
    static Spider from_config(const Core::Config& config);

    static Parsing::ParseRule build_rule(const Core::RuleConfig& rule);
    static Parsing::FieldSpec build_field(const Core::FieldConfig& field);
    static Core::FieldConfig  parse_field_flag(const std::string& flag);
};

}  // namespace Spider
}  // namespace Vortex
