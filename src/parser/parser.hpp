#pragma once
#include <string>
#include <vector>

#include "../core/types/record.hpp"
#include "../core/types/request.hpp"
#include "../core/types/response.hpp"
#include "rules.hpp"

namespace Vortex {
namespace Parsing {

struct ExtractionFailure {
    std::string url;
    std::string rule;
    std::string message;
};

struct ParseResult {
    std::vector<Core::Request>     requests;
    std::vector<Core::Record>      records;
    std::vector<ExtractionFailure> failures;
};

/**
 * @brief Applies a rule set to one successful response.
 *
 * Rules whose pattern matches the response URL run in order. Follow rules
 * emit each distinct absolute http(s) link once, at depth + 1 with a Referer
 * header. Parse rules emit a record unless the extractor found nothing. A
 * rule that throws is reported as an ExtractionFailure and the remaining
 * rules still run. Bodies that are not text or not valid UTF-8 produce an
 * empty result with a single failure.
 */
class Parser {
public:
    static ParseResult parse(const Core::Response& response, const RuleSet& rules);

    static std::vector<std::string> extract_links(const Page& page, const RuleSet::Compiled& rule);
};

}  // namespace Parsing
}  // namespace Vortex
