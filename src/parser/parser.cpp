#include "parser.hpp"
#include <algorithm>
#include <unordered_set>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Vortex {
namespace Parsing {

using Core::Logger;

namespace {

bool link_passes(const std::string& url, const RuleSet::Compiled& rule) {
    auto matches = [&](const std::regex& re) { return std::regex_search(url, re); };
    if (!rule.allow.empty() && std::none_of(rule.allow.begin(), rule.allow.end(), matches))
        return false;
    return std::none_of(rule.deny.begin(), rule.deny.end(), matches);
}

}  // namespace

std::vector<std::string> Parser::extract_links(const Page& page, const RuleSet::Compiled& rule) {
    std::vector<std::string> raw;
    if (rule.link_selector) {
        for (const auto& element : page.document().select(*rule.link_selector)) {
            auto value = element.attr(rule.rule.links.attribute);
            if (value)
                raw.push_back(Utils::Text::trim(*value));
        }
    }
    else if (rule.link_pattern) {
        const std::string& body  = page.body();
        auto               begin = std::sregex_iterator(body.begin(), body.end(), *rule.link_pattern);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            raw.push_back(m.size() > 1 && m[1].matched ? m[1].str() : m[0].str());
        }
    }

    std::vector<std::string> links;
    for (const auto& href : raw) {
        if (href.empty())
            continue;
        std::string absolute = Utils::Url::resolve(page.url(), href);
        if (absolute.empty())
            continue;
        absolute = Utils::Url::strip_fragment(absolute);
        if (!Utils::Url::is_http(absolute) || !link_passes(absolute, rule))
            continue;
        links.push_back(std::move(absolute));
    }
    return links;
}

ParseResult Parser::parse(const Core::Response& response, const RuleSet& rules) {
    ParseResult result;
    std::string url = response.url();

    std::vector<const RuleSet::Compiled*> matching;
    for (const auto& rule : rules.rules()) {
        if (std::regex_search(url, rule.url_pattern))
            matching.push_back(&rule);
    }
    if (matching.empty())
        return result;

    if (!Core::is_text_mime(response.content_type)) {
        result.failures.push_back({url, "", "Unsupported content type: " + response.content_type});
        return result;
    }
    if (!Utils::Text::is_valid_utf8(response.body)) {
        result.failures.push_back({url, "", "Body is not valid UTF-8"});
        return result;
    }

    Page                            page(response);
    std::unordered_set<std::string> emitted;

    for (const auto* rule : matching) {
        if (rule->follows()) {
            try {
                for (auto& link : extract_links(page, *rule)) {
                    if (!emitted.insert(Utils::Url::canonicalize(link)).second)
                        continue;

                    Core::Request next      = Core::Request::get(std::move(link), page.depth() + 1);
                    next.headers["Referer"] = url;
                    next.meta               = response.request.meta;
                    result.requests.push_back(std::move(next));
                }
            } catch (const std::exception& e) {
                result.failures.push_back({url, rule->rule.name, e.what()});
            }
        }

        if (rule->parses()) {
            try {
                Core::Record record = rule->rule.extractor->extract(page);
                if (record.empty())
                    continue;
                if (record.source_url().empty())
                    record.tag(url, Core::Record::Clock::now());
                result.records.push_back(std::move(record));
            } catch (const std::exception& e) {
                result.failures.push_back({url, rule->rule.name, e.what()});
            }
        }
    }

    for (const auto& failure : result.failures) {
        Logger::warn("Extraction failed for " + failure.url + " [" + failure.rule
                     + "]: " + failure.message);
    }
    return result;
}

}  // namespace Parsing
}  // namespace Vortex
