#pragma once
#include <map>
#include <string>
#include <vector>

#include "../../engine/crawler/crawler_config.hpp"
#include "../types/constants.hpp"

namespace Vortex {
namespace Core {

// Declarative field of a rule, as written in YAML or on the command line.
struct FieldConfig {
    std::string              name;
    std::string              source = "text";  // text | attr | regex | group
    std::string              selector;
    std::string              attribute;
    std::string              pattern;
    bool                     multiple = false;
    std::vector<FieldConfig> children;
};

struct RuleConfig {
    std::string              name;
    std::string              pattern   = ".*";
    std::string              condition = "both";  // follow | parse | both
    std::string              link_selector  = "a[href]";
    std::string              link_attribute = "href";
    std::string              link_regex;
    std::vector<std::string> allow;
    std::vector<std::string> deny;
    std::vector<FieldConfig> fields;
};

struct Config {
    std::vector<std::string> urls;
    std::string              config_path;
    std::string              name = "vortex";

    std::string strategy             = "bfo";
    int         depth                = Constants::DEFAULT_DEPTH;
    int         threads              = Constants::DEFAULT_THREADS;
    int         concurrency          = Constants::DEFAULT_CONCURRENCY;
    int         parser_threads       = Constants::DEFAULT_PARSER_THREADS;
    int         per_host_concurrency = Constants::DEFAULT_PER_HOST_CONCURRENCY;

    bool   autothrottle        = true;
    int    throttle_start_ms   = Constants::THROTTLE_START_DELAY_MS;
    int    throttle_min_ms     = Constants::THROTTLE_MIN_DELAY_MS;
    int    throttle_max_ms     = Constants::THROTTLE_MAX_DELAY_MS;
    int    throttle_step_ms    = Constants::THROTTLE_INCREASE_STEP_MS;
    double throttle_factor     = Constants::THROTTLE_DECREASE_FACTOR;
    int    target_latency_ms   = Constants::THROTTLE_TARGET_LATENCY_MS;
    double target_error_rate   = Constants::THROTTLE_TARGET_ERROR_RATE;

    int               retry_cap       = Constants::DEFAULT_RETRY_CAP;
    int               backoff_base_ms = Constants::DEFAULT_BACKOFF_BASE_MS;
    int               backoff_max_ms  = Constants::DEFAULT_BACKOFF_MAX_MS;
    int               max_redirects   = Constants::DEFAULT_MAX_REDIRECTS;
    std::vector<long> retry_http_codes;

    std::vector<std::string>   proxies;
    bool                       use_proxies = false;
    std::map<std::string, int> proxy_priorities = {{"http", 0}, {"socks4", 1}, {"socks5", 2}};
    int                        proxy_retries    = Constants::DEFAULT_PROXY_RETRIES;

    std::vector<std::string> user_agents;
    std::string              transport          = "beast";
    int                      connect_timeout_ms = Constants::CONNECT_TIMEOUT_MS;
    int                      request_timeout_ms = Constants::REQUEST_TIMEOUT_SECONDS * 1000;

    std::vector<std::string> allowed_domains;
    bool                     same_domain = false;
    std::vector<std::string> deny_patterns;
    bool                     robots_crawl_delay = false;

    int         drain_timeout_ms  = Constants::DEFAULT_DRAIN_TIMEOUT_MS;
    int         stats_interval_ms = Constants::DEFAULT_STATS_INTERVAL_MS;
    std::string log_level         = "info";

    std::string output_dir;
    bool        tree_structure = true;
    std::string jsonl_path;
    bool        print_records = false;

    std::vector<RuleConfig> rules;

    // CLI shorthands for a single catch-all rule, used when no YAML rules exist.
    std::vector<std::string> follow_patterns;
    std::vector<std::string> deny_links;
    std::vector<std::string> field_specs;  // name=selector[@attr]
    std::string              rule_pattern = ".*";

    static Config parse(int argc, char* argv[]);

    // Throws ConfigError when an option cannot be mapped.
    Engine::CrawlerConfig to_crawler_config() const;
};

void load_yaml(Config& config, const std::string& path);
void load_proxy_list(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Vortex
