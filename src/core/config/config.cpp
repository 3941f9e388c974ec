#include "config.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"
#include "../logger/logger.hpp"
#include "../types/errors.hpp"

namespace Vortex {
namespace Core {

namespace {

template <typename T>
void assign(const YAML::Node& yaml, const char* key, T& target) {
    if (yaml[key])
        target = yaml[key].as<T>();
}

void assign_list(const YAML::Node& yaml, const char* key, std::vector<std::string>& target) {
    const YAML::Node node = yaml[key];
    if (!node)
        return;
    target.clear();
    if (node.IsSequence()) {
        for (const auto& item : node)
            target.push_back(item.as<std::string>());
    }
    else {
        target.push_back(node.as<std::string>());
    }
}

FieldConfig parse_field(const YAML::Node& node) {
    FieldConfig field;
    assign(node, "name", field.name);
    assign(node, "source", field.source);
    assign(node, "selector", field.selector);
    assign(node, "css", field.selector);
    assign(node, "attribute", field.attribute);
    assign(node, "attr", field.attribute);
    assign(node, "pattern", field.pattern);
    assign(node, "regex", field.pattern);
    assign(node, "multiple", field.multiple);

    if (!node["source"]) {
        if (!field.pattern.empty())
            field.source = "regex";
        else if (!field.attribute.empty())
            field.source = "attr";
    }

    if (node["fields"] && node["fields"].IsSequence()) {
        field.source = "group";
        for (const auto& child : node["fields"])
            field.children.push_back(parse_field(child));
    }
    return field;
}

RuleConfig parse_rule(const YAML::Node& node) {
    RuleConfig rule;
    assign(node, "name", rule.name);
    assign(node, "pattern", rule.pattern);
    assign(node, "condition", rule.condition);

    const YAML::Node links = node["links"];
    if (links && links.IsMap()) {
        assign(links, "selector", rule.link_selector);
        assign(links, "attribute", rule.link_attribute);
        assign(links, "regex", rule.link_regex);
        assign_list(links, "allow", rule.allow);
        assign_list(links, "deny", rule.deny);
    }

    if (node["fields"] && node["fields"].IsSequence()) {
        for (const auto& field : node["fields"])
            rule.fields.push_back(parse_field(field));
    }
    return rule;
}

std::string strip_comment_and_trim(const std::string& raw) {
    std::string line = raw;
    size_t      hash = line.find('#');
    if (hash != std::string::npos)
        line = line.substr(0, hash);
    return Utils::Text::trim(line);
}

std::chrono::milliseconds ms(int value) {
    return std::chrono::milliseconds(value);
}

}  // namespace

void load_proxy_list(Config& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("Cannot open proxy list: " + path);

    std::string line;
    while (std::getline(file, line)) {
        line = strip_comment_and_trim(line);
        if (!line.empty())
            config.proxies.push_back(line);
    }
}

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);

        assign(yaml, "name", config.name);
        assign_list(yaml, "urls", config.urls);
        assign_list(yaml, "start_urls", config.urls);

        assign(yaml, "strategy", config.strategy);
        assign(yaml, "depth", config.depth);
        assign(yaml, "max_depth", config.depth);
        assign(yaml, "threads", config.threads);
        assign(yaml, "concurrency", config.concurrency);
        assign(yaml, "parser_threads", config.parser_threads);
        assign(yaml, "per_host_concurrency", config.per_host_concurrency);

        const YAML::Node throttle = yaml["autothrottle"];
        if (throttle && throttle.IsMap()) {
            assign(throttle, "enabled", config.autothrottle);
            assign(throttle, "start_delay_ms", config.throttle_start_ms);
            assign(throttle, "min_delay_ms", config.throttle_min_ms);
            assign(throttle, "max_delay_ms", config.throttle_max_ms);
            assign(throttle, "increase_step_ms", config.throttle_step_ms);
            assign(throttle, "decrease_factor", config.throttle_factor);
            assign(throttle, "target_latency_ms", config.target_latency_ms);
            assign(throttle, "target_error_rate", config.target_error_rate);
        }
        else if (throttle) {
            config.autothrottle = throttle.as<bool>();
        }

        assign(yaml, "retry_cap", config.retry_cap);
        assign(yaml, "retries", config.retry_cap);
        assign(yaml, "backoff_base_ms", config.backoff_base_ms);
        assign(yaml, "backoff_max_ms", config.backoff_max_ms);
        assign(yaml, "max_redirects", config.max_redirects);
        if (yaml["retry_http_codes"] && yaml["retry_http_codes"].IsSequence()) {
            config.retry_http_codes.clear();
            for (const auto& node : yaml["retry_http_codes"])
                config.retry_http_codes.push_back(node.as<long>());
        }

        if (yaml["proxies"] && yaml["proxies"].IsSequence()) {
            for (const auto& node : yaml["proxies"])
                config.proxies.push_back(node.as<std::string>());
        }
        if (yaml["proxy_list"])
            load_proxy_list(config, yaml["proxy_list"].as<std::string>());
        assign(yaml, "use_proxies", config.use_proxies);
        assign(yaml, "proxy_retries", config.proxy_retries);

        YAML::Node prio = yaml["proxy_priorities"] ? yaml["proxy_priorities"] : yaml["priorities"];
        if (prio && prio.IsMap()) {
            for (auto it = prio.begin(); it != prio.end(); ++it) {
                config.proxy_priorities[it->first.as<std::string>()] = it->second.as<int>();
            }
        }

        assign_list(yaml, "user_agent", config.user_agents);
        assign_list(yaml, "user_agents", config.user_agents);
        assign(yaml, "transport", config.transport);
        assign(yaml, "connect_timeout_ms", config.connect_timeout_ms);
        assign(yaml, "request_timeout_ms", config.request_timeout_ms);

        assign_list(yaml, "allowed_domains", config.allowed_domains);
        assign(yaml, "same_domain", config.same_domain);
        assign_list(yaml, "deny", config.deny_patterns);
        assign_list(yaml, "deny_patterns", config.deny_patterns);
        assign(yaml, "robots_crawl_delay", config.robots_crawl_delay);

        assign(yaml, "drain_timeout_ms", config.drain_timeout_ms);
        assign(yaml, "stats_interval_ms", config.stats_interval_ms);
        assign(yaml, "log_level", config.log_level);

        assign(yaml, "output", config.output_dir);
        assign(yaml, "output_dir", config.output_dir);
        assign(yaml, "tree_structure", config.tree_structure);
        assign(yaml, "jsonl", config.jsonl_path);
        assign(yaml, "print", config.print_records);

        if (yaml["rules"] && yaml["rules"].IsSequence()) {
            config.rules.clear();
            for (const auto& node : yaml["rules"])
                config.rules.push_back(parse_rule(node));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Vortex - Adaptive Web Crawl Engine"};

    std::string proxy_list_path;
    std::string single_proxy;

    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("--name", config.name, "Crawl name used in logs");
    app.add_option("-s,--strategy", config.strategy, "Ordering: bfo, dfo, fifo, feedback");
    app.add_option("-d,--depth", config.depth, "Maximum crawl depth (negative: unlimited)");
    app.add_option("-t,--threads", config.threads, "Number of I/O threads");
    app.add_option("-c,--concurrency", config.concurrency, "Concurrent fetches");
    app.add_option("--parser-threads", config.parser_threads, "Threads for parsing");
    app.add_option("--per-host", config.per_host_concurrency, "Concurrent fetches per host");

    app.add_flag(
        "--no-autothrottle",
        [&](size_t count) {
            if (count > 0)
                config.autothrottle = false;
        },
        "Disable adaptive per-host delays");
    app.add_option("--throttle-min", config.throttle_min_ms, "Minimum per-host delay (ms)");
    app.add_option("--throttle-max", config.throttle_max_ms, "Maximum per-host delay (ms)");
    app.add_option("--target-latency", config.target_latency_ms, "Latency considered slow (ms)");

    app.add_option("-r,--retries", config.retry_cap, "Retries after the first attempt");
    app.add_option("--backoff-base", config.backoff_base_ms, "Retry backoff base (ms)");
    app.add_option("--backoff-max", config.backoff_max_ms, "Retry backoff cap (ms)");
    app.add_option("--max-redirects", config.max_redirects, "Redirect hops per request");
    app.add_option("--retry-http-codes", config.retry_http_codes, "Extra retryable HTTP codes");

    app.add_option("-p,--proxy", single_proxy, "Single proxy URL");
    app.add_option("--proxy-list", proxy_list_path, "File containing list of proxies");
    app.add_option("--proxy-retries", config.proxy_retries, "Max failures before removing a proxy");
    app.add_flag("--use-proxies", config.use_proxies, "Route requests through the proxy pool");

    app.add_option("-u,--user-agent", config.user_agents, "User-Agent (repeat to rotate)");
    app.add_option("--transport", config.transport, "HTTP transport: beast or curl");
    app.add_option("--connect-timeout", config.connect_timeout_ms, "Connect timeout (ms)");
    app.add_option("--request-timeout", config.request_timeout_ms, "Request timeout (ms)");

    app.add_option("--allow-domain", config.allowed_domains, "Allowed domain (repeatable)");
    app.add_flag("--same-domain", config.same_domain, "Stay on the start URLs' domains");
    app.add_option("--deny", config.deny_patterns, "URL regex to refuse (repeatable)");
    app.add_flag("--robots-delay", config.robots_crawl_delay, "Honour robots.txt Crawl-delay");

    app.add_option("--drain-timeout", config.drain_timeout_ms, "Grace period on stop (ms)");
    app.add_option("--stats-interval", config.stats_interval_ms, "Progress log interval (ms)");
    app.add_option("-l,--log-level", config.log_level, "none, error, warn, info, debug");

    app.add_option("-o,--output", config.output_dir, "Write one JSON file per record here");
    app.add_flag(
        "--flat",
        [&](size_t count) {
            if (count > 0)
                config.tree_structure = false;
        },
        "Use flat output structure");
    app.add_option("--jsonl", config.jsonl_path, "Append records as JSON lines");
    app.add_flag("--print", config.print_records, "Print records to the log");

    app.add_option("--follow", config.follow_patterns, "Link regex to follow (repeatable)");
    app.add_option("--deny-link", config.deny_links, "Link regex to skip (repeatable)");
    app.add_option("--field", config.field_specs, "Field as name=selector[@attr]");
    app.add_option("--rule-pattern", config.rule_pattern, "Response URL regex for CLI rule");

    app.add_option("urls", config.urls, "URLs to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!single_proxy.empty())
        config.proxies.push_back(single_proxy);
    if (!proxy_list_path.empty())
        load_proxy_list(config, proxy_list_path);

    return config;
}

Engine::CrawlerConfig Config::to_crawler_config() const {
    Engine::CrawlerConfig out;

    auto strategy_value = Scheduling::parse_strategy(strategy);
    if (!strategy_value)
        throw ConfigError("Unknown strategy: " + strategy);
    out.strategy = *strategy_value;

    auto transport_value = Engine::parse_transport(transport);
    if (!transport_value)
        throw ConfigError("Unknown transport: " + transport);
    out.transport = *transport_value;

    try {
        out.log_level = Logger::parse_level(Utils::Text::to_lower(log_level));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    out.threads              = threads;
    out.concurrency          = concurrency;
    out.parser_threads       = parser_threads;
    out.per_host_concurrency = per_host_concurrency;
    out.max_depth            = depth;

    out.throttle.enabled           = autothrottle;
    out.throttle.start_delay       = ms(throttle_start_ms);
    out.throttle.min_delay         = ms(throttle_min_ms);
    out.throttle.max_delay         = ms(throttle_max_ms);
    out.throttle.increase_step     = ms(throttle_step_ms);
    out.throttle.decrease_factor   = throttle_factor;
    out.throttle.target_latency    = ms(target_latency_ms);
    out.throttle.target_error_rate = target_error_rate;

    out.retry_cap        = retry_cap;
    out.backoff_base     = ms(backoff_base_ms);
    out.backoff_max      = ms(backoff_max_ms);
    out.max_redirects    = max_redirects;
    out.retry_http_codes = retry_http_codes;

    out.use_proxies      = use_proxies;
    out.proxies          = proxies;
    out.proxy_retries    = proxy_retries;
    out.proxy_priorities = proxy_priorities;

    out.user_agents     = user_agents;
    out.connect_timeout = ms(connect_timeout_ms);
    out.request_timeout = ms(request_timeout_ms);

    out.allowed_domains = allowed_domains;
    if (same_domain) {
        for (const auto& url : urls) {
            std::string host = Utils::Url::parse(url).host;
            if (!host.empty())
                out.allowed_domains.push_back(Utils::Text::to_lower(host));
        }
    }
    out.deny_patterns      = deny_patterns;
    out.robots_crawl_delay = robots_crawl_delay;

    out.drain_timeout  = ms(drain_timeout_ms);
    out.stats_interval = ms(stats_interval_ms);

    out.validate();
    return out;
}

}  // namespace Core
}  // namespace Vortex
