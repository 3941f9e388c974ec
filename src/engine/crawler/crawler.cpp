#include "crawler.hpp"
#include <algorithm>
#include <stdexcept>

#include "../../core/logger/logger.hpp"
#include "../../core/types/constants.hpp"
#include "../../downloader/middleware.hpp"
#include "../../network/http/beast_client.hpp"
#include "../../network/http/curl_client.hpp"

namespace Vortex {
namespace Engine {

using namespace Vortex::Core;

Crawler::Crawler(CrawlerConfig                              config,
                 std::shared_ptr<Pipeline::Pipeline>        pipeline,
                 std::shared_ptr<Network::Http::HttpClient> client)
    : config_(std::move(config)),
      pipeline_(pipeline ? std::move(pipeline) : std::make_shared<Pipeline::Pipeline>()),
      worker_pool_(static_cast<size_t>(std::max(1, config_.parser_threads))),
      client_(std::move(client)) {
    config_.validate();
    Logger::set_level(config_.log_level);
    init_components();
}

void Crawler::init_components() {
    throttle_ = std::make_shared<Download::AutoThrottle>(config_.throttle);

    Scheduling::SchedulerConfig scheduler_config;
    scheduler_config.strategy             = config_.strategy;
    scheduler_config.max_depth            = config_.max_depth;
    scheduler_config.per_host_concurrency = config_.per_host_concurrency;
    scheduler_config.allowed_domains      = config_.allowed_domains;
    scheduler_config.deny_patterns        = config_.deny_patterns;
    scheduler_config.slow_threshold       = config_.throttle.target_latency;
    scheduler_ = std::make_shared<Scheduling::Scheduler>(scheduler_config, throttle_);

    if (!config_.proxies.empty()) {
        proxy_pool_ = std::make_shared<Proxy::Pool::ProxyPool>(
            config_.proxies, config_.proxy_retries, config_.proxy_priorities);
        Logger::info("Initialized Proxy Pool with " + std::to_string(proxy_pool_->size())
                     + " proxies.");
    }

    if (!client_)
        client_ = create_client();
    client_->set_connect_timeout(config_.connect_timeout);
    client_->set_request_timeout(config_.request_timeout);

    Download::MiddlewareChain::Options options;
    options.user_agents = config_.user_agents;
    options.proxy_pool  = proxy_pool_;
    options.use_proxies = config_.use_proxies;
    options.throttle    = throttle_;

    Download::DownloaderConfig downloader_config;
    downloader_config.retry_cap          = config_.retry_cap;
    downloader_config.backoff_base       = config_.backoff_base;
    downloader_config.backoff_max        = config_.backoff_max;
    downloader_config.max_redirects      = config_.max_redirects;
    downloader_config.retry_http_codes   = config_.retry_http_codes;
    downloader_config.robots_crawl_delay = config_.robots_crawl_delay;
    if (!config_.user_agents.empty())
        downloader_config.robots_user_agent = config_.user_agents.front();

    downloader_ = std::make_unique<Download::Downloader>(
        downloader_config, client_, Download::MiddlewareChain::standard(options), throttle_);
}

std::shared_ptr<Network::Http::HttpClient> Crawler::create_client() const {
    if (config_.transport == Transport::Curl)
        return std::make_shared<Network::Http::CurlClient>(
            static_cast<size_t>(config_.concurrency));
    return std::make_shared<Network::Http::BeastClient>();
}

CrawlSummary Crawler::run(const Spider::Spider& spider) {
    if (state_ != CrawlState::Idle)
        throw std::logic_error("Crawler has already run");
    spider.validate();

    CrawlState expected = CrawlState::Idle;
    if (!state_.compare_exchange_strong(expected, CrawlState::Running))
        throw std::logic_error("Crawler has already run");
    rules_   = &spider.rules;
    started_ = std::chrono::steady_clock::now();

    size_t admitted = scheduler_->admit_all(spider.start_requests);
    Logger::info("Crawler: Starting " + spider.name + " with " + std::to_string(admitted)
                 + " start URLs (" + Scheduling::to_string(config_.strategy) + ")");

    init_io_services();
    if (config_.handle_signals)
        init_signals();
    spawn_workers();
    Logger::info("Crawler: Workers spawned, awaiting completion...");
    await_completion();
    shutdown();

    scheduler_->close();
    pipeline_->close();
    elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    state_ = CrawlState::Stopped;

    CrawlSummary result = summary();
    Logger::success("Crawl finished: " + std::to_string(result.dispatched) + " dispatched, "
                    + std::to_string(result.records) + " records in "
                    + std::to_string(result.elapsed.count()) + " ms");
    return result;
}

void Crawler::stop() {
    stop(config_.drain_timeout);
}

CrawlSummary Crawler::summary() const {
    CrawlSummary result = stats_.snapshot();

    auto downloader = downloader_->stats();
    result.retries   = downloader.retries;
    result.redirects = downloader.redirects;

    auto scheduler        = scheduler_->stats();
    result.duplicates     = scheduler.duplicates;
    result.depth_exceeded = scheduler.depth_exceeded;
    result.filtered       = scheduler.filtered;
    result.forced         = scheduler.forced;

    result.sink_failures = pipeline_->stats().sink_failures;
    result.final_state   = state_;
    result.elapsed       = state_ == CrawlState::Stopped || state_ == CrawlState::Idle
                               ? elapsed_
                               : std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - started_);
    return result;
}

}  // namespace Engine
}  // namespace Vortex
