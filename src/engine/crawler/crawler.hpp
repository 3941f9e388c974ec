#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "../../core/types/request.hpp"
#include "../../core/types/response.hpp"
#include "../../downloader/autothrottle.hpp"
#include "../../downloader/downloader.hpp"
#include "../../network/http/http_client.hpp"
#include "../../parser/rules.hpp"
#include "../../pipeline/pipeline.hpp"
#include "../../proxy/pool/proxy_pool.hpp"
#include "../../scheduler/scheduler.hpp"
#include "../../spider/spider.hpp"
#include "../stats/stats.hpp"
#include "crawler_config.hpp"

namespace Vortex {
namespace Engine {

/**
 * @brief Drives the Scheduler -> Downloader -> Parser loop for one spider.
 *
 * run() blocks the calling thread until the crawl reaches Stopped, either by
 * quiescence (empty frontier, nothing in flight, no parse task pending), by
 * stop(), by cancel() or by a critical sink failure. A Crawler runs once.
 *
 * Every dispatched request is reported to the Scheduler exactly once. When
 * a drain times out or the crawl is cancelled, requests still in flight are
 * reported as Timeout and their late completions are dropped.
 *
 * The constructor applies config.log_level to the process-wide Logger, so
 * the last Crawler constructed sets the level for all of them.
 */
class Crawler {
#ifndef CPPCHECK
    friend class CrawlerTest_LateCompletionAfterForceReportIsDropped_Test;
    friend class CrawlerTest_DiscoveryChainNeverStopsEarly_Test;
#endif

public:
    explicit Crawler(CrawlerConfig                              config,
                     std::shared_ptr<Pipeline::Pipeline>        pipeline = nullptr,
                     std::shared_ptr<Network::Http::HttpClient> client   = nullptr);
    ~Crawler();

    Crawler(const Crawler&)            = delete;
    Crawler& operator=(const Crawler&) = delete;

    CrawlSummary run(const Spider::Spider& spider);

    // Running -> Draining; in-flight fetches get `grace` to finish.
    void stop(std::chrono::milliseconds grace);
    void stop();

    // Running or Draining -> Cancelling; in-flight fetches are abandoned.
    void cancel();

    CrawlState state() const {
        return state_;
    }
    CrawlSummary         summary() const;
    const CrawlerConfig& config() const {
        return config_;
    }

#ifdef CPPCHECK
public:
#else
private:
#endif
    void init_components();
    void init_io_services();
    void init_signals();
    void spawn_workers();
    void await_completion();
    void trigger_done();
    void shutdown();

    std::shared_ptr<Network::Http::HttpClient> create_client() const;

    boost::asio::awaitable<void> worker_loop();
    boost::asio::awaitable<void> process_request(Core::Request request);
    boost::asio::awaitable<void> drain(std::chrono::milliseconds grace);
    boost::asio::awaitable<void> report_progress();

    bool     is_quiescent() const;
    uint64_t register_in_flight(const Core::Request& request);
    size_t   in_flight_count() const;
    void     complete(uint64_t id, Download::Outcome outcome);
    void     abandon_in_flight(const std::string& reason);
    void     record_status(Core::FetchStatus status);
    void     schedule_parse(Core::Response response);
    void     deliver_records(std::vector<Core::Record>& records);

    CrawlerConfig                       config_;
    std::shared_ptr<Pipeline::Pipeline> pipeline_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::thread_pool worker_pool_;
    boost::asio::signal_set  signals_{ioc_};

    std::shared_ptr<Download::AutoThrottle>    throttle_;
    std::shared_ptr<Scheduling::Scheduler>     scheduler_;
    std::shared_ptr<Proxy::Pool::ProxyPool>    proxy_pool_;
    std::shared_ptr<Network::Http::HttpClient> client_;
    std::unique_ptr<Download::Downloader>      downloader_;
    const Parsing::RuleSet*                    rules_ = nullptr;

    std::atomic<CrawlState> state_{CrawlState::Idle};
    std::atomic<bool>       done_{false};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;
    std::atomic<bool>       is_shutdown_{false};

    mutable std::mutex                in_flight_mutex_;
    std::map<uint64_t, Core::Request> in_flight_;
    uint64_t                          next_id_ = 0;

    CrawlStats                            stats_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::milliseconds             elapsed_{0};
};

}  // namespace Engine
}  // namespace Vortex
