#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Vortex {
namespace Engine {

using namespace Vortex::Core;
namespace net = boost::asio;

namespace {
constexpr int DRAIN_POLL_INTERVAL_MS = 50;
}  // namespace

Crawler::~Crawler() {
    shutdown();
}

void Crawler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        ioc_.get_executor());
    for (int i = 0; i < config_.threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
    Logger::info("Started " + std::to_string(config_.threads) + " IO threads.");
    Logger::info("Concurrency: " + std::to_string(config_.concurrency) + " fetches, "
                 + std::to_string(config_.parser_threads) + " parser threads.");
}

void Crawler::init_signals() {
    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::info("Signal " + std::to_string(signal_number)
                         + " received. Draining...");
            stop();
        }
    });
}

void Crawler::spawn_workers() {
    for (int i = 0; i < config_.concurrency; ++i) {
        net::co_spawn(ioc_, worker_loop(), net::detached);
    }
    if (config_.stats_interval.count() > 0)
        net::co_spawn(ioc_, report_progress(), net::detached);
}

void Crawler::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Crawler::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void Crawler::stop(std::chrono::milliseconds grace) {
    CrawlState expected = CrawlState::Running;
    if (!state_.compare_exchange_strong(expected, CrawlState::Draining))
        return;

    Logger::info("Crawler: Draining " + std::to_string(in_flight_count())
                 + " in-flight requests (grace " + std::to_string(grace.count()) + "ms)");
    scheduler_->close();
    net::co_spawn(ioc_, drain(grace), net::detached);
}

void Crawler::cancel() {
    CrawlState current = state_;
    while (current == CrawlState::Running || current == CrawlState::Draining) {
        if (state_.compare_exchange_weak(current, CrawlState::Cancelling))
            break;
    }
    if (current != CrawlState::Running && current != CrawlState::Draining)
        return;

    Logger::warn("Crawler: Cancelling");
    scheduler_->close();
    downloader_->cancel();
    abandon_in_flight("Cancelled");
    trigger_done();
}

net::awaitable<void> Crawler::drain(std::chrono::milliseconds grace) {
    auto              deadline = std::chrono::steady_clock::now() + grace;
    net::steady_timer timer(ioc_);

    while (state_ == CrawlState::Draining) {
        if (in_flight_count() == 0 && scheduler_->pending_tasks() == 0) {
            Logger::info("Crawler: Drained");
            trigger_done();
            co_return;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            downloader_->cancel();
            abandon_in_flight("Drain timeout");
            trigger_done();
            co_return;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        timer.expires_after(
            std::min(remaining, std::chrono::milliseconds(DRAIN_POLL_INTERVAL_MS)));
        boost::system::error_code ec;
        co_await                  timer.async_wait(
            net::redirect_error(net::use_awaitable, ec));
    }
}

net::awaitable<void> Crawler::report_progress() {
    net::steady_timer timer(ioc_);
    while (state_ == CrawlState::Running || state_ == CrawlState::Draining) {
        timer.expires_after(config_.stats_interval);
        boost::system::error_code ec;
        co_await                  timer.async_wait(
            net::redirect_error(net::use_awaitable, ec));
        if (ec || done_)
            co_return;

        auto current   = summary();
        auto scheduler = scheduler_->stats();
        Logger::info("Stats: " + std::to_string(current.dispatched) + " dispatched, "
                     + std::to_string(current.ok) + " ok, "
                     + std::to_string(current.records) + " records, "
                     + std::to_string(scheduler.frontier_size) + " queued, "
                     + std::to_string(scheduler.in_flight) + " in flight, "
                     + std::to_string(scheduler.degraded_hosts) + " degraded hosts");
    }
}

void Crawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    done_ = true;
    Logger::debug("Shutting down resources...");

    boost::system::error_code ec;
    signals_.cancel(ec);

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    worker_pool_.join();
    Logger::debug("Shutdown complete.");
}

}  // namespace Engine
}  // namespace Vortex
