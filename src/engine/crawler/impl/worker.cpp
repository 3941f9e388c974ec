#include <algorithm>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../parser/parser.hpp"
#include "../crawler.hpp"

namespace Vortex {
namespace Engine {

using namespace Vortex::Core;
namespace net = boost::asio;

namespace {
constexpr int WORKER_POLL_INTERVAL_MS = 50;
}  // namespace

bool Crawler::is_quiescent() const {
    return scheduler_->is_quiescent();
}

uint64_t Crawler::register_in_flight(const Request& request) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    uint64_t                    id = ++next_id_;
    in_flight_.emplace(id, request);
    return id;
}

size_t Crawler::in_flight_count() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

void Crawler::record_status(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok:
            stats_.ok++;
            break;
        case FetchStatus::ClientError:
            stats_.client_errors++;
            break;
        case FetchStatus::ServerError:
            stats_.server_errors++;
            break;
        case FetchStatus::Timeout:
            stats_.timeouts++;
            break;
        case FetchStatus::NetworkError:
            stats_.network_errors++;
            break;
    }
}

net::awaitable<void> Crawler::worker_loop() {
    try {
        net::steady_timer timer(ioc_);
        const auto        poll = std::chrono::milliseconds(WORKER_POLL_INTERVAL_MS);

        while (state_ == CrawlState::Running) {
            auto request = scheduler_->next();

            if (!request) {
                if (is_quiescent()) {
                    trigger_done();
                    co_return;
                }
                auto wait = scheduler_->time_until_ready().value_or(poll);
                timer.expires_after(std::clamp(wait, std::chrono::milliseconds(1), poll));
                boost::system::error_code ec;
                co_await                  timer.async_wait(
                    net::redirect_error(net::use_awaitable, ec));
                continue;
            }

            co_await process_request(std::move(*request));
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
    }
}

net::awaitable<void> Crawler::process_request(Request request) {
    uint64_t id = register_in_flight(request);
    stats_.dispatched++;
    Logger::info("Fetching: " + request.url + " (Depth " + std::to_string(request.depth) + ")");

    Download::Outcome outcome;
    try {
        outcome = co_await downloader_->fetch(request);
    } catch (const std::exception& e) {
        Logger::error("Fetch aborted for " + request.url + ": " + e.what());
        outcome.kind                = Download::Outcome::Kind::TerminalFailure;
        outcome.response.request    = request;
        outcome.response.error      = e.what();
        outcome.response.error_type = TransportError::Other;
        outcome.response.status     = FetchStatus::NetworkError;
    }
    complete(id, std::move(outcome));
}

void Crawler::complete(uint64_t id, Download::Outcome outcome) {
    Request request;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        auto                        it = in_flight_.find(id);
        if (it == in_flight_.end()) {
            Logger::debug("Dropping late completion of " + outcome.response.request.url);
            return;
        }
        request = std::move(it->second);
        in_flight_.erase(it);
    }

    // Opened while the request still counts as in flight, so the Scheduler
    // never looks quiescent before the follow-up work of this response is admitted.
    scheduler_->begin_task();

    FetchStatus status = outcome.status();
    record_status(status);
    scheduler_->report_outcome(request, {status, outcome.response.elapsed});

    switch (outcome.kind) {
        case Download::Outcome::Kind::Success:
            schedule_parse(std::move(outcome.response));
            return;
        case Download::Outcome::Kind::Redirect:
            if (outcome.follow_up && state_ == CrawlState::Running) {
                auto admission = scheduler_->admit(std::move(*outcome.follow_up));
                if (admission != Scheduling::Admission::Admitted)
                    Logger::debug("Redirect target of " + request.url + " not admitted: "
                                  + Scheduling::to_string(admission));
            }
            break;
        case Download::Outcome::Kind::SoftFailure:
            stats_.soft_failures++;
            break;
        case Download::Outcome::Kind::TerminalFailure:
            stats_.terminal_failures++;
            break;
        case Download::Outcome::Kind::Cancelled:
            stats_.cancelled++;
            break;
    }
    scheduler_->end_task();
}

void Crawler::abandon_in_flight(const std::string& reason) {
    std::map<uint64_t, Request> abandoned;
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        abandoned.swap(in_flight_);
    }

    for (const auto& [id, request] : abandoned) {
        Logger::warn(reason + ": " + request.url);
        stats_.cancelled++;
        record_status(FetchStatus::Timeout);
        scheduler_->report_outcome(request, {FetchStatus::Timeout, std::chrono::milliseconds(0)});
    }
}

void Crawler::schedule_parse(Response response) {
    net::post(worker_pool_, [this, response = std::move(response)]() {
        try {
            auto result = Parsing::Parser::parse(response, *rules_);
            stats_.extraction_failures += result.failures.size();
            stats_.discovered += result.requests.size();

            if (state_ == CrawlState::Running) {
                for (auto& request : result.requests)
                    scheduler_->admit(std::move(request));
            }
            deliver_records(result.records);
        } catch (const std::exception& e) {
            Logger::error("Content processing failed for " + response.url() + ": " + e.what());
        }
        scheduler_->end_task();
    });
}

void Crawler::deliver_records(std::vector<Record>& records) {
    for (const auto& record : records) {
        if (state_ == CrawlState::Cancelling || state_ == CrawlState::Stopped)
            return;

        stats_.records++;
        if (!pipeline_->deliver(record)) {
            Logger::error("Critical sink failed, cancelling crawl");
            cancel();
            return;
        }
    }
}

}  // namespace Engine
}  // namespace Vortex
