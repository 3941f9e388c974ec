#include "downloader.hpp"
#include <algorithm>
#include "../core/logger/logger.hpp"
#include "../utils/robotstxt/robotstxt.hpp"
#include "../utils/url/url.hpp"

namespace Vortex {
namespace Download {

namespace net = boost::asio;

using Core::FetchStatus;
using Core::Logger;
using Core::Request;
using Core::Response;
using std::chrono::milliseconds;

namespace {
constexpr milliseconds CANCEL_CHECK_INTERVAL{100};
}  // namespace

FetchStatus Outcome::status() const {
    switch (kind) {
        case Kind::Success:
        case Kind::Redirect: return FetchStatus::Ok;
        case Kind::Cancelled: return FetchStatus::Timeout;
        case Kind::SoftFailure:
            return response.status == FetchStatus::Ok ? FetchStatus::ClientError : response.status;
        case Kind::TerminalFailure:
        default: return response.status;
    }
}

const char* to_string(Outcome::Kind kind) {
    switch (kind) {
        case Outcome::Kind::Success: return "success";
        case Outcome::Kind::Redirect: return "redirect";
        case Outcome::Kind::SoftFailure: return "soft-failure";
        case Outcome::Kind::TerminalFailure: return "terminal-failure";
        case Outcome::Kind::Cancelled: return "cancelled";
    }
    return "unknown";
}

Downloader::Downloader(DownloaderConfig                            config,
                       std::shared_ptr<Network::Http::HttpClient> client,
                       MiddlewareChain                             chain,
                       std::shared_ptr<AutoThrottle>               throttle)
    : config_(std::move(config)),
      client_(std::move(client)),
      chain_(std::move(chain)),
      throttle_(std::move(throttle)) {
    if (config_.retry_cap < 0)
        config_.retry_cap = 0;
}

void Downloader::cancel() {
    cancelled_ = true;
}

DownloaderStats Downloader::stats() const {
    return DownloaderStats{.attempts       = attempts_.load(),
                           .retries        = retries_.load(),
                           .redirects      = redirects_.load(),
                           .short_circuits = short_circuits_.load(),
                           .robots_fetched = robots_fetched_.load()};
}

bool Downloader::should_retry(const Response& response) const {
    if (Core::is_retryable(response.status))
        return true;
    return std::find(config_.retry_http_codes.begin(),
                     config_.retry_http_codes.end(),
                     response.status_code)
           != config_.retry_http_codes.end();
}

std::optional<Request> Downloader::make_redirect(const Request&  request,
                                                 const Response& response) const {
    std::string location = response.header("location");
    if (location.empty())
        return std::nullopt;

    std::string target = Utils::Url::resolve(request.url, location);
    if (target.empty() || !Utils::Url::is_http(target))
        return std::nullopt;

    Request follow;
    follow.url       = Utils::Url::strip_fragment(target);
    follow.depth     = request.depth;
    follow.priority  = request.priority;
    follow.meta      = request.meta;
    follow.headers   = request.headers;
    follow.redirects = request.redirects + 1;
    follow.method    = request.method;
    follow.body      = request.body;

    // 303 always, and 301/302 after a POST, continue as a body-less GET.
    long code = response.status_code;
    if (code == 303 || ((code == 301 || code == 302) && request.method == Core::Method::Post)) {
        follow.method = Core::Method::Get;
        follow.body.reset();
    }
    follow.headers["Referer"] = request.url;
    return follow;
}

Outcome Downloader::cancelled_outcome(const Request& request, int attempts) const {
    Outcome out;
    out.kind                   = Outcome::Kind::Cancelled;
    out.attempts               = attempts;
    out.response.request       = request;
    out.response.effective_url = request.url;
    out.response.error         = "Cancelled";
    out.response.error_type    = Core::TransportError::Cancelled;
    out.response.status        = FetchStatus::Timeout;
    return out;
}

net::awaitable<void> Downloader::sleep_for(milliseconds duration) {
    net::steady_timer timer(co_await net::this_coro::executor);
    auto              deadline = std::chrono::steady_clock::now() + duration;

    while (!cancelled_ && std::chrono::steady_clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<milliseconds>(
            deadline - std::chrono::steady_clock::now());
        timer.expires_after(std::min(remaining, CANCEL_CHECK_INTERVAL));
        boost::system::error_code ec;
        co_await                  timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

net::awaitable<void> Downloader::ensure_robots(const Request& request, const std::string& host) {
    {
        std::lock_guard<std::mutex> lock(robots_mutex_);
        if (!robots_hosts_.insert(host).second)
            co_return;
    }

    auto    parsed = Utils::Url::parse(request.url);
    Request robots = Request::get(parsed.scheme + "://" + host + "/robots.txt");
    robots.headers["User-Agent"] = config_.robots_user_agent;

    Response response = co_await client_->fetch(robots, "");
    robots_fetched_++;
    if (response.error_type != Core::TransportError::None || response.status_code != 200) {
        Logger::debug("robots.txt unavailable for " + host);
        co_return;
    }

    auto rules = Utils::RobotsTxt::parse(response.body);
    auto delay = rules.crawl_delay(config_.robots_user_agent);
    if (delay > milliseconds(0) && throttle_) {
        throttle_->set_floor(host, delay);
        Logger::info("robots.txt Crawl-delay for " + host + ": " + std::to_string(delay.count())
                     + "ms");
    }
}

net::awaitable<Outcome> Downloader::fetch(Request request) {
    std::string host     = Utils::Url::host_key(request.url);
    int         attempts = 0;

    if (config_.robots_crawl_delay && !cancelled_)
        co_await ensure_robots(request, host);

    for (int attempt = 1; attempt <= config_.retry_cap + 1; ++attempt) {
        if (cancelled_)
            co_return cancelled_outcome(request, attempts);

        FetchContext ctx;
        ctx.request = request;
        ctx.host    = host;
        ctx.attempt = attempt;

        size_t reached = 0;
        auto   early   = chain_.run_request(ctx, reached);
        if (early) {
            Response response = std::move(*early);
            chain_.run_response(ctx, response, reached);
            short_circuits_++;
            Logger::warn("Skipped " + request.url + ": " + response.error);
            co_return Outcome{.kind      = Outcome::Kind::SoftFailure,
                              .response  = std::move(response),
                              .follow_up = std::nullopt,
                              .attempts  = attempts};
        }

        attempts++;
        attempts_++;
        std::string proxy    = ctx.proxy ? ctx.proxy->url : "";
        Response    response = co_await client_->fetch(ctx.request, proxy);
        response.request     = request;
        chain_.run_response(ctx, response, reached);

        if (cancelled_ || response.error_type == Core::TransportError::Cancelled)
            co_return cancelled_outcome(request, attempts);

        if (response.status == FetchStatus::Ok) {
            if (!response.is_redirect()) {
                co_return Outcome{.kind      = Outcome::Kind::Success,
                                  .response  = std::move(response),
                                  .follow_up = std::nullopt,
                                  .attempts  = attempts};
            }

            auto follow = make_redirect(request, response);
            if (!follow || request.redirects >= config_.max_redirects) {
                Logger::warn((follow ? "Too many redirects: " : "Unusable redirect: ")
                             + request.url);
                response.status = FetchStatus::ClientError;
                co_return Outcome{.kind      = Outcome::Kind::SoftFailure,
                                  .response  = std::move(response),
                                  .follow_up = std::nullopt,
                                  .attempts  = attempts};
            }

            redirects_++;
            Logger::debug("Redirect " + std::to_string(response.status_code) + ": " + request.url
                          + " -> " + follow->url);
            co_return Outcome{.kind      = Outcome::Kind::Redirect,
                              .response  = std::move(response),
                              .follow_up = std::move(follow),
                              .attempts  = attempts};
        }

        if (!should_retry(response)) {
            Logger::warn("HTTP " + std::to_string(response.status_code) + ": " + request.url);
            co_return Outcome{.kind      = Outcome::Kind::SoftFailure,
                              .response  = std::move(response),
                              .follow_up = std::nullopt,
                              .attempts  = attempts};
        }

        if (attempt > config_.retry_cap) {
            std::string reason = response.error_type != Core::TransportError::None
                                     ? response.error
                                     : "HTTP " + std::to_string(response.status_code);
            Logger::error("Failed: " + request.url + " (" + reason + ") after "
                          + std::to_string(attempts) + " attempts");
            co_return Outcome{.kind      = Outcome::Kind::TerminalFailure,
                              .response  = std::move(response),
                              .follow_up = std::nullopt,
                              .attempts  = attempts};
        }

        auto wait = Core::get_backoff_time(attempt, config_.backoff_base, config_.backoff_max);
        if (throttle_)
            wait = std::max(wait, throttle_->delay(host));

        retries_++;
        Logger::info("Retry " + std::to_string(attempt) + "/" + std::to_string(config_.retry_cap)
                     + " for " + request.url + " in " + std::to_string(wait.count()) + "ms ["
                     + Core::to_string(response.status) + "]");
        co_await sleep_for(wait);
    }

    // retry_cap + 1 attempts always return from inside the loop.
    co_return cancelled_outcome(request, attempts);
}

}  // namespace Download
}  // namespace Vortex
