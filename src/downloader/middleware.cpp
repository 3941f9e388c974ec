#include "middleware.hpp"
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace Vortex {
namespace Download {

using Core::Logger;
using Core::Response;

namespace {

bool has_header(const Core::Headers& headers, const std::string& name) {
    std::string lower = Utils::Text::to_lower(name);
    for (const auto& [key, value] : headers) {
        if (Utils::Text::to_lower(key) == lower)
            return true;
    }
    return false;
}

}  // namespace

DefaultHeadersMiddleware::DefaultHeadersMiddleware(Core::Headers defaults)
    : defaults_(std::move(defaults)) {
}

Core::Headers DefaultHeadersMiddleware::standard_headers() {
    return {{"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
            {"Accept-Language", "en"}};
}

std::optional<Response> DefaultHeadersMiddleware::process_request(FetchContext& ctx) {
    for (const auto& [name, value] : defaults_) {
        if (!has_header(ctx.request.headers, name))
            ctx.request.headers[name] = value;
    }
    return std::nullopt;
}

UserAgentMiddleware::UserAgentMiddleware(std::vector<std::string> agents)
    : agents_(std::move(agents)) {
    if (agents_.empty())
        agents_.push_back(Core::Constants::USER_AGENT);
}

std::optional<Response> UserAgentMiddleware::process_request(FetchContext& ctx) {
    if (has_header(ctx.request.headers, "User-Agent"))
        return std::nullopt;

    size_t idx                        = next_.fetch_add(1) % agents_.size();
    ctx.request.headers["User-Agent"] = agents_[idx];
    return std::nullopt;
}

ProxyMiddleware::ProxyMiddleware(std::shared_ptr<Proxy::Pool::ProxyPool> pool, bool enabled)
    : pool_(std::move(pool)), enabled_(enabled) {
}

std::optional<Response> ProxyMiddleware::process_request(FetchContext& ctx) {
    if (!enabled_)
        return std::nullopt;

    ctx.proxy = pool_ ? pool_->get_proxy() : std::nullopt;
    if (ctx.proxy)
        return std::nullopt;

    Response response;
    response.request       = ctx.request;
    response.effective_url = ctx.request.url;
    response.error         = "No proxy available";
    response.error_type    = Core::TransportError::Proxy;
    response.status        = Core::FetchStatus::ClientError;
    ctx.short_circuited    = true;
    return response;
}

void ProxyMiddleware::process_response(FetchContext& ctx, Response& response) {
    if (!ctx.proxy || !pool_)
        return;

    // Blocks and rate limits are blamed on the exit node.
    bool proxy_failed = response.error_type == Core::TransportError::Proxy
                        || response.status_code == 403 || response.status_code == 429;
    pool_->report(*ctx.proxy, !proxy_failed);
}

AutoThrottleMiddleware::AutoThrottleMiddleware(std::shared_ptr<AutoThrottle> throttle)
    : throttle_(std::move(throttle)) {
}

void AutoThrottleMiddleware::process_response(FetchContext& ctx, Response& response) {
    if (!throttle_ || ctx.short_circuited)
        return;

    bool error = Core::is_retryable(response.status) || response.status_code == 429;
    throttle_->observe(ctx.host, response.elapsed, error);
}

void StatusAssessmentMiddleware::process_response(FetchContext& ctx, Response& response) {
    if (ctx.short_circuited)
        return;

    response.status = Core::classify(response);
    if (response.is_redirect() && response.header("location").empty())
        response.status = Core::FetchStatus::ClientError;
    if (response.status != Core::FetchStatus::Ok && !response.is_redirect()) {
        std::string detail = response.error_type != Core::TransportError::None
                                 ? response.error
                                 : "HTTP " + std::to_string(response.status_code);
        Logger::debug(std::string(Core::to_string(response.status)) + " for "
                      + ctx.request.url + " (" + detail + ")");
    }
}

MiddlewareChain MiddlewareChain::standard(const Options& options) {
    MiddlewareChain chain;
    chain.add(std::make_unique<DefaultHeadersMiddleware>(options.default_headers));
    chain.add(std::make_unique<UserAgentMiddleware>(options.user_agents));
    chain.add(std::make_unique<ProxyMiddleware>(options.proxy_pool, options.use_proxies));
    chain.add(std::make_unique<AutoThrottleMiddleware>(options.throttle));
    chain.add(std::make_unique<StatusAssessmentMiddleware>());
    return chain;
}

void MiddlewareChain::add(std::unique_ptr<Middleware> middleware) {
    stages_.push_back(std::move(middleware));
}

std::vector<std::string> MiddlewareChain::names() const {
    std::vector<std::string> out;
    for (const auto& stage : stages_)
        out.emplace_back(stage->name());
    return out;
}

std::optional<Response> MiddlewareChain::run_request(FetchContext& ctx, size_t& reached) {
    reached = 0;
    for (const auto& stage : stages_) {
        auto early = stage->process_request(ctx);
        if (early) {
            ctx.short_circuited = true;
            Logger::debug(std::string(stage->name()) + " short-circuited " + ctx.request.url);
            return early;
        }
        reached++;
    }
    return std::nullopt;
}

void MiddlewareChain::run_response(FetchContext& ctx, Response& response, size_t reached) {
    for (size_t i = reached; i > 0; --i)
        stages_[i - 1]->process_response(ctx, response);
}

}  // namespace Download
}  // namespace Vortex
