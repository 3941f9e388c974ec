#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/types/request.hpp"
#include "../core/types/response.hpp"
#include "../proxy/pool/proxy_pool.hpp"
#include "autothrottle.hpp"

namespace Vortex {
namespace Download {

// State of one attempt as it moves through the chain.
struct FetchContext {
    Core::Request                     request;
    std::string                       host;
    int                               attempt = 1;
    std::optional<Proxy::Pool::Proxy> proxy;
    bool                              short_circuited = false;
};

class Middleware {
public:
    virtual ~Middleware() = default;

    virtual const char* name() const = 0;

    // Returning a response stops the request side; the transport is skipped.
    virtual std::optional<Core::Response> process_request(FetchContext& /*ctx*/) {
        return std::nullopt;
    }
    virtual void process_response(FetchContext& /*ctx*/, Core::Response& /*response*/) {
    }
};

class DefaultHeadersMiddleware : public Middleware {
public:
    explicit DefaultHeadersMiddleware(Core::Headers defaults = standard_headers());

    static Core::Headers standard_headers();

    const char*                   name() const override {
        return "DefaultHeaders";
    }
    std::optional<Core::Response> process_request(FetchContext& ctx) override;

private:
    Core::Headers defaults_;
};

// One fixed agent, or round-robin over a rotation list.
class UserAgentMiddleware : public Middleware {
public:
    explicit UserAgentMiddleware(std::vector<std::string> agents);

    const char*                   name() const override {
        return "UserAgent";
    }
    std::optional<Core::Response> process_request(FetchContext& ctx) override;

private:
    std::vector<std::string> agents_;
    std::atomic<size_t>      next_{0};
};

class ProxyMiddleware : public Middleware {
public:
    ProxyMiddleware(std::shared_ptr<Proxy::Pool::ProxyPool> pool, bool enabled);

    const char*                   name() const override {
        return "Proxy";
    }
    std::optional<Core::Response> process_request(FetchContext& ctx) override;
    void process_response(FetchContext& ctx, Core::Response& response) override;

private:
    std::shared_ptr<Proxy::Pool::ProxyPool> pool_;
    bool                                    enabled_;
};

class AutoThrottleMiddleware : public Middleware {
public:
    explicit AutoThrottleMiddleware(std::shared_ptr<AutoThrottle> throttle);

    const char* name() const override {
        return "AutoThrottleFeedback";
    }
    void process_response(FetchContext& ctx, Core::Response& response) override;

private:
    std::shared_ptr<AutoThrottle> throttle_;
};

// Assigns Response::status from the transport result and HTTP status code.
class StatusAssessmentMiddleware : public Middleware {
public:
    const char* name() const override {
        return "StatusAssessment";
    }
    void process_response(FetchContext& ctx, Core::Response& response) override;
};

/**
 * @brief Ordered middleware stages around the transport.
 *
 * Request hooks run front to back, response hooks back to front, and only
 * for the stages whose request hook ran. Response-only stages are therefore
 * appended in reverse: the standard chain is
 * DefaultHeaders, UserAgent, Proxy, AutoThrottleFeedback, StatusAssessment,
 * so a response is assessed before the throttle observes it.
 */
class MiddlewareChain {
public:
    struct Options {
        Core::Headers default_headers = DefaultHeadersMiddleware::standard_headers();
        std::vector<std::string>                user_agents;
        std::shared_ptr<Proxy::Pool::ProxyPool> proxy_pool;
        bool                                    use_proxies = false;
        std::shared_ptr<AutoThrottle>           throttle;
    };

    static MiddlewareChain standard(const Options& options);

    void   add(std::unique_ptr<Middleware> middleware);
    size_t size() const {
        return stages_.size();
    }
    std::vector<std::string> names() const;

    // reached: number of stages whose request hook ran, fed back to run_response().
    std::optional<Core::Response> run_request(FetchContext& ctx, size_t& reached);
    void run_response(FetchContext& ctx, Core::Response& response, size_t reached);

private:
    std::vector<std::unique_ptr<Middleware>> stages_;
};

}  // namespace Download
}  // namespace Vortex
