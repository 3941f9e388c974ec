#include "proxy_pool.hpp"
#include <algorithm>
#include <limits>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Vortex {
namespace Proxy {
namespace Pool {

using Core::Logger;

std::map<std::string, int> ProxyPool::default_priorities() {
    return {{"http", 0}, {"socks4", 1}, {"socks5", 2}};
}

ProxyPool::ProxyPool(const std::vector<std::string>&   proxies,
                     int                               max_retries,
                     const std::map<std::string, int>& priorities)
    : max_retries_(max_retries) {
    size_t id_counter = 0;
    for (const auto& url : proxies) {
        if (url.empty())
            continue;
        Proxy p;
        p.url      = url;
        p.id       = id_counter++;
        p.priority = determine_priority(url, priorities);
        proxies_.push_back(p);
    }
}

ProxyPriority ProxyPool::determine_priority(const std::string&                url,
                                            const std::map<std::string, int>& priorities) const {
    std::string scheme = Utils::Url::parse(url).scheme;
    std::string tier   = "http";
    if (scheme.rfind("socks5", 0) == 0)
        tier = "socks5";
    else if (scheme.rfind("socks4", 0) == 0)
        tier = "socks4";

    auto it = priorities.find(tier);
    if (it != priorities.end())
        return static_cast<ProxyPriority>(it->second);

    auto defaults = default_priorities();
    return static_cast<ProxyPriority>(defaults[tier]);
}

std::optional<Proxy> ProxyPool::get_proxy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (proxies_.empty())
        return std::nullopt;

    ProxyPriority highest = proxies_.front().priority;
    for (const auto& p : proxies_) {
        if (p.priority > highest)
            highest = p.priority;
    }

    int min_failures = std::numeric_limits<int>::max();
    for (const auto& p : proxies_) {
        if (p.priority == highest)
            min_failures = std::min(min_failures, p.failure_count);
    }

    std::vector<size_t> candidates;
    for (size_t i = 0; i < proxies_.size(); ++i) {
        if (proxies_[i].priority == highest && proxies_[i].failure_count == min_failures)
            candidates.push_back(i);
    }

    // Rotate: first candidate after the last one handed out in this tier, wrapping around.
    size_t chosen = candidates.front();
    auto   last   = last_idx_map_.find(highest);
    if (last != last_idx_map_.end()) {
        for (size_t idx : candidates) {
            if (proxies_[idx].id > last->second) {
                chosen = idx;
                break;
            }
        }
    }
    last_idx_map_[highest] = proxies_[chosen].id;
    return proxies_[chosen];
}

void ProxyPool::report(const Proxy& proxy, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(
        proxies_.begin(), proxies_.end(), [&](const Proxy& p) { return p.id == proxy.id; });
    if (it == proxies_.end())
        return;

    if (success) {
        it->failure_count = 0;
        return;
    }

    it->failure_count++;
    if (it->failure_count <= max_retries_) {
        Logger::warn("Proxy failed (" + std::to_string(it->failure_count) + "/"
                     + std::to_string(max_retries_) + "): " + it->url);
        return;
    }

    Logger::error("Proxy removed (max retries exceeded): " + it->url);
    proxies_.erase(it);
}

bool ProxyPool::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.empty();
}

size_t ProxyPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Vortex
