#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Vortex {
namespace Proxy {
namespace Pool {

enum class ProxyPriority { HTTP = 0, SOCKS4 = 1, SOCKS5 = 2 };

struct Proxy {
    std::string   url;
    int           failure_count = 0;
    ProxyPriority priority      = ProxyPriority::HTTP;
    size_t        id            = 0;  // stable tie-breaker
};

/**
 * @brief Tiered round-robin pool of upstream proxies.
 *
 * Selection prefers the highest priority tier, then the proxies with the
 * fewest recent failures, rotating among equals. A proxy that fails more than
 * max_retries times in a row is evicted.
 */
class ProxyPool {
public:
    static std::map<std::string, int> default_priorities();

    ProxyPool(const std::vector<std::string>&   proxies,
              int                               max_retries,
              const std::map<std::string, int>& priorities = default_priorities());

    std::optional<Proxy> get_proxy();
    void                 report(const Proxy& proxy, bool success);
    bool                 empty() const;
    size_t               size() const;

private:
    ProxyPriority determine_priority(const std::string&                url,
                                     const std::map<std::string, int>& priorities) const;

    std::vector<Proxy>              proxies_;
    mutable std::mutex              mutex_;
    int                             max_retries_;
    std::map<ProxyPriority, size_t> last_idx_map_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Vortex
