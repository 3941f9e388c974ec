#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include "../core/types/request.hpp"

namespace Vortex {
namespace Scheduling {

struct FrontierEntry {
    Core::Request request;
    double        priority = 0.0;
    uint64_t      sequence = 0;
    std::string   fingerprint;
    std::string   host;
};

/**
 * @brief Pending requests bucketed per host.
 *
 * Within a host, entries are ordered by priority (highest first) and then by
 * insertion sequence. pop_best() compares the head of every eligible host
 * after applying a per-host adjustment, so a penalised host sinks as a whole
 * without its entries being reordered or dropped.
 */
class Frontier {
public:
    using HostPredicate  = std::function<bool(const std::string& host)>;
    using HostAdjustment = std::function<double(const std::string& host)>;

    void push(FrontierEntry entry);

    std::optional<FrontierEntry> pop_best(const HostPredicate&  eligible,
                                          const HostAdjustment& adjustment);

    bool   empty() const;
    size_t size() const {
        return size_;
    }
    size_t pending(const std::string& host) const;

    template <typename Fn>
    void for_each_host(Fn&& fn) const {
        for (const auto& [host, bucket] : buckets_) {
            if (!bucket.empty())
                fn(host, bucket.size());
        }
    }

    void clear();

private:
    struct Order {
        bool operator()(const FrontierEntry& a, const FrontierEntry& b) const {
            if (a.priority != b.priority)
                return a.priority > b.priority;
            return a.sequence < b.sequence;
        }
    };

    std::map<std::string, std::set<FrontierEntry, Order>> buckets_;
    size_t                                                size_ = 0;
};

}  // namespace Scheduling
}  // namespace Vortex
