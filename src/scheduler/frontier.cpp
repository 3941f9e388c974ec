#include "frontier.hpp"

namespace Vortex {
namespace Scheduling {

void Frontier::push(FrontierEntry entry) {
    auto& bucket = buckets_[entry.host];
    bucket.insert(std::move(entry));
    ++size_;
}

std::optional<FrontierEntry> Frontier::pop_best(const HostPredicate&  eligible,
                                                const HostAdjustment& adjustment) {
    using Bucket = std::set<FrontierEntry, Order>;

    Bucket*  best_bucket   = nullptr;
    double   best_priority = 0.0;
    uint64_t best_sequence = 0;

    for (auto& [host, bucket] : buckets_) {
        if (bucket.empty() || !eligible(host))
            continue;

        const FrontierEntry& head      = *bucket.begin();
        double               effective = head.priority + adjustment(host);
        if (!best_bucket || effective > best_priority
            || (effective == best_priority && head.sequence < best_sequence)) {
            best_bucket   = &bucket;
            best_priority = effective;
            best_sequence = head.sequence;
        }
    }

    if (!best_bucket)
        return std::nullopt;

    auto          node  = best_bucket->extract(best_bucket->begin());
    FrontierEntry entry = std::move(node.value());
    --size_;
    if (best_bucket->empty())
        buckets_.erase(entry.host);
    return entry;
}

bool Frontier::empty() const {
    return size_ == 0;
}

size_t Frontier::pending(const std::string& host) const {
    auto it = buckets_.find(host);
    return it == buckets_.end() ? 0 : it->second.size();
}

void Frontier::clear() {
    buckets_.clear();
    size_ = 0;
}

}  // namespace Scheduling
}  // namespace Vortex
