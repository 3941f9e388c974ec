#pragma once
#include <memory>
#include <mutex>
#include <vector>
#include "sink.hpp"

namespace Vortex {
namespace Pipeline {

struct PipelineStats {
    size_t records       = 0;
    size_t sink_failures = 0;
};

/**
 * @brief Fans records out to the configured sinks.
 *
 * Deliveries are serialised, so each sink sees records one at a time and in
 * the order deliver() was called. A failing sink is logged and skipped for
 * that record; deliver() returns false only when a critical sink failed.
 */
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline();

    void add_sink(std::shared_ptr<Sink> sink, bool critical = false);
    bool empty() const;

    bool deliver(const Core::Record& record);
    void close();

    PipelineStats stats() const;

private:
    struct Entry {
        std::shared_ptr<Sink> sink;
        bool                  critical = false;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> sinks_;
    PipelineStats      stats_;
    bool               closed_ = false;
};

}  // namespace Pipeline
}  // namespace Vortex
