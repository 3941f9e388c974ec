#include "pipeline.hpp"
#include "../core/logger/logger.hpp"

namespace Vortex {
namespace Pipeline {

using Core::Logger;

Pipeline::~Pipeline() {
    close();
}

void Pipeline::add_sink(std::shared_ptr<Sink> sink, bool critical) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back({std::move(sink), critical});
}

bool Pipeline::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.empty();
}

bool Pipeline::deliver(const Core::Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        return true;

    stats_.records++;
    bool healthy = true;
    for (auto& entry : sinks_) {
        try {
            entry.sink->accept(record);
        } catch (const std::exception& e) {
            stats_.sink_failures++;
            Logger::error("Sink " + entry.sink->name() + " failed for " + record.source_url()
                          + ": " + e.what());
            if (entry.critical)
                healthy = false;
        }
    }
    return healthy;
}

void Pipeline::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
        return;
    closed_ = true;
    for (auto& entry : sinks_) {
        try {
            entry.sink->close();
        } catch (const std::exception& e) {
            Logger::error("Sink " + entry.sink->name() + " failed to close: " + e.what());
        }
    }
}

PipelineStats Pipeline::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace Pipeline
}  // namespace Vortex
