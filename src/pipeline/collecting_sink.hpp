#pragma once
#include <mutex>
#include <vector>
#include "sink.hpp"

namespace Vortex {
namespace Pipeline {

class CollectingSink : public Sink {
public:
    std::string name() const override {
        return "collect";
    }
    void accept(const Core::Record& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    std::vector<Core::Record> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    mutable std::mutex        mutex_;
    std::vector<Core::Record> records_;
};

}  // namespace Pipeline
}  // namespace Vortex
