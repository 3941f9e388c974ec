#pragma once
#include <string>
#include "sink.hpp"

namespace Vortex {
namespace Pipeline {

// Prints each record through the Logger, truncating long values.
class LogSink : public Sink {
public:
    explicit LogSink(size_t max_value_length = 120);

    std::string name() const override {
        return "log";
    }
    void accept(const Core::Record& record) override;

private:
    size_t max_value_length_;
};

}  // namespace Pipeline
}  // namespace Vortex
