#pragma once
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include "sink.hpp"

namespace Vortex {
namespace Pipeline {

// One compact JSON object per line: {"url", "fetched_at", "fields"}.
class JsonLinesSink : public Sink {
public:
    explicit JsonLinesSink(const std::string& path);
    explicit JsonLinesSink(std::ostream& out);

    std::string name() const override {
        return "jsonl";
    }
    void accept(const Core::Record& record) override;
    void close() override;

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream*                  out_;
    std::string                    path_;
};

}  // namespace Pipeline
}  // namespace Vortex
