#include "json_lines_sink.hpp"
#include <filesystem>
#include <stdexcept>

namespace Vortex {
namespace Pipeline {

JsonLinesSink::JsonLinesSink(const std::string& path)
    : file_(std::make_unique<std::ofstream>()), out_(nullptr), path_(path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    file_->open(path, std::ios::out | std::ios::app);
    if (!file_->is_open())
        throw std::runtime_error("Cannot open " + path + " for writing");
    out_ = file_.get();
}

JsonLinesSink::JsonLinesSink(std::ostream& out) : out_(&out), path_("<stream>") {
}

void JsonLinesSink::accept(const Core::Record& record) {
    *out_ << record.to_json().dump() << '\n';
    out_->flush();
    if (!*out_)
        throw std::runtime_error("Write to " + path_ + " failed");
}

void JsonLinesSink::close() {
    if (file_ && file_->is_open())
        file_->close();
}

}  // namespace Pipeline
}  // namespace Vortex
