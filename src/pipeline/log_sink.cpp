#include "log_sink.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Vortex {
namespace Pipeline {

LogSink::LogSink(size_t max_value_length) : max_value_length_(max_value_length) {
}

void LogSink::accept(const Core::Record& record) {
    std::string line   = "Record " + record.source_url();
    const auto& fields = record.fields();
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        std::string value = it->is_string() ? it->get<std::string>() : it->dump();
        line += "\n  " + it.key() + ": " + Utils::Text::truncate(value, max_value_length_);
    }
    Core::Logger::success(line);
}

}  // namespace Pipeline
}  // namespace Vortex
