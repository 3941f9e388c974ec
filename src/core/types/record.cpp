#include "record.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Vortex {
namespace Core {

Record::Record() : fetched_at_(Clock::now()), fields_(nlohmann::ordered_json::object()) {
}

Record::Record(std::string source_url, Clock::time_point fetched_at)
    : source_url_(std::move(source_url)),
      fetched_at_(fetched_at),
      fields_(nlohmann::ordered_json::object()) {
}

void Record::set(const std::string& field, std::string value) {
    fields_[field] = std::move(value);
}

void Record::set(const std::string& field, std::vector<std::string> values) {
    fields_[field] = std::move(values);
}

void Record::set(const std::string& field, const Record& nested) {
    fields_[field] = nested.fields_;
}

void Record::tag(std::string source_url, Clock::time_point fetched_at) {
    source_url_ = std::move(source_url);
    fetched_at_ = fetched_at;
}

bool Record::has(const std::string& field) const {
    return fields_.contains(field);
}

bool Record::empty() const {
    return fields_.empty();
}

size_t Record::size() const {
    return fields_.size();
}

std::vector<std::string> Record::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (auto it = fields_.begin(); it != fields_.end(); ++it)
        names.push_back(it.key());
    return names;
}

std::optional<std::string> Record::get_string(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> Record::get_list(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end() || !it->is_array())
        return {};
    return it->get<std::vector<std::string>>();
}

std::optional<Record> Record::get_record(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end() || !it->is_object())
        return std::nullopt;

    Record nested(source_url_, fetched_at_);
    nested.fields_ = *it;
    return nested;
}

nlohmann::ordered_json Record::to_json() const {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["url"]                 = source_url_;
    out["fetched_at"]          = format_timestamp(fetched_at_);
    out["fields"]              = fields_;
    return out;
}

std::string format_timestamp(Record::Clock::time_point tp) {
    auto        seconds = Record::Clock::to_time_t(tp);
    auto        millis  = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count()
                  % 1000;
    std::tm     utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis << 'Z';
    return out.str();
}

}  // namespace Core
}  // namespace Vortex
