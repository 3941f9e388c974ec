#pragma once
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Vortex {
namespace Core {

/**
 * @brief An ordered set of extracted fields tagged with its source.
 *
 * Field values are restricted to a string, a list of strings or a nested
 * record. Insertion order is preserved; setting an existing field replaces its
 * value in place.
 */
class Record {
public:
    using Clock = std::chrono::system_clock;

    Record();
    Record(std::string source_url, Clock::time_point fetched_at);

    void set(const std::string& field, std::string value);
    void set(const std::string& field, std::vector<std::string> values);
    void set(const std::string& field, const Record& nested);

    // Re-attributes the record, keeping its fields.
    void tag(std::string source_url, Clock::time_point fetched_at);

    bool                       has(const std::string& field) const;
    bool                       empty() const;
    size_t                     size() const;
    std::vector<std::string>   field_names() const;
    std::optional<std::string> get_string(const std::string& field) const;
    std::vector<std::string>   get_list(const std::string& field) const;
    std::optional<Record>      get_record(const std::string& field) const;

    const std::string& source_url() const {
        return source_url_;
    }
    Clock::time_point fetched_at() const {
        return fetched_at_;
    }
    const nlohmann::ordered_json& fields() const {
        return fields_;
    }

    // {"url": ..., "fetched_at": RFC 3339, "fields": {...}}
    nlohmann::ordered_json to_json() const;

private:
    std::string            source_url_;
    Clock::time_point      fetched_at_;
    nlohmann::ordered_json fields_;
};

std::string format_timestamp(Record::Clock::time_point tp);

}  // namespace Core
}  // namespace Vortex
