#pragma once

#include <string>
#include <vector>

namespace Vortex {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string              join(const std::vector<std::string>& parts, const std::string& separator);
std::string              collapse_whitespace(const std::string& str);
std::string              truncate(const std::string& str, size_t max_len);
bool                     is_valid_utf8(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Vortex
