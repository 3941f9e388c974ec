#include "string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Vortex {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream        ss(str);
    std::string              part;
    while (std::getline(ss, part, delimiter))
        parts.push_back(part);
    if (!str.empty() && str.back() == delimiter)
        parts.emplace_back();
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += separator;
        out += parts[i];
    }
    return out;
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool in_space = false;
    for (unsigned char c : str) {
        if (std::isspace(c)) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty())
            out += ' ';
        in_space = false;
        out += static_cast<char>(c);
    }
    return out;
}

std::string truncate(const std::string& str, size_t max_len) {
    if (str.size() <= max_len)
        return str;
    return str.substr(0, max_len) + "...";
}

bool is_valid_utf8(const std::string& str) {
    size_t i = 0;
    while (i < str.size()) {
        auto   c   = static_cast<unsigned char>(str[i]);
        size_t len = 0;
        if (c < 0x80)
            len = 1;
        else if ((c >> 5) == 0x6)
            len = 2;
        else if ((c >> 4) == 0xE)
            len = 3;
        else if ((c >> 3) == 0x1E)
            len = 4;
        else
            return false;

        if (i + len > str.size())
            return false;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(str[i + k]) >> 6) != 0x2)
                return false;
        }
        i += len;
    }
    return true;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Vortex
