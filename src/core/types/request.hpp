#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Vortex {
namespace Core {

enum class Method { Get, Head, Post, Put, Delete };

using Headers = std::map<std::string, std::string>;
using Meta    = std::map<std::string, std::string>;

struct Request {
    std::string                url;
    Method                     method = Method::Get;
    Headers                    headers;
    std::optional<std::string> body;
    double                     priority = 0.0;
    unsigned                   depth    = 0;
    Meta                       meta;

    // Admit even when the fingerprint was already seen.
    bool dont_filter = false;
    int  redirects   = 0;

    static Request get(std::string url, unsigned depth = 0);
    static std::vector<Request> from_strings(const std::vector<std::string>& urls,
                                             unsigned                        depth = 0);
};

const char*           to_string(Method method);
std::optional<Method> parse_method(const std::string& name);

}  // namespace Core
}  // namespace Vortex
