#include "request.hpp"
#include <algorithm>
#include <cctype>

namespace Vortex {
namespace Core {

Request Request::get(std::string url, unsigned depth) {
    Request req;
    req.url   = std::move(url);
    req.depth = depth;
    return req;
}

std::vector<Request> Request::from_strings(const std::vector<std::string>& urls, unsigned depth) {
    std::vector<Request> requests;
    requests.reserve(urls.size());
    for (const auto& url : urls)
        requests.push_back(get(url, depth));
    return requests;
}

const char* to_string(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Head: return "HEAD";
        case Method::Post: return "POST";
        case Method::Put: return "PUT";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

std::optional<Method> parse_method(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (upper == "GET")
        return Method::Get;
    if (upper == "HEAD")
        return Method::Head;
    if (upper == "POST")
        return Method::Post;
    if (upper == "PUT")
        return Method::Put;
    if (upper == "DELETE")
        return Method::Delete;
    return std::nullopt;
}

}  // namespace Core
}  // namespace Vortex
