#pragma once
#include <string>

namespace Vortex {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_http(const std::string& url);
    static std::string strip_fragment(const std::string& url);

    // Lower-cased host with an explicit non-default port, e.g. "example.com:8080".
    static std::string host_key(const std::string& url);

    // Scheme/host lower-cased, default port and fragment dropped, query
    // parameters sorted, empty path normalised to "/".
    static std::string canonicalize(const std::string& url);

    static std::string to_filename(const std::string& url, const std::string& extension = ".json");
    static std::string to_flat_filename(const std::string& url,
                                        const std::string& extension = ".json");
};

}  // namespace Utils
}  // namespace Vortex
