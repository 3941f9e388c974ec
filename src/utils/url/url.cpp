#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Vortex {
namespace Utils {

namespace {

std::string default_port_for(const std::string& scheme) {
    if (scheme == "http")
        return "80";
    if (scheme == "https")
        return "443";
    return "";
}

std::string clean_host(std::string h) {
    if (!h.empty() && h.back() == '.')
        h.pop_back();  // Strip trailing dot
    return Text::to_lower(h);
}

std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized_path = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized_path += segments[i];
        if (i < segments.size() - 1)
            normalized_path += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized_path.back() != '/') {
        normalized_path += "/";
    }
    return normalized_path;
}

bool is_scheme(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
        return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t q = base.find('?');
        size_t f = base.find('#');
        if (q != std::string::npos)
            return base.substr(0, q) + relative;
        if (f != std::string::npos)
            return base.substr(0, f) + relative;
        return base + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    // mailto:, javascript:, tel: and friends
    size_t colon_pos = relative.find(':');
    if (colon_pos != std::string::npos && colon_pos > 0
        && relative.find_first_of("/?#") > colon_pos && is_scheme(relative.substr(0, colon_pos)))
        return "";

    UrlParsed   baseParsed = parse(base);
    std::string result;

    if (relative.substr(0, 2) == "//") {
        return baseParsed.scheme + ":" + relative;
    }

    std::string auth = baseParsed.host;
    if (!baseParsed.port.empty())
        auth += ":" + baseParsed.port;

    if (relative[0] == '/') {
        result = baseParsed.scheme + "://" + auth + relative;
    }
    else {
        std::string dir       = baseParsed.path;
        size_t      lastSlash = dir.find_last_of('/');
        if (lastSlash != std::string::npos) {
            dir = dir.substr(0, lastSlash + 1);
        }
        else {
            dir = "/";
        }
        result = baseParsed.scheme + "://" + auth + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = (scheme_end == std::string::npos) ? 0 : result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    return result.substr(0, domain_end) + normalize_path(path) + query_frag;
}

bool Url::is_http(const std::string& url) {
    UrlParsed p = parse(url);
    return (p.scheme == "http" || p.scheme == "https") && !p.host.empty();
}

std::string Url::strip_fragment(const std::string& url) {
    size_t frag = url.find('#');
    return frag == std::string::npos ? url : url.substr(0, frag);
}

std::string Url::host_key(const std::string& url) {
    UrlParsed   p    = parse(url);
    std::string host = clean_host(p.host);
    if (!p.port.empty() && p.port != default_port_for(p.scheme))
        host += ":" + p.port;
    return host;
}

std::string Url::canonicalize(const std::string& url) {
    UrlParsed p = parse(url);
    if (p.host.empty())
        return url;

    std::string out = p.scheme + "://" + host_key(url) + p.path;

    if (!p.query.empty()) {
        std::vector<std::string> params = Text::split(p.query, '&');
        params.erase(std::remove(params.begin(), params.end(), std::string()), params.end());
        std::stable_sort(params.begin(), params.end());
        if (!params.empty())
            out += "?" + Text::join(params, "&");
    }
    return out;
}

std::string Url::to_filename(const std::string& url, const std::string& extension) {
    UrlParsed   p    = parse(url);
    std::string path = p.host;
    if (!p.port.empty())
        path += "_" + p.port;
    path += p.path;

    if (path.back() == '/') {
        path += "index";
    }

    size_t lastDot   = path.find_last_of('.');
    size_t lastSlash = path.find_last_of('/');

    if (lastDot != std::string::npos && lastDot > lastSlash) {
        path = path.substr(0, lastDot) + extension;
    }
    else {
        path += extension;
    }

    return path;
}

std::string Url::to_flat_filename(const std::string& url, const std::string& extension) {
    UrlParsed   p    = parse(url);
    std::string path = p.host;
    if (!p.port.empty())
        path += "_" + p.port;
    path += p.path;

    for (char& c : path) {
        if (c == '/')
            c = '_';
    }

    if (!Text::ends_with(path, extension)) {
        path += extension;
    }

    return path;
}

}  // namespace Utils
}  // namespace Vortex
