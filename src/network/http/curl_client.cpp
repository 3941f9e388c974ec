#include "curl_client.hpp"
#include <string_view>
#include "../../utils/text/string_utils.hpp"

namespace Vortex {
namespace Network {
namespace Http {

namespace net = boost::asio;

using Core::Request;
using Core::Response;
using Core::TransportError;

namespace {

TransportError map_curl_code_to_error_type(CURLcode code, bool via_proxy) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportError::Proxy;
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
            return via_proxy ? TransportError::Proxy : TransportError::Network;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportError::Cancelled;
        default:
            return TransportError::Network;
    }
}

struct CurlGlobal {
    CurlGlobal() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto*  body  = static_cast<std::string*>(userp);
    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*            headers = static_cast<Core::Headers*>(userp);
    size_t           total   = size * nitems;
    std::string_view line(buffer, total);

    // A new status line starts a new header block (e.g. after "100 Continue").
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    std::string name  = Utils::Text::to_lower(Utils::Text::trim(std::string(line.substr(0, colon))));
    std::string value = Utils::Text::trim(std::string(line.substr(colon + 1)));
    auto        it    = headers->find(name);
    if (it != headers->end())
        it->second += ", " + value;
    else
        headers->emplace(std::move(name), std::move(value));
    return total;
}

CurlClient::CurlClient(size_t threads) : pool_(threads) {
    static CurlGlobal global;
}

CurlClient::~CurlClient() {
    pool_.join();
}

net::awaitable<Response> CurlClient::fetch(const Request& request, const std::string& proxy) {
    auto origin = co_await net::this_coro::executor;
    co_await     net::post(pool_, net::use_awaitable);
    Response     response = perform(request, proxy);
    co_await     net::post(origin, net::use_awaitable);
    co_return response;
}

Response CurlClient::perform(const Request& request, const std::string& proxy) const {
    auto     started = std::chrono::steady_clock::now();
    Response response;
    response.request       = request;
    response.effective_url = request.url;

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        response.error      = "Failed to initialize CURL handle";
        response.error_type = TransportError::Other;
        return response;
    }

    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(h, CURLOPT_USERAGENT, Core::Constants::USER_AGENT);

    switch (request.method) {
        case Core::Method::Head:
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
            break;
        case Core::Method::Get:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            break;
        default:
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, Core::to_string(request.method));
            break;
    }
    if (request.body) {
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body->c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
    }

    if (!proxy.empty())
        curl_easy_setopt(h, CURLOPT_PROXY, proxy.c_str());

    curl_slist* raw = nullptr;
    for (const auto& [name, value] : request.headers) {
        if (Utils::Text::to_lower(name) == "user-agent") {
            curl_easy_setopt(h, CURLOPT_USERAGENT, value.c_str());
            continue;
        }
        raw = curl_slist_append(raw, (name + ": " + value).c_str());
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw);
    if (raw)
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, raw);

    CURLcode code = curl_easy_perform(h);
    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (code != CURLE_OK) {
        response.error      = curl_easy_strerror(code);
        response.error_type = map_curl_code_to_error_type(code, !proxy.empty());
        response.body.clear();
        return response;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.content_type = response.header("content-type");
    return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Vortex
