#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "http_client.hpp"

namespace Vortex {
namespace Network {
namespace Http {

/**
 * @brief libcurl transport.
 *
 * curl_easy_perform blocks, so each exchange runs on a private thread pool and
 * the coroutine resumes on its original executor afterwards.
 */
class CurlClient : public HttpClient {
public:
    explicit CurlClient(size_t threads = 4);
    ~CurlClient() override;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    boost::asio::awaitable<Core::Response> fetch(const Core::Request& request,
                                                 const std::string&   proxy) override;

private:
    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };
    struct CurlSlistDeleter {
        void operator()(curl_slist* list) const noexcept {
            curl_slist_free_all(list);
        }
    };

    boost::asio::thread_pool pool_;

    Core::Response perform(const Core::Request& request, const std::string& proxy) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Vortex
