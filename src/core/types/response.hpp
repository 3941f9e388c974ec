#pragma once
#include <chrono>
#include <string>

#include "request.hpp"

namespace Vortex {
namespace Core {

enum class TransportError { None, Network, Proxy, Timeout, Cancelled, Other };

enum class FetchStatus { Ok, ClientError, ServerError, Timeout, NetworkError };

struct Response {
    std::string               effective_url;
    long                      status_code = 0;
    std::string               content_type;
    Headers                   headers;  // names lower-cased by the transport
    std::string               body;
    std::string               error;
    TransportError            error_type = TransportError::None;
    std::chrono::milliseconds elapsed{0};
    Request                   request;
    FetchStatus               status = FetchStatus::NetworkError;

    std::string header(const std::string& name) const;
    std::string url() const {
        return effective_url.empty() ? request.url : effective_url;
    }
    bool ok() const {
        return status == FetchStatus::Ok;
    }
    bool is_redirect() const {
        return status_code >= 300 && status_code < 400;
    }
};

FetchStatus classify(const Response& response);
bool        is_retryable(FetchStatus status);
bool        is_failure(FetchStatus status);
const char* to_string(FetchStatus status);
const char* to_string(TransportError error);

}  // namespace Core
}  // namespace Vortex
