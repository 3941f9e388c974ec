#include "response.hpp"
#include <algorithm>
#include <cctype>

namespace Vortex {
namespace Core {

std::string Response::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    auto it = headers.find(key);
    return it != headers.end() ? it->second : std::string();
}

FetchStatus classify(const Response& response) {
    switch (response.error_type) {
        case TransportError::None: break;
        case TransportError::Timeout:
        case TransportError::Cancelled: return FetchStatus::Timeout;
        default: return FetchStatus::NetworkError;
    }

    long code = response.status_code;
    if (code == 0)
        return FetchStatus::NetworkError;
    if (code >= 500)
        return FetchStatus::ServerError;
    if (code >= 400 || code < 200)
        return FetchStatus::ClientError;
    return FetchStatus::Ok;
}

bool is_retryable(FetchStatus status) {
    return status == FetchStatus::ServerError || status == FetchStatus::Timeout
           || status == FetchStatus::NetworkError;
}

bool is_failure(FetchStatus status) {
    return status != FetchStatus::Ok;
}

const char* to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok: return "Ok";
        case FetchStatus::ClientError: return "ClientError";
        case FetchStatus::ServerError: return "ServerError";
        case FetchStatus::Timeout: return "Timeout";
        case FetchStatus::NetworkError: return "NetworkError";
    }
    return "Unknown";
}

const char* to_string(TransportError error) {
    switch (error) {
        case TransportError::None: return "none";
        case TransportError::Network: return "network";
        case TransportError::Proxy: return "proxy";
        case TransportError::Timeout: return "timeout";
        case TransportError::Cancelled: return "cancelled";
        case TransportError::Other: return "other";
    }
    return "unknown";
}

}  // namespace Core
}  // namespace Vortex
