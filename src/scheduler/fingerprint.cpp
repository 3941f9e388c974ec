#include "fingerprint.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include "../utils/url/url.hpp"

namespace Vortex {
namespace Scheduling {

namespace {

std::string digest_hex(const std::string& data, const EVP_MD* md) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, md, nullptr) != 1)
        throw std::runtime_error("EVP_Digest failed");

    static const char* hex = "0123456789abcdef";
    std::string        out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

}  // namespace

std::string sha1_hex(const std::string& data) {
    return digest_hex(data, EVP_sha1());
}

std::string sha256_hex(const std::string& data) {
    return digest_hex(data, EVP_sha256());
}

std::string fingerprint(const Core::Request& request) {
    std::string key = std::string(Core::to_string(request.method)) + " "
                      + Utils::Url::canonicalize(request.url);
    if (request.body)
        key += " " + sha256_hex(*request.body);
    return sha1_hex(key);
}

bool FingerprintStore::insert(const std::string& fp) {
    return seen_.insert(fp).second;
}

bool FingerprintStore::contains(const std::string& fp) const {
    return seen_.count(fp) > 0;
}

}  // namespace Scheduling
}  // namespace Vortex
