#pragma once
#include <string>
#include <unordered_set>
#include "../core/types/request.hpp"

namespace Vortex {
namespace Scheduling {

std::string sha1_hex(const std::string& data);
std::string sha256_hex(const std::string& data);

/**
 * @brief Canonical dedup key of a request.
 *
 * SHA-1 of "METHOD canonical-url" with " sha256(body)" appended when a body
 * is present. The URL is canonicalised with Utils::Url::canonicalize, so
 * fragments, default ports, host case and query order do not matter.
 */
std::string fingerprint(const Core::Request& request);

// Exact set of seen fingerprints. Not synchronised; the Scheduler serialises access.
class FingerprintStore {
public:
    // true when the fingerprint was not present before.
    bool   insert(const std::string& fp);
    bool   contains(const std::string& fp) const;
    size_t size() const {
        return seen_.size();
    }
    void clear() {
        seen_.clear();
    }

private:
    std::unordered_set<std::string> seen_;
};

}  // namespace Scheduling
}  // namespace Vortex
