#pragma once
#include <stdexcept>
#include <string>

namespace Vortex {
namespace Core {

// Startup-time misconfiguration: bad option value, bad rule pattern, empty seed set.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {
    }
};

}  // namespace Core
}  // namespace Vortex
