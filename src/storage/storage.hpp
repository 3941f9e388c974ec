#pragma once
#include <stdexcept>
#include <string>

namespace Vortex {
namespace Storage {

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Storage {
public:
    virtual ~Storage() = default;

    // Throws StorageError when the content cannot be persisted.
    virtual void save(const std::string& key, const std::string& content) = 0;
};

}  // namespace Storage
}  // namespace Vortex
