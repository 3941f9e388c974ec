#pragma once
#include <string>
#include "storage.hpp"

namespace Vortex {
namespace Storage {

// Writes each key as a file under base_path, creating parent directories.
class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    void save(const std::string& key, const std::string& content) override;

    const std::string& base_path() const {
        return base_path_;
    }

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Vortex
