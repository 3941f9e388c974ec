#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"

namespace Vortex {
namespace Storage {

namespace fs = std::filesystem;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (base_path_.empty())
        return;

    std::error_code ec;
    fs::create_directories(base_path_, ec);
    if (ec)
        throw StorageError("Failed to create storage directory " + base_path_ + ": " + ec.message());
}

void DiskStorage::save(const std::string& key, const std::string& content) {
    fs::path path(base_path_);
    path /= key;

    // Keys come from URLs; refuse anything that climbs out of the base directory.
    fs::path normal = path.lexically_normal();
    fs::path base   = fs::path(base_path_).lexically_normal();
    auto     rel    = normal.lexically_relative(base);
    if (!base_path_.empty() && (rel.empty() || *rel.begin() == ".."))
        throw StorageError("Key escapes storage directory: " + key);

    std::error_code ec;
    if (normal.has_parent_path())
        fs::create_directories(normal.parent_path(), ec);
    if (ec)
        throw StorageError("FS Error: " + ec.message() + " (" + normal.string() + ")");

    std::ofstream file(normal, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        throw StorageError("Write Error: " + normal.string());

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file)
        throw StorageError("Write Error: " + normal.string());

    Core::Logger::debug("Saved: " + normal.string());
}

}  // namespace Storage
}  // namespace Vortex
