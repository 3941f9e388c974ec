#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "../storage/storage.hpp"
#include "sink.hpp"

namespace Vortex {
namespace Pipeline {

/**
 * @brief Persists every record as a pretty-printed JSON document.
 *
 * Keys mirror the source URL, either as a directory tree
 * (host/path/page.json) or flattened (host_path_page.json).
 */
class StorageSink : public Sink {
public:
    StorageSink(std::shared_ptr<Storage::Storage> storage, bool tree_structure);

    std::string name() const override {
        return "storage";
    }
    void accept(const Core::Record& record) override;

    std::string key_for(const Core::Record& record) const;

private:
    std::shared_ptr<Storage::Storage> storage_;
    bool                              tree_structure_;
};

}  // namespace Pipeline
}  // namespace Vortex
