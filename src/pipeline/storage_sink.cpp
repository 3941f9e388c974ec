#include "storage_sink.hpp"
#include "../utils/url/url.hpp"

namespace Vortex {
namespace Pipeline {

StorageSink::StorageSink(std::shared_ptr<Storage::Storage> storage, bool tree_structure)
    : storage_(std::move(storage)), tree_structure_(tree_structure) {
}

std::string StorageSink::key_for(const Core::Record& record) const {
    const std::string& url = record.source_url();
    return tree_structure_ ? Utils::Url::to_filename(url) : Utils::Url::to_flat_filename(url);
}

void StorageSink::accept(const Core::Record& record) {
    storage_->save(key_for(record), record.to_json().dump(2) + "\n");
}

}  // namespace Pipeline
}  // namespace Vortex
