#include "trellis/resource_store.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace trellis {

StoreSyncResult sync_from_store(ResourceStore& store, ResourceCache& cache) {
    StoreSyncResult result;

    auto listed = store.list();
    if (!listed.ok) {
        result.error = listed.error.empty() ? "resource store unavailable" : listed.error;
        spdlog::warn("resource store list failed: {}", result.error);
        cache.set_synced(false);
        return result;
    }

    result.documents = listed.documents.size();
    cache.replace_all(std::move(listed.documents));
    cache.set_synced(true);

    spdlog::debug("synced {} documents from resource store", result.documents);
    result.ok = true;
    return result;
}

bool apply_store_event(const StoreEvent& event, ResourceCache& cache) {
    spdlog::debug("store event {} {} {}", store_event_type_to_string(event.type),
                  kind_to_string(event.document.key.kind), event.document.key.to_string());

    switch (event.type) {
        case StoreEventType::Added:
        case StoreEventType::Modified:
            return cache.put(event.document);
        case StoreEventType::Deleted:
            return cache.remove(event.document.key);
    }
    return false;
}

// ============================================================================
// MemoryResourceStore
// ============================================================================

MemoryResourceStore::MemoryResourceStore(std::vector<Document> documents)
    : documents_(std::move(documents)) {}

StoreListResult MemoryResourceStore::list() {
    std::lock_guard<std::mutex> lock(mu_);
    StoreListResult result;
    if (!available_) {
        result.error = "resource store unavailable";
        return result;
    }
    result.documents = documents_;
    result.ok = true;
    return result;
}

void MemoryResourceStore::set_documents(std::vector<Document> documents) {
    std::lock_guard<std::mutex> lock(mu_);
    documents_ = std::move(documents);
}

void MemoryResourceStore::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mu_);
    available_ = available;
}

} // namespace trellis
