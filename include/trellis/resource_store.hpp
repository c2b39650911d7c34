#pragma once

#include "trellis/resource_cache.hpp"
#include "trellis/resources.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace trellis {

// ============================================================================
// Resource Store (external document store)
// ============================================================================

struct StoreListResult {
    bool ok = false;
    std::string error;
    std::vector<Document> documents;
};

enum class StoreEventType {
    Added,
    Modified,
    Deleted
};

inline const char* store_event_type_to_string(StoreEventType t) {
    switch (t) {
        case StoreEventType::Added: return "added";
        case StoreEventType::Modified: return "modified";
        case StoreEventType::Deleted: return "deleted";
        default: return "modified";
    }
}

struct StoreEvent {
    StoreEventType type = StoreEventType::Modified;
    Document document;  // only the key is meaningful for Deleted
};

class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    // Full listing of every relevant document
    virtual StoreListResult list() = 0;
};

struct StoreSyncResult {
    bool ok = false;
    std::string error;
    std::size_t documents = 0;
};

// Replace the cache contents with the store listing and mark it synced.
// On failure the cache is marked unsynced and keeps its contents.
StoreSyncResult sync_from_store(ResourceStore& store, ResourceCache& cache);

// Apply one watch event to the cache. Returns true if the cache changed.
bool apply_store_event(const StoreEvent& event, ResourceCache& cache);

// ============================================================================
// In-memory store
// ============================================================================

// Store backed by a vector. Used by the CLI (documents loaded from files)
// and by tests, which can toggle availability.
class MemoryResourceStore : public ResourceStore {
public:
    MemoryResourceStore() = default;
    explicit MemoryResourceStore(std::vector<Document> documents);

    StoreListResult list() override;

    void set_documents(std::vector<Document> documents);
    void set_available(bool available);

private:
    std::mutex mu_;
    std::vector<Document> documents_;
    bool available_ = true;
};

} // namespace trellis
