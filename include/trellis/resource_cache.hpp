#pragma once

#include "trellis/resources.hpp"
#include "trellis/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace trellis {

// ============================================================================
// Cache Snapshot
// ============================================================================

// Immutable point-in-time view of the cache. Documents are shared with the
// cache and never mutated after insertion.
class CacheSnapshot {
public:
    using DocumentMap = std::map<ResourceKey, std::shared_ptr<const Document>>;

    CacheSnapshot() = default;
    CacheSnapshot(DocumentMap documents, uint64_t revision, bool synced);

    uint64_t revision() const { return revision_; }
    bool synced() const { return synced_; }
    std::size_t size() const { return documents_.size(); }

    // nullptr if absent
    const Document* find(const ResourceKey& key) const;
    const Document* find(Kind kind, const std::string& ns, const std::string& name) const;

    // Documents of one kind in key order
    std::vector<const Document*> of_kind(Kind kind) const;

    const DocumentMap& documents() const { return documents_; }

private:
    DocumentMap documents_;
    uint64_t revision_ = 0;
    bool synced_ = true;
};

// ============================================================================
// Resource Cache
// ============================================================================

// Latest known version of every relevant document. Pure storage: no
// validation happens here. Each effective mutation bumps the revision and
// fires the change listener outside the cache lock.
class ResourceCache {
public:
    using ChangeListener = std::function<void()>;

    ResourceCache() = default;

    ResourceCache(const ResourceCache&) = delete;
    ResourceCache& operator=(const ResourceCache&) = delete;

    // Insert or replace a document. A document whose non-zero revision
    // matches the stored one is a no-op. Returns true if the cache changed.
    bool put(Document doc);

    // Returns true if a document was removed
    bool remove(const ResourceKey& key);

    // Replace the whole content (initial list from the store)
    void replace_all(std::vector<Document> docs);

    std::shared_ptr<const CacheSnapshot> snapshot() const;

    // Whether the cache reflects the store. Rebuilds wait for synced.
    void set_synced(bool synced);
    bool synced() const;

    uint64_t revision() const;
    std::size_t size() const;

    // Called after each change; must not block or call back into the
    // cache. Returns once no call to the previous listener is running.
    void set_change_listener(ChangeListener listener);

private:
    void notify();

    mutable std::mutex mu_;
    CacheSnapshot::DocumentMap documents_;
    uint64_t revision_ = 0;
    bool synced_ = true;
    mutable std::shared_ptr<const CacheSnapshot> snapshot_;
    ChangeListener listener_;
    std::size_t listener_calls_ = 0;
    std::condition_variable listener_idle_;
};

} // namespace trellis
