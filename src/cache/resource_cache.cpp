#include "trellis/resource_cache.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace trellis {

// ============================================================================
// CacheSnapshot
// ============================================================================

CacheSnapshot::CacheSnapshot(DocumentMap documents, uint64_t revision, bool synced)
    : documents_(std::move(documents)), revision_(revision), synced_(synced) {}

const Document* CacheSnapshot::find(const ResourceKey& key) const {
    auto it = documents_.find(key);
    if (it == documents_.end()) {
        return nullptr;
    }
    return it->second.get();
}

const Document* CacheSnapshot::find(Kind kind, const std::string& ns, const std::string& name) const {
    ResourceKey key;
    key.kind = kind;
    key.ns = ns;
    key.name = name;
    return find(key);
}

std::vector<const Document*> CacheSnapshot::of_kind(Kind kind) const {
    std::vector<const Document*> result;

    // Keys order by kind first, so one kind is a contiguous range
    ResourceKey lower;
    lower.kind = kind;
    for (auto it = documents_.lower_bound(lower); it != documents_.end(); ++it) {
        if (it->first.kind != kind) break;
        result.push_back(it->second.get());
    }
    return result;
}

// ============================================================================
// ResourceCache
// ============================================================================

bool ResourceCache::put(Document doc) {
    {
        std::lock_guard<std::mutex> lock(mu_);

        auto it = documents_.find(doc.key);
        if (it != documents_.end() && doc.revision != 0 &&
            it->second->revision == doc.revision) {
            return false;
        }

        ++revision_;
        if (doc.revision == 0) {
            doc.revision = revision_;
        }
        ResourceKey key = doc.key;
        documents_[key] = std::make_shared<const Document>(std::move(doc));
        snapshot_.reset();
    }

    notify();
    return true;
}

bool ResourceCache::remove(const ResourceKey& key) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (documents_.erase(key) == 0) {
            return false;
        }
        ++revision_;
        snapshot_.reset();
    }

    notify();
    return true;
}

void ResourceCache::replace_all(std::vector<Document> docs) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        ++revision_;
        documents_.clear();
        for (auto& doc : docs) {
            if (doc.revision == 0) {
                doc.revision = revision_;
            }
            ResourceKey key = doc.key;
            documents_[key] = std::make_shared<const Document>(std::move(doc));
        }
        snapshot_.reset();
    }

    notify();
}

std::shared_ptr<const CacheSnapshot> ResourceCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!snapshot_) {
        snapshot_ = std::make_shared<const CacheSnapshot>(documents_, revision_, synced_);
    }
    return snapshot_;
}

void ResourceCache::set_synced(bool synced) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (synced_ == synced) {
            return;
        }
        synced_ = synced;
        snapshot_.reset();
    }

    spdlog::debug("resource cache synced={}", synced);
    notify();
}

bool ResourceCache::synced() const {
    std::lock_guard<std::mutex> lock(mu_);
    return synced_;
}

uint64_t ResourceCache::revision() const {
    std::lock_guard<std::mutex> lock(mu_);
    return revision_;
}

std::size_t ResourceCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return documents_.size();
}

void ResourceCache::set_change_listener(ChangeListener listener) {
    std::unique_lock<std::mutex> lock(mu_);
    listener_ = std::move(listener);
    // Calls that copied the previous listener finish before we return
    listener_idle_.wait(lock, [this]() { return listener_calls_ == 0; });
}

void ResourceCache::notify() {
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!listener_) return;
        listener = listener_;
        ++listener_calls_;
    }

    listener();

    {
        std::lock_guard<std::mutex> lock(mu_);
        --listener_calls_;
    }
    listener_idle_.notify_all();
}

} // namespace trellis
