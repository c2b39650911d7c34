#include "trellis/status_sink.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace trellis {

// ============================================================================
// MemoryStatusSink
// ============================================================================

SinkResult MemoryStatusSink::upsert(const ResourceKey& key, const StatusRecord& record) {
    SinkResult result;
    std::lock_guard<std::mutex> lock(mu_);
    if (failures_ > 0) {
        --failures_;
        result.error = "status sink unavailable";
        return result;
    }
    records_[key] = record;
    ++counts_[key];
    ++total_;
    result.ok = true;
    return result;
}

void MemoryStatusSink::fail_next(std::size_t count) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_ = count;
}

std::map<ResourceKey, StatusRecord> MemoryStatusSink::records() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_;
}

std::size_t MemoryStatusSink::upsert_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return total_;
}

std::size_t MemoryStatusSink::upsert_count(const ResourceKey& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counts_.find(key);
    return it == counts_.end() ? 0 : it->second;
}

// ============================================================================
// StatusWriter
// ============================================================================

StatusWriter::StatusWriter(StatusSink& sink, std::chrono::milliseconds initial_backoff,
                           std::chrono::milliseconds max_backoff)
    : sink_(sink), initial_backoff_(initial_backoff), max_backoff_(max_backoff) {
    worker_ = std::thread([this]() { run(); });
}

StatusWriter::~StatusWriter() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void StatusWriter::submit(const std::vector<StatusRecord>& records) {
    if (records.empty()) return;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& record : records) {
            pending_[record.key] = record;
        }
    }
    cv_.notify_all();
}

bool StatusWriter::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return pending_.empty() && !in_flight_; });
}

std::size_t StatusWriter::pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
}

void StatusWriter::run() {
    auto backoff = initial_backoff_;

    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        cv_.wait(lock, [this]() { return stop_ || !pending_.empty(); });
        if (stop_) break;

        auto it = pending_.begin();
        ResourceKey key = it->first;
        StatusRecord record = std::move(it->second);
        pending_.erase(it);
        in_flight_ = true;

        lock.unlock();
        auto result = sink_.upsert(key, record);
        lock.lock();
        in_flight_ = false;

        if (result.ok) {
            backoff = initial_backoff_;
            cv_.notify_all();
            continue;
        }

        spdlog::warn("status write for {} {} failed, retrying in {}ms: {}", kind_to_string(key.kind),
                     key.to_string(), backoff.count(), result.error);

        // A newer record submitted meanwhile replaces the failed one
        pending_.emplace(key, std::move(record));

        if (cv_.wait_for(lock, backoff, [this]() { return stop_; })) break;
        backoff = std::min(backoff * 2, max_backoff_);
    }
}

} // namespace trellis
