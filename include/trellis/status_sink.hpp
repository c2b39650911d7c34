#pragma once

#include "trellis/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace trellis {

// ============================================================================
// Status Sink (external status store)
// ============================================================================

struct SinkResult {
    bool ok = false;
    std::string error;
};

// Receives status records. Upserts must be idempotent: the same record may
// be written more than once after a retry.
class StatusSink {
public:
    virtual ~StatusSink() = default;

    virtual SinkResult upsert(const ResourceKey& key, const StatusRecord& record) = 0;
};

// Thread-safe in-memory sink for tools and tests. Failures can be injected.
class MemoryStatusSink : public StatusSink {
public:
    SinkResult upsert(const ResourceKey& key, const StatusRecord& record) override;

    // Fail the next 'count' upserts
    void fail_next(std::size_t count);

    std::map<ResourceKey, StatusRecord> records() const;
    std::size_t upsert_count() const;
    std::size_t upsert_count(const ResourceKey& key) const;

private:
    mutable std::mutex mu_;
    std::map<ResourceKey, StatusRecord> records_;
    std::map<ResourceKey, std::size_t> counts_;
    std::size_t total_ = 0;
    std::size_t failures_ = 0;
};

// ============================================================================
// Status Writer
// ============================================================================

// Delivers records to a sink on its own thread. Pending records are
// coalesced per key (latest wins) and failed writes are retried with
// exponential backoff. Submitting never blocks on the sink.
class StatusWriter {
public:
    StatusWriter(StatusSink& sink, std::chrono::milliseconds initial_backoff,
                 std::chrono::milliseconds max_backoff);
    ~StatusWriter();

    StatusWriter(const StatusWriter&) = delete;
    StatusWriter& operator=(const StatusWriter&) = delete;

    void submit(const std::vector<StatusRecord>& records);

    // Wait until nothing is pending or in flight. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    void run();

    StatusSink& sink_;
    std::chrono::milliseconds initial_backoff_;
    std::chrono::milliseconds max_backoff_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::map<ResourceKey, StatusRecord> pending_;
    bool in_flight_ = false;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace trellis
