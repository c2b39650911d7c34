#pragma once

#include "trellis/builder.hpp"
#include "trellis/graph.hpp"
#include "trellis/resource_cache.hpp"
#include "trellis/status_sink.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace trellis {

// ============================================================================
// Snapshot Consumer (data plane)
// ============================================================================

// Told about every published graph. A failure is logged and never rolls
// back the publication.
class SnapshotConsumer {
public:
    virtual ~SnapshotConsumer() = default;

    virtual SinkResult on_change(std::shared_ptr<const Graph> graph) = 0;
};

// ============================================================================
// Rebuild Loop
// ============================================================================

// Watches a cache and rebuilds the graph on a worker thread.
//
// Change signals only set a dirty flag. A rebuild runs holdoff_delay after
// the last signal but no later than holdoff_max_delay after the previous
// rebuild. While the cache is unsynced the rebuild is retried with
// exponential backoff and the previous graph stays published. Status
// records that changed since the last build go to the status writer.
class RebuildLoop {
public:
    RebuildLoop(ResourceCache& cache, Builder builder, StatusSink* sink = nullptr,
                SnapshotConsumer* consumer = nullptr);
    ~RebuildLoop();

    RebuildLoop(const RebuildLoop&) = delete;
    RebuildLoop& operator=(const RebuildLoop&) = delete;

    // Hooks the cache change listener and schedules the first build
    void start();
    void stop();

    // Record a change signal; never waits for a rebuild
    void notify();

    // Latest published graph; an empty graph before the first build
    std::shared_ptr<const Graph> current() const;

    // Number of published graphs
    uint64_t generation() const;
    bool wait_for_generation(uint64_t generation, std::chrono::milliseconds timeout) const;

    // Rebuild attempts, including those skipped for an unsynced cache
    uint64_t attempts() const;

    // Wait until the status writer has delivered everything queued
    bool wait_status_idle(std::chrono::milliseconds timeout);

private:
    void run();
    bool rebuild_once();

    ResourceCache& cache_;
    Builder builder_;
    SnapshotConsumer* consumer_ = nullptr;
    std::unique_ptr<StatusWriter> writer_;

    std::shared_ptr<const Graph> graph_;
    std::map<ResourceKey, StatusRecord> last_status_;  // worker thread only

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool dirty_ = false;
    bool stop_ = false;
    bool running_ = false;
    uint64_t generation_ = 0;
    uint64_t attempts_ = 0;
    std::chrono::steady_clock::time_point last_signal_;
    std::chrono::steady_clock::time_point last_rebuild_;
    std::thread worker_;
};

} // namespace trellis
