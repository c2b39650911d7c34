#include "trellis/rebuild_loop.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace trellis {

RebuildLoop::RebuildLoop(ResourceCache& cache, Builder builder, StatusSink* sink,
                         SnapshotConsumer* consumer)
    : cache_(cache), builder_(std::move(builder)), consumer_(consumer),
      graph_(std::make_shared<const Graph>()) {
    if (sink) {
        const auto& config = builder_.config();
        writer_ = std::make_unique<StatusWriter>(*sink,
                                                 std::chrono::milliseconds(config.retry_initial_backoff_ms),
                                                 std::chrono::milliseconds(config.retry_max_backoff_ms));
    }
}

RebuildLoop::~RebuildLoop() {
    stop();
}

void RebuildLoop::start() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (running_) return;
        running_ = true;
        stop_ = false;
        dirty_ = true;
        last_signal_ = std::chrono::steady_clock::now();
    }
    cache_.set_change_listener([this]() { notify(); });
    worker_ = std::thread([this]() { run(); });
}

void RebuildLoop::stop() {
    std::thread to_join;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        running_ = false;
        stop_ = true;
        to_join = std::move(worker_);
    }
    cache_.set_change_listener(nullptr);
    cv_.notify_all();
    if (to_join.joinable()) {
        to_join.join();
    }
}

void RebuildLoop::notify() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        dirty_ = true;
        last_signal_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
}

std::shared_ptr<const Graph> RebuildLoop::current() const {
    return std::atomic_load(&graph_);
}

uint64_t RebuildLoop::generation() const {
    std::lock_guard<std::mutex> lock(mu_);
    return generation_;
}

bool RebuildLoop::wait_for_generation(uint64_t generation, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this, generation]() { return generation_ >= generation; });
}

uint64_t RebuildLoop::attempts() const {
    std::lock_guard<std::mutex> lock(mu_);
    return attempts_;
}

bool RebuildLoop::wait_status_idle(std::chrono::milliseconds timeout) {
    if (!writer_) return true;
    return writer_->wait_idle(timeout);
}

void RebuildLoop::run() {
    const auto& config = builder_.config();
    const auto delay = std::chrono::milliseconds(config.holdoff_delay_ms);
    const auto max_delay = std::chrono::milliseconds(config.holdoff_max_delay_ms);
    const auto initial_backoff = std::chrono::milliseconds(config.retry_initial_backoff_ms);
    const auto max_backoff = std::chrono::milliseconds(config.retry_max_backoff_ms);
    auto backoff = initial_backoff;

    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        cv_.wait(lock, [this]() { return stop_ || dirty_; });
        if (stop_) break;

        auto deadline = std::min(last_signal_ + delay, last_rebuild_ + max_delay);
        if (cv_.wait_until(lock, deadline, [this]() { return stop_; })) break;

        // Signals during the wait move the deadline
        if (std::chrono::steady_clock::now() < std::min(last_signal_ + delay, last_rebuild_ + max_delay)) {
            continue;
        }

        dirty_ = false;
        ++attempts_;
        lock.unlock();
        bool built = rebuild_once();
        lock.lock();
        last_rebuild_ = std::chrono::steady_clock::now();

        if (built) {
            backoff = initial_backoff;
            continue;
        }

        dirty_ = true;
        if (cv_.wait_for(lock, backoff, [this]() { return stop_; })) break;
        backoff = std::min(backoff * 2, max_backoff);
    }
}

bool RebuildLoop::rebuild_once() {
    auto snapshot = cache_.snapshot();
    if (!snapshot->synced()) {
        spdlog::warn("resource cache is not synced, keeping the published graph");
        return false;
    }

    auto result = builder_.build(*snapshot);
    std::atomic_store(&graph_, result.graph);

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        generation = ++generation_;
    }
    cv_.notify_all();

    spdlog::info("published graph {} from revision {}: {} listeners, {} routes, {} clusters", generation,
                 result.graph->source_revision, result.graph->listeners.size(), result.graph->route_count(),
                 result.graph->clusters.size());

    if (consumer_) {
        auto consumed = consumer_->on_change(result.graph);
        if (!consumed.ok) {
            spdlog::error("snapshot consumer failed for graph {}: {}", generation, consumed.error);
        }
    }

    std::vector<StatusRecord> changed;
    std::map<ResourceKey, StatusRecord> current;
    for (auto& record : result.statuses) {
        auto it = last_status_.find(record.key);
        if (it == last_status_.end() || it->second != record) {
            changed.push_back(record);
        }
        current.emplace(record.key, std::move(record));
    }
    last_status_ = std::move(current);

    if (!changed.empty()) {
        spdlog::debug("{} status records changed", changed.size());
        if (writer_) {
            writer_->submit(changed);
        }
    }
    return true;
}

} // namespace trellis
