#include <doctest/doctest.h>
#include <trellis/rebuild_loop.hpp>
#include <trellis/resource_store.hpp>

#include "../unit/fixtures.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace trellis;
using namespace trellis::test;
using namespace std::chrono_literals;

namespace {

BuilderConfig fast_config() {
    auto config = get_default_builder_config();
    config.holdoff_delay_ms = 10;
    config.holdoff_max_delay_ms = 50;
    config.retry_initial_backoff_ms = 5;
    config.retry_max_backoff_ms = 50;
    return config;
}

std::vector<Document> site(const std::string& service = "app") {
    return {
        root_proxy("web", "root", "example.com", {route_to(service, 80)}),
        http_service("web", "app"),
    };
}

const ResourceKey kRootKey{Kind::Proxy, "web", "root"};

// Status records are submitted after the generation is bumped
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

class RecordingConsumer : public SnapshotConsumer {
public:
    explicit RecordingConsumer(bool fail) : fail_(fail) {}

    SinkResult on_change(std::shared_ptr<const Graph> graph) override {
        std::atomic_store(&last_, graph);
        ++calls;
        SinkResult result;
        result.ok = !fail_;
        if (fail_) result.error = "data plane unavailable";
        return result;
    }

    std::shared_ptr<const Graph> last() const { return std::atomic_load(&last_); }

    std::atomic<int> calls{0};

private:
    bool fail_;
    std::shared_ptr<const Graph> last_;
};

} // namespace

TEST_CASE("the loop publishes a graph once started") {
    ResourceCache cache;
    cache.replace_all(site());

    RebuildLoop loop(cache, Builder(fast_config()));
    CHECK(loop.generation() == 0);
    CHECK(loop.current()->listeners.empty());

    loop.start();
    REQUIRE(loop.wait_for_generation(1, 2s));

    auto graph = loop.current();
    REQUIRE(graph->find_virtual_host("http-80", "example.com") != nullptr);
    CHECK(graph->source_revision == cache.revision());
    loop.stop();
}

TEST_CASE("a burst of changes is coalesced into one rebuild") {
    auto config = fast_config();
    config.holdoff_delay_ms = 300;
    config.holdoff_max_delay_ms = 5000;

    ResourceCache cache;
    cache.replace_all({http_service("web", "app")});

    RebuildLoop loop(cache, Builder(config));
    loop.start();
    REQUIRE(loop.wait_for_generation(1, 2s));
    CHECK(loop.current()->route_count() == 0);

    cache.put(root_proxy("web", "a", "a.example.com", {route_to("app", 80)}));
    cache.put(root_proxy("web", "b", "b.example.com", {route_to("app", 80)}));
    cache.put(root_proxy("web", "c", "c.example.com", {route_to("app", 80)}));

    REQUIRE(loop.wait_for_generation(2, 3s));
    CHECK(loop.current()->route_count() == 3);

    std::this_thread::sleep_for(600ms);
    CHECK(loop.generation() == 2);
    loop.stop();
}

TEST_CASE("an unsynced cache keeps the published graph") {
    MemoryResourceStore store(site());
    ResourceCache cache;
    REQUIRE(sync_from_store(store, cache).ok);

    RebuildLoop loop(cache, Builder(fast_config()));
    loop.start();
    REQUIRE(loop.wait_for_generation(1, 2s));
    auto published = loop.current();

    SUBCASE("marked unsynced directly") {
        cache.set_synced(false);
        std::this_thread::sleep_for(200ms);

        CHECK(loop.generation() == 1);
        CHECK(loop.attempts() > 2);
        CHECK(loop.current() == published);

        cache.set_synced(true);
        REQUIRE(loop.wait_for_generation(2, 2s));
    }

    SUBCASE("store listing fails") {
        store.set_available(false);
        auto failed = sync_from_store(store, cache);
        CHECK_FALSE(failed.ok);
        CHECK_FALSE(cache.synced());

        std::this_thread::sleep_for(200ms);
        CHECK(loop.generation() == 1);
        CHECK(loop.current() == published);

        store.set_available(true);
        store.set_documents(site());
        REQUIRE(sync_from_store(store, cache).ok);
        REQUIRE(loop.wait_for_generation(2, 2s));
        CHECK(loop.current()->find_virtual_host("http-80", "example.com") != nullptr);
    }

    loop.stop();
}

TEST_CASE("only changed status records are written again") {
    MemoryStatusSink sink;
    ResourceCache cache;
    cache.replace_all(site());

    RebuildLoop loop(cache, Builder(fast_config()), &sink);
    loop.start();
    REQUIRE(loop.wait_for_generation(1, 2s));
    REQUIRE(eventually([&]() { return sink.upsert_count(kRootKey) == 1; }));
    CHECK(sink.records().at(kRootKey).verdict == Verdict::Valid);

    // An unrelated service does not change the root's record
    cache.put(http_service("web", "unused"));
    REQUIRE(loop.wait_for_generation(2, 2s));
    std::this_thread::sleep_for(50ms);
    REQUIRE(loop.wait_status_idle(2s));
    CHECK(sink.upsert_count(kRootKey) == 1);

    cache.put(root_proxy("web", "root", "example.com", {route_to("missing", 80)}));
    REQUIRE(loop.wait_for_generation(3, 2s));
    REQUIRE(eventually([&]() { return sink.upsert_count(kRootKey) == 2; }));
    CHECK(sink.records().at(kRootKey).verdict == Verdict::Invalid);

    loop.stop();
}

TEST_CASE("status writes are retried until the sink accepts them") {
    MemoryStatusSink sink;
    sink.fail_next(3);

    ResourceCache cache;
    cache.replace_all(site());

    RebuildLoop loop(cache, Builder(fast_config()), &sink);
    loop.start();
    REQUIRE(loop.wait_for_generation(1, 2s));
    REQUIRE(eventually([&]() { return sink.upsert_count(kRootKey) == 1; }, 5s));
    REQUIRE(loop.wait_status_idle(5s));
    CHECK(sink.upsert_count() == 1);
    loop.stop();
}

TEST_CASE("the snapshot consumer sees every published graph") {
    ResourceCache cache;
    cache.replace_all(site());

    SUBCASE("healthy consumer") {
        RecordingConsumer consumer(false);
        RebuildLoop loop(cache, Builder(fast_config()), nullptr, &consumer);
        loop.start();
        REQUIRE(loop.wait_for_generation(1, 2s));
        loop.stop();

        CHECK(consumer.calls.load() == 1);
        CHECK(consumer.last() == loop.current());
    }

    SUBCASE("a failing consumer does not roll back the publication") {
        RecordingConsumer consumer(true);
        RebuildLoop loop(cache, Builder(fast_config()), nullptr, &consumer);
        loop.start();
        REQUIRE(loop.wait_for_generation(1, 2s));

        cache.put(http_service("web", "extra"));
        REQUIRE(loop.wait_for_generation(2, 2s));
        loop.stop();

        CHECK(consumer.calls.load() == 2);
        CHECK(loop.current() == consumer.last());
        CHECK(loop.current()->route_count() == 1);
    }
}

TEST_CASE("notify schedules a rebuild and stop ends the loop") {
    ResourceCache cache;
    cache.replace_all(site());

    RebuildLoop loop(cache, Builder(fast_config()));
    loop.start();
    REQUIRE(loop.wait_for_generation(1, 2s));

    loop.notify();
    REQUIRE(loop.wait_for_generation(2, 2s));

    loop.stop();
    cache.put(http_service("web", "later"));
    loop.notify();
    std::this_thread::sleep_for(100ms);
    CHECK(loop.generation() == 2);

    // Stopping twice is harmless
    loop.stop();
}

TEST_CASE("a loop can be destroyed while the cache is being written") {
    ResourceCache cache;
    cache.replace_all(site());

    std::atomic<bool> writing{true};
    std::thread writer([&] {
        int n = 0;
        while (writing) {
            cache.put(http_service("web", "churn-" + std::to_string(n++ % 8)));
        }
    });

    for (int i = 0; i < 20; ++i) {
        RebuildLoop loop(cache, Builder(fast_config()));
        loop.start();
        std::this_thread::sleep_for(2ms);
    }

    writing = false;
    writer.join();

    RebuildLoop loop(cache, Builder(fast_config()));
    loop.start();
    CHECK(loop.wait_for_generation(1, 2s));
}
