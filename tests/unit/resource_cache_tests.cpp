#include <doctest/doctest.h>
#include <trellis/resource_cache.hpp>
#include <trellis/resource_store.hpp>

#include "fixtures.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace trellis;
using namespace trellis::test;

TEST_CASE("ResourceCache put and find") {
    ResourceCache cache;
    CHECK(cache.revision() == 0);

    CHECK(cache.put(http_service("ns", "svc")));
    CHECK(cache.revision() == 1);
    CHECK(cache.size() == 1);

    auto snap = cache.snapshot();
    const Document* doc = snap->find(Kind::Service, "ns", "svc");
    REQUIRE(doc != nullptr);
    CHECK(doc->revision == 1);
    CHECK(snap->find(Kind::Proxy, "ns", "svc") == nullptr);
}

TEST_CASE("putting the same revision again is a no-op") {
    ResourceCache cache;
    auto doc = http_service("ns", "svc");
    doc.revision = 7;

    CHECK(cache.put(doc));
    CHECK_FALSE(cache.put(doc));
    CHECK(cache.revision() == 1);

    doc.revision = 8;
    CHECK(cache.put(doc));
    CHECK(cache.revision() == 2);
}

TEST_CASE("documents without a revision always count as changed") {
    ResourceCache cache;
    CHECK(cache.put(http_service("ns", "svc")));
    CHECK(cache.put(http_service("ns", "svc")));
    CHECK(cache.revision() == 2);
}

TEST_CASE("ResourceCache remove") {
    ResourceCache cache;
    cache.put(http_service("ns", "svc"));
    ResourceKey key{Kind::Service, "ns", "svc"};

    CHECK(cache.remove(key));
    CHECK_FALSE(cache.remove(key));
    CHECK(cache.size() == 0);
    CHECK(cache.revision() == 2);
}

TEST_CASE("snapshots are immutable and shared until the next change") {
    ResourceCache cache;
    cache.put(http_service("ns", "a"));

    auto first = cache.snapshot();
    CHECK(cache.snapshot() == first);

    cache.put(http_service("ns", "b"));
    auto second = cache.snapshot();
    CHECK(second != first);
    CHECK(first->size() == 1);
    CHECK(second->size() == 2);
    CHECK(first->revision() == 1);
    CHECK(second->revision() == 2);
}

TEST_CASE("of_kind returns one kind in key order") {
    ResourceCache cache;
    cache.replace_all({
        http_service("ns", "b"),
        delegate_proxy("ns", "p", {}),
        http_service("ns", "a"),
        http_service("other", "a"),
    });

    auto services = cache.snapshot()->of_kind(Kind::Service);
    REQUIRE(services.size() == 3);
    CHECK(services[0]->key.to_string() == "ns/a");
    CHECK(services[1]->key.to_string() == "ns/b");
    CHECK(services[2]->key.to_string() == "other/a");
    CHECK(cache.snapshot()->of_kind(Kind::Gateway).empty());
}

TEST_CASE("replace_all drops documents missing from the new set") {
    ResourceCache cache;
    cache.put(http_service("ns", "old"));
    cache.replace_all({http_service("ns", "new")});

    auto snap = cache.snapshot();
    CHECK(snap->size() == 1);
    CHECK(snap->find(Kind::Service, "ns", "old") == nullptr);
    CHECK(snap->find(Kind::Service, "ns", "new")->revision == 2);
}

TEST_CASE("the change listener fires once per effective change") {
    ResourceCache cache;
    int fired = 0;
    cache.set_change_listener([&] { ++fired; });

    auto doc = http_service("ns", "svc");
    doc.revision = 3;
    cache.put(doc);
    cache.put(doc);
    cache.remove(ResourceKey{Kind::Service, "ns", "missing"});
    CHECK(fired == 1);

    cache.set_synced(false);
    cache.set_synced(false);
    CHECK(fired == 2);
    CHECK_FALSE(cache.snapshot()->synced());
}

TEST_CASE("replacing the change listener waits for running calls") {
    using namespace std::chrono_literals;
    ResourceCache cache;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    cache.set_change_listener([&] {
        entered = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    std::thread writer([&] { cache.put(http_service("ns", "svc")); });
    while (!entered) {
        std::this_thread::sleep_for(1ms);
    }
    cache.set_change_listener(nullptr);
    CHECK(finished);
    writer.join();

    // No listener installed: later changes call nothing
    CHECK(cache.put(http_service("ns", "other")));
}

TEST_CASE("sync_from_store fills the cache and marks it synced") {
    MemoryResourceStore store({http_service("ns", "a"), http_service("ns", "b")});
    ResourceCache cache;
    cache.set_synced(false);

    auto result = sync_from_store(store, cache);
    CHECK(result.ok);
    CHECK(result.documents == 2);
    CHECK(cache.synced());
    CHECK(cache.size() == 2);
}

TEST_CASE("a failed sync keeps the cache contents but marks it unsynced") {
    MemoryResourceStore store({http_service("ns", "a")});
    ResourceCache cache;
    REQUIRE(sync_from_store(store, cache).ok);

    store.set_available(false);
    store.set_documents({});
    auto result = sync_from_store(store, cache);
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
    CHECK_FALSE(cache.synced());
    CHECK(cache.size() == 1);
}

TEST_CASE("apply_store_event") {
    ResourceCache cache;

    StoreEvent added;
    added.type = StoreEventType::Added;
    added.document = http_service("ns", "svc");
    CHECK(apply_store_event(added, cache));
    CHECK(cache.size() == 1);

    StoreEvent deleted;
    deleted.type = StoreEventType::Deleted;
    deleted.document.key = ResourceKey{Kind::Service, "ns", "svc"};
    CHECK(apply_store_event(deleted, cache));
    CHECK_FALSE(apply_store_event(deleted, cache));
    CHECK(cache.size() == 0);
}
