// tests/test_cacheitem.cpp
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "../src/core/CacheItem.hpp"

using Item = CacheItem<std::string, std::string>;
using namespace std::chrono_literals;

TEST(CacheItemTest, CreateInitializesMetadata) {
    auto before = Item::Clock::now();
    auto item = Item::create("key", 250ms, "value");
    auto after = Item::Clock::now();

    EXPECT_EQ(item->key(), "key");
    EXPECT_EQ(item->data(), "value");
    EXPECT_EQ(item->lifeSpan(), 250ms);
    EXPECT_EQ(item->accessCount(), 0);
    EXPECT_GE(item->createdOn(), before);
    EXPECT_LE(item->createdOn(), after);
    EXPECT_EQ(item->accessedOn(), item->createdOn());
}

TEST(CacheItemTest, KeepAliveUpdatesAccessStats) {
    auto item = Item::create("key", 0ms, "value");
    auto created = item->createdOn();

    std::this_thread::sleep_for(5ms);
    item->keepAlive();
    EXPECT_EQ(item->accessCount(), 1);
    EXPECT_GT(item->accessedOn(), created);

    auto firstAccess = item->accessedOn();
    std::this_thread::sleep_for(5ms);
    item->keepAlive();
    EXPECT_EQ(item->accessCount(), 2);
    EXPECT_GT(item->accessedOn(), firstAccess);
    EXPECT_EQ(item->createdOn(), created); // Never moves
}

TEST(CacheItemTest, ConcurrentKeepAliveCountsEveryAccess) {
    auto item = Item::create("key", 0ms, "value");
    const int threads = 8;
    const int perThread = 1000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&item]() {
            for (int i = 0; i < perThread; ++i) {
                item->keepAlive();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(item->accessCount(), threads * perThread);
    EXPECT_GE(item->accessedOn(), item->createdOn());
}

TEST(CacheItemTest, NotifyWithoutCallbackIsNoOp) {
    auto item = Item::create("key", 0ms, "value");
    EXPECT_NO_THROW(item->notifyAboutToExpire());
}

TEST(CacheItemTest, ExpiryCallbackReceivesKey) {
    auto item = Item::create("expiring", 0ms, "value");
    std::string seen;
    item->setAboutToExpireCallback([&seen](const std::string& key) { seen = key; });

    item->notifyAboutToExpire();
    EXPECT_EQ(seen, "expiring");
}

TEST(CacheItemTest, ReplacingExpiryCallbackUsesLatest) {
    auto item = Item::create("key", 0ms, "value");
    int first = 0;
    int second = 0;
    item->setAboutToExpireCallback([&first](const std::string&) { ++first; });
    item->setAboutToExpireCallback([&second](const std::string&) { ++second; });

    item->notifyAboutToExpire();
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(CacheItemTest, ExpiryCallbackCanReadImmutableFields) {
    auto item = Item::create("key", 100ms, "value");
    Item* raw = item.get();
    std::string seen;
    item->setAboutToExpireCallback([&seen, raw](const std::string&) {
        // Only lock-free accessors are safe while the item is being notified
        seen = raw->key() + "=" + raw->data();
        EXPECT_EQ(raw->lifeSpan(), 100ms);
        EXPECT_LE(raw->createdOn(), Item::Clock::now());
    });

    item->notifyAboutToExpire();
    EXPECT_EQ(seen, "key=value");
}
