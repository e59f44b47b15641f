#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "../src/db/List.hpp"
#include "../src/db/MemoryStore.hpp"
#include "../src/types/CacheErrors.hpp"

TEST(MemoryStoreTest, SetAndGetStringValue) {
    MemoryStore store;
    store.set("foo", "bar");

    auto out = store.get("foo");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ("bar", *out);
}

TEST(MemoryStoreTest, GetMissingKeyIsNullopt) {
    MemoryStore store;
    EXPECT_FALSE(store.get("missing").has_value());
    EXPECT_FALSE(store.exists("missing"));
}

TEST(MemoryStoreTest, IncrStartsFromZeroAndStoresDecimal) {
    MemoryStore store;
    EXPECT_EQ(1, store.incr("counter"));
    EXPECT_EQ(2, store.incr("counter"));
    EXPECT_EQ("2", store.get("counter").value());

    store.set("preset", "-5");
    EXPECT_EQ(-4, store.incr("preset"));
}

TEST(MemoryStoreTest, IncrRejectsNonInteger) {
    MemoryStore store;
    store.set("word", "abc");
    EXPECT_THROW(store.incr("word"), StoreError);

    store.set("padded", " 1");
    EXPECT_THROW(store.incr("padded"), StoreError);

    store.set("max", "9223372036854775807");
    EXPECT_THROW(store.incr("max"), StoreError);
}

TEST(MemoryStoreTest, WrongTypeOperationsFail) {
    MemoryStore store;
    store.rpush("list", "a");
    store.set("str", "a");

    EXPECT_THROW(store.get("list"), StoreError);
    EXPECT_THROW(store.incr("list"), StoreError);
    EXPECT_THROW(store.rpush("str", "b"), StoreError);
    EXPECT_THROW(store.lrange("str", 0, -1), StoreError);
}

TEST(MemoryStoreTest, SetOverwritesList) {
    MemoryStore store;
    store.rpush("key", "a");
    store.set("key", "value");
    EXPECT_EQ("value", store.get("key").value());
}

TEST(MemoryStoreTest, RpushReturnsLengthAndKeepsOrder) {
    MemoryStore store;
    EXPECT_EQ(1, store.rpush("numbers", "one"));
    EXPECT_EQ(2, store.rpush("numbers", "two"));
    EXPECT_EQ(3, store.rpush("numbers", "three"));

    auto items = store.lrange("numbers", 0, -1);
    ASSERT_EQ(3u, items.size());
    EXPECT_EQ("one", items[0]);
    EXPECT_EQ("two", items[1]);
    EXPECT_EQ("three", items[2]);
}

TEST(MemoryStoreTest, LrangeOnMissingKeyIsEmpty) {
    MemoryStore store;
    EXPECT_TRUE(store.lrange("nothing", 0, -1).empty());
}

TEST(MemoryStoreTest, FlushdbRemovesEverything) {
    MemoryStore store;
    store.set("a", "1");
    store.rpush("b", "x");
    ASSERT_EQ(2u, store.size());

    store.flushdb();
    EXPECT_EQ(0u, store.size());
    EXPECT_FALSE(store.exists("a"));
}

TEST(MemoryStoreTest, ClosedStoreRefusesCommands) {
    MemoryStore store;
    EXPECT_TRUE(store.connected());

    store.close();
    EXPECT_FALSE(store.connected());
    EXPECT_THROW(store.set("a", "1"), ConnectionError);
    EXPECT_THROW(store.get("a"), ConnectionError);
    EXPECT_THROW(store.flushdb(), ConnectionError);
}

TEST(MemoryStoreTest, ConcurrentIncrIsExact) {
    MemoryStore store;
    const int threads = 8;
    const int perThread = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&store] {
            for (int i = 0; i < perThread; i++)
                store.incr("hits");
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(std::to_string(threads * perThread), store.get("hits").value());
}

TEST(ListTest, PushBackAndRange) {
    List list;
    list.PushBack("one");
    list.PushBack("two");
    list.PushBack("three");

    auto elements = list.GetElementsInRange(0, 2);
    ASSERT_EQ(3u, elements.size());
    EXPECT_EQ("one", elements[0]);
    EXPECT_EQ("two", elements[1]);
    EXPECT_EQ("three", elements[2]);
}

TEST(ListTest, SupportsNegativeIndices) {
    List list;
    list.PushBack("a");
    list.PushBack("b");
    list.PushBack("c");
    list.PushBack("d");

    auto elements = list.GetElementsInRange(-3, -1);
    ASSERT_EQ(3u, elements.size());
    EXPECT_EQ("b", elements[0]);
    EXPECT_EQ("c", elements[1]);
    EXPECT_EQ("d", elements[2]);
}

TEST(ListTest, OutOfRangeIndicesAreClamped) {
    List list;
    list.PushBack("a");
    list.PushBack("b");

    EXPECT_EQ(2u, list.GetElementsInRange(-100, 100).size());
    EXPECT_TRUE(list.GetElementsInRange(5, 10).empty());
    EXPECT_TRUE(list.GetElementsInRange(1, 0).empty());
    EXPECT_TRUE(list.GetElementsInRange(0, -100).empty());
    EXPECT_TRUE(List().GetElementsInRange(0, -1).empty());
}
