/**
 * @file test_embedding_store.cpp
 * @brief Unit tests for the in-memory embedding store
 */

#include <FaceGate/Embed/EmbeddingStore.h>
#include <FaceGate/Core/Exception.h>

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace FaceGate;
using namespace FaceGate::Embed;

TEST(MemoryEmbeddingStoreTest, PutAndGet) {
    MemoryEmbeddingStore store;
    EXPECT_FALSE(store.Get("alice").has_value());

    StoreReceipt receipt = store.Put("alice", {0.6f, 0.8f});
    EXPECT_EQ(receipt.userId, "alice");
    EXPECT_EQ(receipt.revision, 1u);
    EXPECT_EQ(receipt.createdAt, receipt.updatedAt);

    auto stored = store.Get("alice");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, (Match::Embedding{0.6f, 0.8f}));
    EXPECT_EQ(store.Size(), 1u);
}

TEST(MemoryEmbeddingStoreTest, ReplaceKeepsCreationTime) {
    MemoryEmbeddingStore store;
    StoreReceipt first = store.Put("alice", {1.0f, 0.0f});
    StoreReceipt second = store.Put("alice", {0.0f, 1.0f});

    EXPECT_EQ(second.revision, 2u);
    EXPECT_EQ(second.createdAt, first.createdAt);
    EXPECT_GE(second.updatedAt, first.updatedAt);
    EXPECT_EQ(*store.Get("alice"), (Match::Embedding{0.0f, 1.0f}));
    EXPECT_EQ(store.Size(), 1u);
}

TEST(MemoryEmbeddingStoreTest, Remove) {
    MemoryEmbeddingStore store;
    store.Put("bob", {1.0f});
    EXPECT_TRUE(store.Remove("bob"));
    EXPECT_FALSE(store.Remove("bob"));
    EXPECT_FALSE(store.Get("bob").has_value());

    // A later registration starts a new record
    EXPECT_EQ(store.Put("bob", {1.0f}).revision, 1u);
}

TEST(MemoryEmbeddingStoreTest, ListNewestFirst) {
    MemoryEmbeddingStore store;
    store.Put("carol", {1.0f});
    store.Put("alice", {1.0f});
    store.Put("bob", {1.0f});
    store.Put("carol", {2.0f});     // replace does not reorder

    std::vector<UserSummary> users = store.ListUsers();
    ASSERT_EQ(users.size(), 3u);
    EXPECT_EQ(users[0].userId, "bob");
    EXPECT_EQ(users[1].userId, "alice");
    EXPECT_EQ(users[2].userId, "carol");
}

TEST(MemoryEmbeddingStoreTest, RejectsEmptyInput) {
    MemoryEmbeddingStore store;
    EXPECT_THROW(store.Put("", {1.0f}), InvalidArgumentException);
    EXPECT_THROW(store.Put("alice", {}), InvalidArgumentException);
    EXPECT_EQ(store.Size(), 0u);
}

TEST(MemoryEmbeddingStoreTest, ConcurrentWriters) {
    MemoryEmbeddingStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 50; ++i) {
                store.Put("user" + std::to_string(t * 50 + i), {1.0f, 0.0f});
                store.Put("shared", {0.0f, 1.0f});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.Size(), 201u);
    EXPECT_EQ(store.Put("shared", {1.0f}).revision, 201u);
}
