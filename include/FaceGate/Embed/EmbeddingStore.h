#pragma once

/**
 * @file EmbeddingStore.h
 * @brief Embedding store contract and an in-memory implementation
 *
 * A store maps a user id to one embedding. Put inserts or replaces
 * (upsert); Get returns std::nullopt for unknown ids.
 */

#include <FaceGate/Match/MatchTypes.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace FaceGate::Embed {

using Clock = std::chrono::system_clock;

/**
 * @brief Result of storing an embedding
 */
struct StoreReceipt {
    std::string userId;
    Clock::time_point createdAt;    ///< First registration
    Clock::time_point updatedAt;    ///< This write
    uint64_t revision = 0;          ///< 1 on insert, incremented on each replace
};

/**
 * @brief Stored user without the embedding payload
 */
struct UserSummary {
    std::string userId;
    Clock::time_point createdAt;
    Clock::time_point updatedAt;
};

/**
 * @brief User id to embedding storage
 */
class EmbeddingStore {
public:
    virtual ~EmbeddingStore() = default;

    virtual std::optional<Match::Embedding> Get(const std::string& userId) const = 0;

    virtual StoreReceipt Put(const std::string& userId, const Match::Embedding& embedding) = 0;

    /// @return true if the user existed
    virtual bool Remove(const std::string& userId) = 0;

    /// Users ordered by creation time, newest first
    virtual std::vector<UserSummary> ListUsers() const = 0;
};

/**
 * @brief Thread-safe in-process store
 */
class MemoryEmbeddingStore : public EmbeddingStore {
public:
    std::optional<Match::Embedding> Get(const std::string& userId) const override;

    /// @throws InvalidArgumentException on an empty id or embedding
    StoreReceipt Put(const std::string& userId, const Match::Embedding& embedding) override;

    bool Remove(const std::string& userId) override;

    std::vector<UserSummary> ListUsers() const override;

    size_t Size() const;

private:
    struct Record {
        Match::Embedding embedding;
        Clock::time_point createdAt;
        Clock::time_point updatedAt;
        uint64_t revision = 0;
        uint64_t sequence = 0;      ///< Insert order, breaks createdAt ties
    };

    mutable std::mutex mutex_;
    std::map<std::string, Record> records_;
    uint64_t nextSequence_ = 0;
};

} // namespace FaceGate::Embed
