/**
 * @file MemoryEmbeddingStore.cpp
 * @brief In-memory embedding store
 */

#include <FaceGate/Embed/EmbeddingStore.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>

#include <algorithm>
#include <utility>

namespace FaceGate::Embed {

std::optional<Match::Embedding> MemoryEmbeddingStore::Get(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(userId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.embedding;
}

StoreReceipt MemoryEmbeddingStore::Put(const std::string& userId,
                                       const Match::Embedding& embedding) {
    if (userId.empty()) {
        throw InvalidArgumentException("User id must not be empty");
    }
    if (embedding.empty()) {
        throw InvalidArgumentException("Cannot store an empty embedding for user " + userId);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Clock::time_point now = Clock::now();

    auto it = records_.find(userId);
    if (it == records_.end()) {
        Record record;
        record.createdAt = now;
        record.sequence = nextSequence_++;
        it = records_.emplace(userId, std::move(record)).first;
    }

    Record& record = it->second;
    record.embedding = embedding;
    record.updatedAt = now;
    ++record.revision;

    Log::Get()->debug("Stored {}D embedding for user {} (revision {})",
                      embedding.size(), userId, record.revision);

    return StoreReceipt{userId, record.createdAt, record.updatedAt, record.revision};
}

bool MemoryEmbeddingStore::Remove(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(userId) > 0;
}

std::vector<UserSummary> MemoryEmbeddingStore::ListUsers() const {
    std::vector<std::pair<uint64_t, UserSummary>> ordered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ordered.reserve(records_.size());
        for (const auto& [userId, record] : records_) {
            ordered.push_back({record.sequence,
                               UserSummary{userId, record.createdAt, record.updatedAt}});
        }
    }

    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<UserSummary> users;
    users.reserve(ordered.size());
    for (auto& entry : ordered) {
        users.push_back(std::move(entry.second));
    }
    return users;
}

size_t MemoryEmbeddingStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace FaceGate::Embed
