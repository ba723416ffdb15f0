#include "ProgressStore.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "TransferJson.hpp"

namespace ferry {

ProgressStore::ProgressStore(std::shared_ptr<IKeyValueStore> store, std::chrono::hours retention)
    : store_(std::move(store)), retention_(retention) {}

bool ProgressStore::Save(const TransferRecord& record) {
    auto existing = Load(record.id);
    if (existing && IsTerminal(existing->state)) {
        spdlog::warn("[{}] Record is {} and immutable; update to {} dropped", record.id,
                     ToString(existing->state), ToString(record.state));
        return false;
    }
    store_->Put(Key(record.id), json::serialize(json::value_from(record)),
                std::chrono::duration_cast<IKeyValueStore::ttl_type>(retention_));
    if (!existing) {
        AddToIndex(record);
    }
    return true;
}

std::optional<TransferRecord> ProgressStore::Load(const std::string& id) {
    auto raw = store_->Get(Key(id));
    if (!raw) return std::nullopt;
    try {
        return json::value_to<TransferRecord>(json::parse(*raw));
    } catch (const std::exception& e) {
        spdlog::error("[{}] Stored record is unreadable: {}", id, e.what());
        return std::nullopt;
    }
}

std::vector<TransferRecord> ProgressStore::History(const std::string& requested_by,
                                                   std::size_t limit) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        ids = LoadIndex(requested_by);
    }

    std::vector<TransferRecord> records;
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        if (auto record = Load(*it)) {
            records.push_back(std::move(*record));
        }
    }
    std::stable_sort(records.begin(), records.end(),
                     [](const TransferRecord& a, const TransferRecord& b) {
                         return a.started_at > b.started_at;
                     });
    if (records.size() > limit) {
        records.resize(limit);
    }
    return records;
}

std::vector<std::string> ProgressStore::LoadIndex(const std::string& requested_by) {
    std::vector<std::string> ids;
    auto raw = store_->Get(IndexKey(requested_by));
    if (!raw) return ids;
    try {
        ids = json::value_to<std::vector<std::string>>(json::parse(*raw));
    } catch (const std::exception& e) {
        spdlog::error("History index of '{}' is unreadable: {}", requested_by, e.what());
    }
    return ids;
}

void ProgressStore::AddToIndex(const TransferRecord& record) {
    if (record.plan.requested_by.empty()) return;

    std::lock_guard<std::mutex> lock(index_mutex_);
    auto ids = LoadIndex(record.plan.requested_by);
    // Drop ids whose records have expired so the index does not grow forever.
    std::erase_if(ids, [this](const std::string& id) { return !store_->Get(Key(id)); });
    ids.push_back(record.id);
    store_->Put(IndexKey(record.plan.requested_by), json::serialize(json::value_from(ids)),
                std::chrono::duration_cast<IKeyValueStore::ttl_type>(retention_));
}

}  // namespace ferry
