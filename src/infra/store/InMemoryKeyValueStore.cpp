#include "InMemoryKeyValueStore.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ferry {

InMemoryKeyValueStore::InMemoryKeyValueStore(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("InMemoryKeyValueStore requires a clock");
    }
}

bool InMemoryKeyValueStore::LiveLocked(const std::string& key, Clock::time_point now) {
    auto it = items_.find(key);
    if (it == items_.end()) {
        return false;
    }
    if (now >= it->second.expires_at) {
        items_.erase(it);
        return false;
    }
    return true;
}

void InMemoryKeyValueStore::Put(const std::string& key, const std::string& value, ttl_type ttl) {
    const auto now = clock_->Now();
    std::lock_guard<std::mutex> lock(mutex_);
    items_[key] = Item{value, now + ttl};
}

std::optional<std::string> InMemoryKeyValueStore::Get(const std::string& key) {
    const auto now = clock_->Now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!LiveLocked(key, now)) {
        return std::nullopt;
    }
    return items_.at(key).value;
}

void InMemoryKeyValueStore::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.erase(key);
}

bool InMemoryKeyValueStore::ConsumeIfUnused(const std::string& key, ttl_type ttl) {
    const auto now = clock_->Now();
    std::lock_guard<std::mutex> lock(mutex_);
    if (LiveLocked(key, now)) {
        return false;
    }
    items_[key] = Item{"consumed", now + ttl};
    return true;
}

std::size_t InMemoryKeyValueStore::Purge() {
    const auto now = clock_->Now();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto removed = std::erase_if(items_, [now](const auto& kv) { return now >= kv.second.expires_at; });
    if (removed > 0) {
        spdlog::trace("Store purge removed {} expired item(s).", removed);
    }
    return removed;
}

std::size_t InMemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

}  // namespace ferry
