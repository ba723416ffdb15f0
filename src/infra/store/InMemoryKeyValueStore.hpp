#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include "Clock.hpp"
#include "IKeyValueStore.hpp"

namespace ferry {

/**
 * @brief Process-local store with lazy expiry, driven by an injectable Clock.
 */
class InMemoryKeyValueStore final : public IKeyValueStore {
   public:
    explicit InMemoryKeyValueStore(std::shared_ptr<Clock> clock);

    void Put(const std::string& key, const std::string& value, ttl_type ttl) override;
    std::optional<std::string> Get(const std::string& key) override;
    void Delete(const std::string& key) override;
    bool ConsumeIfUnused(const std::string& key, ttl_type ttl) override;

    // Drops every expired item; returns how many were removed.
    std::size_t Purge();
    std::size_t size() const;

    InMemoryKeyValueStore(const InMemoryKeyValueStore&) = delete;
    InMemoryKeyValueStore& operator=(const InMemoryKeyValueStore&) = delete;

   private:
    struct Item {
        std::string value;
        Clock::time_point expires_at;
    };

    // Caller holds mutex_.
    bool LiveLocked(const std::string& key, Clock::time_point now);

    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Item> items_;
};

}  // namespace ferry
