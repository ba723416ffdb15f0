#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ferry {

/**
 * @brief Contract for the key-value store with per-item expiration.
 *
 * @details
 * Shared by the session broker (session records, approval claims) and the
 * orchestrator (transfer records). Expired items behave exactly like absent
 * ones.
 * **Thread Safety:** Implementations must be safe under concurrent access;
 * ConsumeIfUnused must be atomic.
 * **Errors:** Backend failures surface as FerryError(StoreUnavailable).
 */
struct IKeyValueStore {
    using ttl_type = std::chrono::milliseconds;

    virtual ~IKeyValueStore() = default;

    virtual void Put(const std::string& key, const std::string& value, ttl_type ttl) = 0;
    virtual std::optional<std::string> Get(const std::string& key) = 0;
    virtual void Delete(const std::string& key) = 0;

    // Atomic check-and-set: marks `key` as used and returns true, unless it is
    // already present, in which case nothing changes and false is returned.
    virtual bool ConsumeIfUnused(const std::string& key, ttl_type ttl) = 0;
};

}  // namespace ferry
