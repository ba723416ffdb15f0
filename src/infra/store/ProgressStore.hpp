#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "IKeyValueStore.hpp"
#include "Transfer.hpp"

namespace ferry {

/**
 * @brief TransferRecord persistence on top of the key-value store.
 *
 * @details
 * Records live under `transfer/<id>` with the long audit retention TTL.
 * A record that reached Completed or Failed is never overwritten.
 * The ids of every requester are indexed under `index/requested_by/<user>`
 * in creation order, with the same TTL.
 * **Thread Safety:** Delegates to the store. Only the orchestrator thread
 * running a record writes it; index updates are serialized internally.
 */
class ProgressStore {
   public:
    ProgressStore(std::shared_ptr<IKeyValueStore> store, std::chrono::hours retention);

    /**
     * @brief Persists a snapshot of the record.
     * @return false if the stored record is already terminal (nothing written).
     * @throws FerryError(StoreUnavailable)
     */
    bool Save(const TransferRecord& record);

    std::optional<TransferRecord> Load(const std::string& id);

    /**
     * @brief Records requested by `requested_by`, newest first.
     * @details Expired or unreadable records are skipped. At most `limit` are returned.
     * @throws FerryError(StoreUnavailable)
     */
    std::vector<TransferRecord> History(const std::string& requested_by, std::size_t limit);

   private:
    static std::string Key(const std::string& id) { return "transfer/" + id; }
    static std::string IndexKey(const std::string& requested_by) {
        return "index/requested_by/" + requested_by;
    }

    std::vector<std::string> LoadIndex(const std::string& requested_by);
    void AddToIndex(const TransferRecord& record);

    std::shared_ptr<IKeyValueStore> store_;
    std::chrono::hours retention_;
    std::mutex index_mutex_;
};

}  // namespace ferry
